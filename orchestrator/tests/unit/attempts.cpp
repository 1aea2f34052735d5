#include <funcorch/common/exceptions.hpp>
#include <funcorch/orchestrator/attempts.hpp>

#include <gtest/gtest.h>

using namespace funcorch::orchestrator;

TEST(AttemptTable, BeginAndAdvance)
{
  attempts::AttemptTable table;

  auto tracked = table.begin("id", false);
  ASSERT_TRUE(tracked.has_value());
  EXPECT_EQ(tracked.value(), 0);
  EXPECT_TRUE(table.active("id"));

  EXPECT_EQ(table.advance("id"), 1);
  EXPECT_EQ(table.advance("id"), 2);
  EXPECT_EQ(table.current("id"), 2);

  table.finish("id");
  EXPECT_FALSE(table.active("id"));
  // The counter survives the end of the invocation.
  EXPECT_EQ(table.current("id"), 2);
}

TEST(AttemptTable, CarryOverAndReset)
{
  attempts::AttemptTable table;

  table.begin("id", false);
  table.advance("id");
  table.finish("id");

  auto tracked = table.begin("id", false);
  ASSERT_TRUE(tracked.has_value());
  EXPECT_EQ(tracked.value(), 1);
  table.finish("id");

  tracked = table.begin("id", true);
  ASSERT_TRUE(tracked.has_value());
  EXPECT_EQ(tracked.value(), 0);
  table.finish("id");
}

TEST(AttemptTable, OverlappingInvocations)
{
  attempts::AttemptTable table;

  ASSERT_TRUE(table.begin("id", false).has_value());
  EXPECT_FALSE(table.begin("id", false).has_value());
  EXPECT_FALSE(table.begin("id", true).has_value());

  // Other ids are independent.
  EXPECT_TRUE(table.begin("other", false).has_value());
  EXPECT_EQ(table.size(), 2);
}

TEST(AttemptTable, Clear)
{
  attempts::AttemptTable table;

  table.begin("id", false);
  table.advance("id");
  table.clear("id");

  EXPECT_FALSE(table.current("id").has_value());
  EXPECT_FALSE(table.active("id"));
  EXPECT_THROW(table.advance("id"), funcorch::common::ObjectDoesNotExist);
  EXPECT_EQ(table.size(), 0);
}

TEST(AttemptTable, EmptyId)
{
  attempts::AttemptTable table;
  EXPECT_THROW(table.begin("", false), funcorch::common::InvalidConfigurationError);
}
