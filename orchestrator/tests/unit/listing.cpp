#include <funcorch/orchestrator/heartbeat.hpp>
#include <funcorch/orchestrator/listing.hpp>
#include <funcorch/orchestrator/registry.hpp>
#include <funcorch/orchestrator/scanner.hpp>

#include <gtest/gtest.h>

#include "mocks.hpp"

using namespace funcorch::orchestrator;

class ListingTest : public ::testing::Test {
protected:
  Registry registry;
  heartbeat::HeartbeatTracker heartbeats{std::chrono::milliseconds{60 * 1000}};
  storage::Account account{"acc", "key"};
  timestamp_t now = std::chrono::system_clock::now();
};

TEST_F(ListingTest, EmptyRegistry)
{
  auto list = listing::list_functions(registry, heartbeats);
  EXPECT_TRUE(list.groups.empty());
  EXPECT_FALSE(list.has_warning);
}

TEST_F(ListingTest, GroupByLocation)
{
  registry.register_function(scanner::Scanner::make_definition(account, "functions", "b.so", now));
  registry.register_function(scanner::Scanner::make_definition(account, "functions", "a.so", now));
  registry.register_function(url_function("http://localhost/retry", "retry"));

  FunctionDefinition local;
  local.location = LocalFunctionLocation{"/opt/libs/local.so"};
  local.assembly_full_name = "local";
  local.timestamp = now;
  registry.register_function(std::move(local));

  auto list = listing::list_functions(registry, heartbeats);

  ASSERT_EQ(list.groups.size(), 4);
  // Sorted by grouping key.
  EXPECT_EQ(list.groups[0].key, "acc/functions/a.so");
  EXPECT_EQ(list.groups[1].key, "acc/functions/b.so");
  EXPECT_EQ(list.groups[2].key, "http://localhost/retry");
  EXPECT_EQ(list.groups[3].key, "other");

  auto& model = list.groups[0].functions.at(0);
  EXPECT_EQ(model.id, "acc/functions/a.so");
  EXPECT_EQ(model.location_id, "acc/functions/a.so");
  EXPECT_EQ(model.location_name, "a.so");
  EXPECT_EQ(model.timestamp, now);

  EXPECT_EQ(list.groups[3].functions.at(0).location_name, "local.so");
}

TEST_F(ListingTest, HostAnnotation)
{
  registry.register_function(url_function("http://localhost/first", "first"));
  registry.register_function(url_function("http://localhost/second", "second"));

  heartbeats.touch("first");
  heartbeats.touch("second");

  auto list = listing::list_functions(registry, heartbeats);
  EXPECT_FALSE(list.has_warning);
  for (auto& group : list.groups) {
    for (auto& func : group.functions) {
      EXPECT_TRUE(func.host_is_running);
    }
  }

  // A stale heartbeat marks the function and raises the warning.
  heartbeats.touch("second", now - std::chrono::minutes{5});
  list = listing::list_functions(registry, heartbeats);
  EXPECT_TRUE(list.has_warning);

  ASSERT_EQ(list.groups.size(), 2);
  EXPECT_TRUE(list.groups[0].functions.at(0).host_is_running);
  EXPECT_FALSE(list.groups[1].functions.at(0).host_is_running);
}
