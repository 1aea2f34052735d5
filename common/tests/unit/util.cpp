#include <funcorch/common/exceptions.hpp>
#include <funcorch/common/util.hpp>

#include <sstream>
#include <variant>

#include <cereal/archives/json.hpp>
#include <gtest/gtest.h>

using namespace funcorch::common;

TEST(Util, CaseInsensitiveComparison)
{
  EXPECT_TRUE(util::iequals("AccountName", "accountname"));
  EXPECT_TRUE(util::iequals("", ""));
  EXPECT_FALSE(util::iequals("account", "accounts"));
  EXPECT_FALSE(util::iequals("abc", "abd"));
}

TEST(Util, OverloadedVisitor)
{
  std::variant<int, std::string> value{42};

  auto visitor = util::overloaded{
      [](int) { return std::string{"int"}; }, [](const std::string&) { return std::string{"str"}; }
  };
  EXPECT_EQ(std::visit(visitor, value), "int");

  value = "text";
  EXPECT_EQ(std::visit(visitor, value), "str");
}

struct Section {
  int value = 1;

  void load(cereal::JSONInputArchive& archive)
  {
    archive(CEREAL_NVP(value));
  }

  void set_defaults()
  {
    value = 1;
  }
};

TEST(Util, CerealLoadOptional)
{
  {
    std::stringstream stream{R"({"section": {"value": 5}})"};
    cereal::JSONInputArchive archive{stream};
    Section section;
    util::cereal_load_optional(archive, "section", section);
    EXPECT_EQ(section.value, 5);
  }

  {
    std::stringstream stream{R"({"other": {"value": 5}})"};
    cereal::JSONInputArchive archive{stream};
    Section section;
    util::cereal_load_optional(archive, "section", section);
    EXPECT_EQ(section.value, 1);
  }

  {
    std::stringstream stream{R"({"section": {"wrong": 5}})"};
    cereal::JSONInputArchive archive{stream};
    Section section;
    EXPECT_THROW(
        util::cereal_load_optional(archive, "section", section), InvalidConfigurationError
    );
  }
}
