#include <funcorch/orchestrator/location.hpp>

#include <funcorch/common/util.hpp>

#include <filesystem>

#include <fmt/format.h>

namespace funcorch::orchestrator {

  std::string RemoteFunctionLocation::blob_path() const
  {
    return fmt::format("{}/{}", container, blob);
  }

  std::string location_id(const FunctionLocation& location)
  {
    return std::visit(
        common::util::overloaded{
            [](const RemoteFunctionLocation& loc) {
              return fmt::format("{}/{}/{}", loc.account_name, loc.container, loc.blob);
            },
            [](const UrlFunctionLocation& loc) { return loc.invoke_url; },
            [](const LocalFunctionLocation& loc) { return fmt::format("local:{}", loc.path); }
        },
        location
    );
  }

  std::string location_shorter_name(const FunctionLocation& location)
  {
    return std::visit(
        common::util::overloaded{
            [](const RemoteFunctionLocation& loc) { return loc.blob; },
            [](const UrlFunctionLocation& loc) {
              // Last non-empty path segment, otherwise the authority.
              std::string_view url{loc.invoke_url};
              auto scheme = url.find("://");
              if (scheme != std::string_view::npos) {
                url.remove_prefix(scheme + 3);
              }
              while (!url.empty() && url.back() == '/') {
                url.remove_suffix(1);
              }
              auto pos = url.rfind('/');
              return std::string{pos == std::string_view::npos ? url : url.substr(pos + 1)};
            },
            [](const LocalFunctionLocation& loc) {
              return std::filesystem::path{loc.path}.filename().string();
            }
        },
        location
    );
  }

  std::string location_account(const FunctionLocation& location)
  {
    return std::visit(
        common::util::overloaded{
            [](const RemoteFunctionLocation& loc) { return loc.account_connection_string; },
            [](const UrlFunctionLocation& loc) { return loc.account_connection_string; },
            [](const LocalFunctionLocation&) { return std::string{}; }
        },
        location
    );
  }

  std::string location_grouping_key(const FunctionLocation& location)
  {
    return std::visit(
        common::util::overloaded{
            [](const RemoteFunctionLocation& loc) {
              return fmt::format("{}/{}", loc.account_name, loc.blob_path());
            },
            [](const UrlFunctionLocation& loc) { return loc.invoke_url; },
            [](const LocalFunctionLocation&) { return std::string{"other"}; }
        },
        location
    );
  }

} // namespace funcorch::orchestrator
