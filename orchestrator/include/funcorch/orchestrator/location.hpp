#ifndef FUNCORCH_ORCHESTRATOR_LOCATION_HPP
#define FUNCORCH_ORCHESTRATOR_LOCATION_HPP

#include <string>
#include <variant>

namespace funcorch::orchestrator {

  // Function library stored as a blob in a storage container.
  struct RemoteFunctionLocation {
    std::string account_connection_string;
    std::string account_name;
    std::string container;
    std::string blob;

    // Blob address within the account: <container>/<blob>
    std::string blob_path() const;
  };

  // Function invoked by sending an HTTP request.
  struct UrlFunctionLocation {
    std::string invoke_url;
    std::string account_connection_string;
  };

  // Function library on the local disk of the orchestrator.
  struct LocalFunctionLocation {
    std::string path;
  };

  using FunctionLocation =
      std::variant<RemoteFunctionLocation, UrlFunctionLocation, LocalFunctionLocation>;

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Stable identifier, unique within a registry.
  ///
  /// Remote: <account>/<container>/<blob>, URL: the invoke URL, local: local:<path>.
  ////////////////////////////////////////////////////////////////////////////////
  std::string location_id(const FunctionLocation& location);

  std::string location_shorter_name(const FunctionLocation& location);

  // Empty for locations not bound to a storage account.
  std::string location_account(const FunctionLocation& location);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Key used to group functions in listings: the blob address for remote
  /// functions, the invoke URL for URL functions, "other" for everything else.
  ////////////////////////////////////////////////////////////////////////////////
  std::string location_grouping_key(const FunctionLocation& location);

} // namespace funcorch::orchestrator

#endif
