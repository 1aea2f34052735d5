#ifndef FUNCORCH_ORCHESTRATOR_INDEXER_HPP
#define FUNCORCH_ORCHESTRATOR_INDEXER_HPP

#include <funcorch/orchestrator/storage.hpp>

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <spdlog/spdlog.h>

namespace funcorch::orchestrator {

  class Registry;

  namespace scanner {
    class Scanner;
  } // namespace scanner

} // namespace funcorch::orchestrator

namespace funcorch::orchestrator::indexer {

  // Scan a container path and register the functions found there.
  struct RegisterCommand {
    // Full connection string, or a bare account name.
    std::string account;
    std::string blob_path;
  };

  // Register a single function invoked through its URL.
  struct RegisterUrlCommand {
    std::string url;
    std::string account_connection_string;
    std::optional<int> max_retry_count;
  };

  // Register a function library available on the local disk.
  struct RegisterLibraryCommand {
    std::string path;
    std::string entry_point;
    std::optional<int> max_retry_count;
  };

  struct DeleteCommand {
    std::string function_id;
  };

  using IndexOperation =
      std::variant<RegisterCommand, RegisterUrlCommand, RegisterLibraryCommand, DeleteCommand>;

  struct IndexResult {
    std::optional<int> count_scanned;
    std::optional<bool> deleted;
    std::optional<std::string> error;
  };

  class Indexer {
  public:
    Indexer(Registry& registry, scanner::Scanner& scanner);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Executes a registration or deletion command.
    ///
    /// Invalid input is reported in the result's error field; nothing is
    /// registered in that case.
    ////////////////////////////////////////////////////////////////////////////////
    IndexResult process(const IndexOperation& operation);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Resolves the storage account of a register command.
    ///
    /// A full connection string is parsed. For a bare account name, the key is
    /// looked up among the accounts of registered functions; the development
    /// account needs no key; other accounts are used without a key.
    ////////////////////////////////////////////////////////////////////////////////
    storage::Account resolve_account(const std::string& account) const;

  private:
    IndexResult _register(const RegisterCommand& cmd);
    IndexResult _register_url(const RegisterUrlCommand& cmd);
    IndexResult _register_library(const RegisterLibraryCommand& cmd);
    IndexResult _delete(const DeleteCommand& cmd);

    Registry& _registry;

    scanner::Scanner& _scanner;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace funcorch::orchestrator::indexer

#endif
