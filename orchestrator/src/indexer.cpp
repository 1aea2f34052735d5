#include <funcorch/orchestrator/indexer.hpp>

#include <funcorch/common/exceptions.hpp>
#include <funcorch/common/util.hpp>
#include <funcorch/function/context.hpp>
#include <funcorch/orchestrator/function.hpp>
#include <funcorch/orchestrator/registry.hpp>
#include <funcorch/orchestrator/scanner.hpp>

#include <filesystem>

#include <fmt/format.h>

namespace funcorch::orchestrator::indexer {

  Indexer::Indexer(Registry& registry, scanner::Scanner& scanner)
      : _registry(registry), _scanner(scanner)
  {
    _logger = common::util::create_logger("Indexer");
  }

  IndexResult Indexer::process(const IndexOperation& operation)
  {
    return std::visit(
        common::util::overloaded{
            [this](const RegisterCommand& cmd) { return _register(cmd); },
            [this](const RegisterUrlCommand& cmd) { return _register_url(cmd); },
            [this](const RegisterLibraryCommand& cmd) { return _register_library(cmd); },
            [this](const DeleteCommand& cmd) { return _delete(cmd); }
        },
        operation
    );
  }

  storage::Account Indexer::resolve_account(const std::string& account) const
  {
    if (account.empty()) {
      throw common::InvalidConfigurationError("Account cannot be empty");
    }

    // Connection strings always contain key=value pairs.
    if (account.find('=') != std::string::npos) {
      return storage::Account::parse(account);
    }

    auto connection_string = _registry.lookup_connection_string(account);
    if (connection_string.has_value()) {
      return storage::Account::parse(connection_string.value());
    }

    return storage::Account::from_credentials(account, "");
  }

  IndexResult Indexer::_register(const RegisterCommand& cmd)
  {
    IndexResult result;
    try {

      auto account = resolve_account(cmd.account);
      auto path = storage::BlobPath::parse(cmd.blob_path);

      _logger->info("Scanning {} in account {}", path.str(), account.name);
      result.count_scanned = _scanner.scan(account, path);

    } catch (common::InvalidConfigurationError& exc) {
      _logger->error("Rejected registration of {}, reason: {}", cmd.blob_path, exc.what());
      result.error = exc.what();
    }
    return result;
  }

  IndexResult Indexer::_register_url(const RegisterUrlCommand& cmd)
  {
    IndexResult result;

    if (cmd.url.rfind("http://", 0) != 0 && cmd.url.rfind("https://", 0) != 0) {
      result.error = fmt::format("Not an HTTP URL: {}", cmd.url);
      return result;
    }

    FunctionDefinition definition;
    definition.location = UrlFunctionLocation{cmd.url, cmd.account_connection_string};
    definition.description = cmd.url;
    definition.timestamp = std::chrono::system_clock::now();
    definition.assembly_full_name = location_shorter_name(definition.location);
    definition.max_retry_count = cmd.max_retry_count;

    bool inserted = _registry.register_function(std::move(definition));
    _logger->info("Registered URL function {}, new: {}", cmd.url, inserted);
    result.count_scanned = 1;
    return result;
  }

  IndexResult Indexer::_register_library(const RegisterLibraryCommand& cmd)
  {
    IndexResult result;

    std::filesystem::path path{cmd.path};
    std::error_code ec;
    if (!path.is_absolute() || !std::filesystem::is_regular_file(path, ec)) {
      result.error = fmt::format("Library {} does not exist", cmd.path);
      return result;
    }

    FunctionDefinition definition;
    definition.location = LocalFunctionLocation{cmd.path};
    definition.description = cmd.path;
    definition.timestamp = std::chrono::system_clock::now();
    definition.assembly_full_name = path.stem().string();
    definition.entry_point =
        cmd.entry_point.empty() ? std::string{function::Context::ENTRY_POINT} : cmd.entry_point;
    definition.max_retry_count = cmd.max_retry_count;

    bool inserted = _registry.register_function(std::move(definition));
    _logger->info("Registered library function {}, new: {}", cmd.path, inserted);
    result.count_scanned = 1;
    return result;
  }

  IndexResult Indexer::_delete(const DeleteCommand& cmd)
  {
    IndexResult result;
    result.deleted = _registry.remove(cmd.function_id);
    _logger->info("Delete function {}, removed: {}", cmd.function_id, result.deleted.value());
    return result;
  }

} // namespace funcorch::orchestrator::indexer
