#include <funcorch/orchestrator/scanner.hpp>

#include <funcorch/common/exceptions.hpp>
#include <funcorch/common/util.hpp>
#include <funcorch/function/context.hpp>
#include <funcorch/orchestrator/registry.hpp>

#include <filesystem>

#include <fmt/format.h>

namespace funcorch::orchestrator::scanner {

  Scanner::Scanner(
      storage::BlobStorage& storage, Registry& registry, std::chrono::milliseconds timeout
  )
      : _storage(storage), _registry(registry), _timeout(timeout)
  {
    _logger = common::util::create_logger("Scanner");
  }

  FunctionDefinition Scanner::make_definition(
      const storage::Account& account, const std::string& container, const std::string& blob,
      timestamp_t timestamp
  )
  {
    FunctionDefinition definition;
    definition.location = RemoteFunctionLocation{
        account.connection_string(), account.name, container, blob};
    definition.description = fmt::format("{}/{}/{}", account.name, container, blob);
    definition.timestamp = timestamp;
    // The library name identifies the host assembly, e.g. lib/retry.so -> retry
    definition.assembly_full_name = std::filesystem::path{blob}.stem().string();
    definition.entry_point = function::Context::ENTRY_POINT;
    return definition;
  }

  int Scanner::scan(const storage::Account& account, const storage::BlobPath& path)
  {
    auto deadline = std::chrono::steady_clock::now() + _timeout;

    std::vector<storage::BlobEntry> blobs;
    try {
      blobs = _storage.list_blobs(account, path, deadline);
    } catch (common::StorageError& exc) {
      _logger->warn("Failed to scan {} in {}, reason: {}", path.str(), account.name, exc.what());
      return 0;
    }

    auto now = std::chrono::system_clock::now();
    int registered = 0;
    for (const auto& blob : blobs) {
      if (_registry.register_function(make_definition(account, path.container, blob.name, now))) {
        ++registered;
      }
    }

    _logger->info(
        "Scanned {} blobs in {}/{}, registered {} new functions", blobs.size(), account.name,
        path.str(), registered
    );

    return static_cast<int>(blobs.size());
  }

} // namespace funcorch::orchestrator::scanner
