#ifndef FUNCORCH_ORCHESTRATOR_SCANNER_HPP
#define FUNCORCH_ORCHESTRATOR_SCANNER_HPP

#include <funcorch/orchestrator/function.hpp>
#include <funcorch/orchestrator/storage.hpp>

#include <chrono>
#include <memory>

#include <spdlog/spdlog.h>

namespace funcorch::orchestrator {

  class Registry;

} // namespace funcorch::orchestrator

namespace funcorch::orchestrator::scanner {

  class Scanner {
  public:
    Scanner(storage::BlobStorage& storage, Registry& registry, std::chrono::milliseconds timeout);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Discovers function libraries stored under a container path.
    ///
    /// Blobs not yet known are registered; known ones have their timestamp
    /// refreshed. Discovery is best-effort: a missing container, a storage failure
    /// or a timeout is reported as zero scanned entries.
    ///
    /// @param[in] account storage account
    /// @param[in] path container and optional blob name prefix
    /// @return number of blobs examined, including already registered ones
    ////////////////////////////////////////////////////////////////////////////////
    int scan(const storage::Account& account, const storage::BlobPath& path);

    static FunctionDefinition make_definition(
        const storage::Account& account, const std::string& container, const std::string& blob,
        timestamp_t timestamp
    );

  private:
    storage::BlobStorage& _storage;

    Registry& _registry;

    std::chrono::milliseconds _timeout;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace funcorch::orchestrator::scanner

#endif
