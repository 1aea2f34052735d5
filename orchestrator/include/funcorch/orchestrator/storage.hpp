#ifndef FUNCORCH_ORCHESTRATOR_STORAGE_HPP
#define FUNCORCH_ORCHESTRATOR_STORAGE_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace funcorch::orchestrator::config {

  struct Storage;

} // namespace funcorch::orchestrator::config

namespace funcorch::orchestrator::storage {

  struct Account {

    static constexpr std::string_view DEVELOPMENT_ACCOUNT = "devstoreaccount1";

    std::string name;
    std::string key;

    bool development() const
    {
      return name == DEVELOPMENT_ACCOUNT;
    }

    bool has_key() const
    {
      return !key.empty() || development();
    }

    std::string connection_string() const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Parses a storage connection string, e.g.
    /// "DefaultEndpointsProtocol=https;AccountName=name;AccountKey=key" or
    /// "UseDevelopmentStorage=true".
    ///
    /// Throws InvalidConfigurationError when no account name can be found.
    ////////////////////////////////////////////////////////////////////////////////
    static Account parse(std::string_view connection_string);

    static Account from_credentials(std::string name, std::string key);

    static Account development_account();
  };

  // "container" or "container/blob-name-prefix"
  struct BlobPath {
    std::string container;
    std::string prefix;

    std::string str() const;

    static BlobPath parse(std::string_view path);
  };

  struct BlobEntry {
    std::string name;
    std::uintmax_t size{};
  };

  enum class Type { LOCAL };

  Type deserialize(std::string type);

  struct BlobStorage {

    BlobStorage() = default;
    BlobStorage(const BlobStorage&) = delete;
    BlobStorage(BlobStorage&&) = delete;
    BlobStorage& operator=(const BlobStorage&) = delete;
    BlobStorage& operator=(BlobStorage&&) = delete;
    virtual ~BlobStorage() = default;

    /**
     * @brief Enumerates blobs stored in a container whose names start with the path prefix.
     * A container that does not exist contains no blobs.
     *
     * @param account storage account
     * @param path container and blob prefix
     * @param deadline enumeration is abandoned with StorageError once it passes
     * @return blob entries
     */
    virtual std::vector<BlobEntry> list_blobs(
        const Account& account, const BlobPath& path,
        std::chrono::steady_clock::time_point deadline
    ) = 0;

    /**
     * @brief Makes the blob available on the local filesystem.
     *
     * @return path of the local copy
     */
    virtual std::filesystem::path
    fetch(const Account& account, const std::string& container, const std::string& blob) = 0;

    static std::unique_ptr<BlobStorage> construct(const config::Storage& cfg);
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Storage emulated on the local filesystem: <root>/<account>/<container>/<blob>.
  ////////////////////////////////////////////////////////////////////////////////
  class LocalBlobStorage : public BlobStorage {
  public:
    LocalBlobStorage(std::filesystem::path root);

    std::vector<BlobEntry> list_blobs(
        const Account& account, const BlobPath& path,
        std::chrono::steady_clock::time_point deadline
    ) override;

    std::filesystem::path
    fetch(const Account& account, const std::string& container, const std::string& blob) override;

    const std::filesystem::path& root() const
    {
      return _root;
    }

  private:
    std::filesystem::path _container_path(const Account& account, const std::string& container)
        const;

    std::filesystem::path _root;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace funcorch::orchestrator::storage

#endif
