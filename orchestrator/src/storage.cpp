#include <funcorch/orchestrator/storage.hpp>

#include <funcorch/common/exceptions.hpp>
#include <funcorch/common/util.hpp>
#include <funcorch/orchestrator/config.hpp>

#include <fmt/format.h>

namespace funcorch::orchestrator::storage {

  std::string Account::connection_string() const
  {
    if (development()) {
      return "UseDevelopmentStorage=true";
    }
    return fmt::format("DefaultEndpointsProtocol=https;AccountName={};AccountKey={}", name, key);
  }

  Account Account::parse(std::string_view connection_string)
  {
    Account account;

    while (!connection_string.empty()) {

      auto end = connection_string.find(';');
      std::string_view entry = connection_string.substr(0, end);
      connection_string.remove_prefix(
          end == std::string_view::npos ? connection_string.size() : end + 1
      );

      if (entry.empty()) {
        continue;
      }

      // Keys are base64 and can contain '='; split on the first one.
      auto sep = entry.find('=');
      if (sep == std::string_view::npos) {
        throw common::InvalidConfigurationError(
            fmt::format("Malformed connection string entry {}", entry)
        );
      }
      std::string_view key = entry.substr(0, sep);
      std::string_view value = entry.substr(sep + 1);

      if (common::util::iequals(key, "AccountName")) {
        account.name = value;
      } else if (common::util::iequals(key, "AccountKey")) {
        account.key = value;
      } else if (common::util::iequals(key, "UseDevelopmentStorage") &&
                 common::util::iequals(value, "true")) {
        return development_account();
      }
    }

    if (account.name.empty()) {
      throw common::InvalidConfigurationError("Connection string does not name an account");
    }

    return account;
  }

  Account Account::from_credentials(std::string name, std::string key)
  {
    // The development account is special: its key is well-known.
    if (name == DEVELOPMENT_ACCOUNT) {
      return development_account();
    }
    return Account{std::move(name), std::move(key)};
  }

  Account Account::development_account()
  {
    return Account{std::string{DEVELOPMENT_ACCOUNT}, ""};
  }

  std::string BlobPath::str() const
  {
    return prefix.empty() ? container : fmt::format("{}/{}", container, prefix);
  }

  BlobPath BlobPath::parse(std::string_view path)
  {
    while (!path.empty() && path.front() == '/') {
      path.remove_prefix(1);
    }

    auto sep = path.find('/');
    BlobPath result;
    result.container = path.substr(0, sep);
    if (sep != std::string_view::npos) {
      result.prefix = path.substr(sep + 1);
    }

    if (result.container.empty()) {
      throw common::InvalidConfigurationError("Blob path must name a container");
    }
    return result;
  }

  Type deserialize(std::string type)
  {
    if (type == "local") {
      return Type::LOCAL;
    }
    throw common::InvalidConfigurationError(fmt::format("Unknown storage type {}", type));
  }

  std::unique_ptr<BlobStorage> BlobStorage::construct(const config::Storage& cfg)
  {
    if (cfg.storage_type == Type::LOCAL) {
      return std::make_unique<LocalBlobStorage>(cfg.root);
    }
    return nullptr;
  }

  LocalBlobStorage::LocalBlobStorage(std::filesystem::path root) : _root(std::move(root))
  {
    _logger = common::util::create_logger("LocalBlobStorage");
  }

  std::filesystem::path
  LocalBlobStorage::_container_path(const Account& account, const std::string& container) const
  {
    // Names are single path components; anything else would escape the root.
    for (const auto& component : {account.name, container}) {
      if (component.empty() || component == "." || component == ".." ||
          component.find('/') != std::string::npos) {
        throw common::StorageError(fmt::format("Invalid storage name {}", component));
      }
    }
    return _root / account.name / container;
  }

  std::vector<BlobEntry> LocalBlobStorage::list_blobs(
      const Account& account, const BlobPath& path, std::chrono::steady_clock::time_point deadline
  )
  {
    auto container_path = _container_path(account, path.container);

    std::error_code ec;
    if (!std::filesystem::is_directory(container_path, ec)) {
      _logger->debug("Container {} does not exist", container_path.string());
      return {};
    }

    std::vector<BlobEntry> blobs;
    std::filesystem::recursive_directory_iterator iter{container_path, ec};
    for (; !ec && iter != std::filesystem::recursive_directory_iterator{}; iter.increment(ec)) {

      if (std::chrono::steady_clock::now() > deadline) {
        throw common::StorageError(
            fmt::format("Timed out while listing container {}", path.container)
        );
      }

      std::error_code entry_ec;
      if (!iter->is_regular_file(entry_ec)) {
        continue;
      }

      std::string name = iter->path().lexically_relative(container_path).generic_string();
      if (name.rfind(path.prefix, 0) != 0) {
        continue;
      }

      blobs.push_back(BlobEntry{std::move(name), iter->file_size(entry_ec)});
    }

    if (ec) {
      throw common::StorageError(
          fmt::format("Failed to list container {}, reason: {}", path.container, ec.message())
      );
    }

    return blobs;
  }

  std::filesystem::path LocalBlobStorage::fetch(
      const Account& account, const std::string& container, const std::string& blob
  )
  {
    if (blob.empty() || blob.find("..") != std::string::npos) {
      throw common::StorageError(fmt::format("Invalid blob name {}", blob));
    }

    auto blob_path = _container_path(account, container) / blob;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(blob_path, ec)) {
      throw common::ObjectDoesNotExist{fmt::format("{}/{}", container, blob)};
    }
    return blob_path;
  }

} // namespace funcorch::orchestrator::storage
