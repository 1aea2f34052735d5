#include <funcorch/orchestrator/registry.hpp>

#include <funcorch/common/exceptions.hpp>
#include <funcorch/common/util.hpp>
#include <funcorch/orchestrator/storage.hpp>

namespace funcorch::orchestrator {

  bool Registry::register_function(FunctionDefinition&& definition)
  {
    std::string id = definition.id();
    if (id.empty()) {
      throw common::InvalidConfigurationError("Function location cannot be empty");
    }

    write_lock_t lock(_mutex);

    auto iter = _functions.find(id);
    if (iter != _functions.end()) {
      iter->second.timestamp = definition.timestamp;
      return false;
    }

    _functions.emplace(std::move(id), std::move(definition));
    return true;
  }

  bool Registry::remove(const std::string& id)
  {
    write_lock_t lock(_mutex);
    return _functions.erase(id) > 0;
  }

  std::optional<FunctionDefinition> Registry::get(const std::string& id) const
  {
    read_lock_t lock(_mutex);

    auto iter = _functions.find(id);
    if (iter == _functions.end()) {
      return std::nullopt;
    }
    return iter->second;
  }

  bool Registry::contains(const std::string& id) const
  {
    read_lock_t lock(_mutex);
    return _functions.find(id) != _functions.end();
  }

  std::vector<FunctionDefinition> Registry::read_all() const
  {
    read_lock_t lock(_mutex);

    std::vector<FunctionDefinition> results;
    results.reserve(_functions.size());
    for (const auto& [id, func] : _functions) {
      results.push_back(func);
    }
    return results;
  }

  std::optional<std::string>
  Registry::lookup_connection_string(const std::string& account_name) const
  {
    read_lock_t lock(_mutex);

    for (const auto& [id, func] : _functions) {

      std::string connection_string = location_account(func.location);
      if (connection_string.empty()) {
        continue;
      }

      try {
        auto account = storage::Account::parse(connection_string);
        if (common::util::iequals(account.name, account_name)) {
          return connection_string;
        }
      } catch (common::InvalidConfigurationError&) {
        // Unparsable strings cannot match any account.
        continue;
      }
    }

    return std::nullopt;
  }

  size_t Registry::size() const
  {
    read_lock_t lock(_mutex);
    return _functions.size();
  }

} // namespace funcorch::orchestrator
