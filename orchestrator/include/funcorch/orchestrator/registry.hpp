#ifndef FUNCORCH_ORCHESTRATOR_REGISTRY_HPP
#define FUNCORCH_ORCHESTRATOR_REGISTRY_HPP

#include <funcorch/orchestrator/function.hpp>

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace funcorch::orchestrator {

  class Registry {
  public:
    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Inserts a function definition, keyed by its location identifier.
    /// When the location is already registered, only its timestamp is refreshed.
    ///
    /// @param[in] definition function definition
    /// @return true if a new definition was inserted
    ////////////////////////////////////////////////////////////////////////////////
    bool register_function(FunctionDefinition&& definition);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Removes a function definition.
    ///
    /// @param[in] id location identifier
    /// @return false if no such function was registered
    ////////////////////////////////////////////////////////////////////////////////
    bool remove(const std::string& id);

    std::optional<FunctionDefinition> get(const std::string& id) const;

    bool contains(const std::string& id) const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Returns a snapshot of all definitions, in no particular order.
    ////////////////////////////////////////////////////////////////////////////////
    std::vector<FunctionDefinition> read_all() const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Finds the connection string, key included, of an account that owns
    /// any registered function. Account names are compared case-insensitively.
    ///
    /// @param[in] account_name storage account name
    /// @return connection string; nullopt if no registered function uses the account
    ////////////////////////////////////////////////////////////////////////////////
    std::optional<std::string> lookup_connection_string(const std::string& account_name) const;

    size_t size() const;

  private:
    using lock_t = std::shared_mutex;
    using write_lock_t = std::unique_lock<lock_t>;
    using read_lock_t = std::shared_lock<lock_t>;

    // We need to be able to iterate across all functions.
    // Thus, we apply a read lock over the collection instead of using a concurrent map.
    mutable lock_t _mutex;
    std::unordered_map<std::string, FunctionDefinition> _functions;
  };

} // namespace funcorch::orchestrator

#endif
