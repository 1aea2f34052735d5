#include <funcorch/orchestrator/attempts.hpp>

#include <funcorch/common/exceptions.hpp>

namespace funcorch::orchestrator::attempts {

  std::optional<int> AttemptTable::begin(const std::string& invocation_id, bool reset)
  {
    if (invocation_id.empty()) {
      throw common::InvalidConfigurationError("Invocation id cannot be empty");
    }

    // Inserts a zeroed entry when the id is new.
    ConcurrentTable<Entry>::rw_acc_t acc;
    _attempts.insert(acc, invocation_id);

    if (acc->second.active) {
      return std::nullopt;
    }

    acc->second.active = true;
    if (reset) {
      acc->second.attempt = 0;
    }
    return acc->second.attempt;
  }

  int AttemptTable::advance(const std::string& invocation_id)
  {
    ConcurrentTable<Entry>::rw_acc_t acc;
    if (!_attempts.find(acc, invocation_id)) {
      throw common::ObjectDoesNotExist{invocation_id};
    }
    return ++acc->second.attempt;
  }

  void AttemptTable::finish(const std::string& invocation_id)
  {
    ConcurrentTable<Entry>::rw_acc_t acc;
    if (_attempts.find(acc, invocation_id)) {
      acc->second.active = false;
    }
  }

  void AttemptTable::clear(const std::string& invocation_id)
  {
    _attempts.erase(invocation_id);
  }

  std::optional<int> AttemptTable::current(const std::string& invocation_id) const
  {
    auto entry = ConcurrentTable<Entry>::copy(_attempts, invocation_id);
    if (!entry.has_value()) {
      return std::nullopt;
    }
    return entry->attempt;
  }

  bool AttemptTable::active(const std::string& invocation_id) const
  {
    auto entry = ConcurrentTable<Entry>::copy(_attempts, invocation_id);
    return entry.has_value() && entry->active;
  }

  size_t AttemptTable::size() const
  {
    return _attempts.size();
  }

} // namespace funcorch::orchestrator::attempts
