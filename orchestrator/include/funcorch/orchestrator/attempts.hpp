#ifndef FUNCORCH_ORCHESTRATOR_ATTEMPTS_HPP
#define FUNCORCH_ORCHESTRATOR_ATTEMPTS_HPP

#include <funcorch/orchestrator/concurrent_table.hpp>

#include <optional>
#include <string>

namespace funcorch::orchestrator::attempts {

  // Retry state presented to a function body.
  struct RetryContext {
    // Zero-based index of the current attempt.
    int retry_count;
    int max_retry_count;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Attempt counters of logical invocations, keyed by invocation id.
  ///
  /// A counter survives the end of its invocation and carries over to the next
  /// invocation with the same id, unless that invocation requests a reset.
  /// At most one invocation per id can be active at a time.
  ////////////////////////////////////////////////////////////////////////////////
  class AttemptTable {
  public:
    AttemptTable() = default;

    AttemptTable(const AttemptTable&) = delete;
    AttemptTable& operator=(const AttemptTable&) = delete;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Activates the invocation, creating its counter at zero when needed.
    ///
    /// @param[in] invocation_id logical invocation id
    /// @param[in] reset force the counter back to zero
    /// @return tracked attempt counter; nullopt if the invocation is already active
    ////////////////////////////////////////////////////////////////////////////////
    std::optional<int> begin(const std::string& invocation_id, bool reset);

    // Increments the counter and returns its new value.
    int advance(const std::string& invocation_id);

    // Deactivates the invocation and keeps the counter.
    void finish(const std::string& invocation_id);

    // Drops the counter entirely.
    void clear(const std::string& invocation_id);

    std::optional<int> current(const std::string& invocation_id) const;

    bool active(const std::string& invocation_id) const;

    size_t size() const;

  private:
    struct Entry {
      int attempt{};
      bool active{};
    };

    ConcurrentTable<Entry>::table_t _attempts;
  };

} // namespace funcorch::orchestrator::attempts

#endif
