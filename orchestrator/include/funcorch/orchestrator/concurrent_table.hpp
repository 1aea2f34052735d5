#ifndef FUNCORCH_ORCHESTRATOR_CONCURRENT_TABLE_HPP
#define FUNCORCH_ORCHESTRATOR_CONCURRENT_TABLE_HPP

#include <optional>
#include <string>

#include <tbb/concurrent_hash_map.h>

namespace funcorch::orchestrator {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Per-key records with record-level locking, keyed by string ids.
  ///
  /// Used where records are independent of each other and never iterated:
  /// heartbeats per assembly, attempt counters per invocation id.
  ////////////////////////////////////////////////////////////////////////////////
  template <typename Value, typename Key = std::string>
  struct ConcurrentTable {

    using table_t = oneapi::tbb::concurrent_hash_map<Key, Value>;

    // Write lock on a single record, held as long as the accessor lives.
    using rw_acc_t = typename table_t::accessor;

    // Read lock on a single record.
    using ro_acc_t = typename table_t::const_accessor;

    // Copy of a record, taken under its read lock.
    static std::optional<Value> copy(const table_t& table, const Key& key)
    {
      ro_acc_t acc;
      if (!table.find(acc, key)) {
        return std::nullopt;
      }
      return acc->second;
    }
  };

} // namespace funcorch::orchestrator

#endif
