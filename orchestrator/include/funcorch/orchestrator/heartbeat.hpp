#ifndef FUNCORCH_ORCHESTRATOR_HEARTBEAT_HPP
#define FUNCORCH_ORCHESTRATOR_HEARTBEAT_HPP

#include <funcorch/orchestrator/concurrent_table.hpp>
#include <funcorch/orchestrator/function.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace funcorch::orchestrator::heartbeat {

  struct RunningHost {
    std::string assembly_full_name;
    timestamp_t last_heartbeat;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Last heartbeat of every host, keyed by the assembly it executes.
  ///
  /// Hosts report periodically; a host is live while its last heartbeat is younger
  /// than the poll interval. Records are independent of each other.
  ////////////////////////////////////////////////////////////////////////////////
  class HeartbeatTracker {
  public:
    HeartbeatTracker(std::chrono::milliseconds poll_interval) : _poll_interval(poll_interval) {}

    HeartbeatTracker(const HeartbeatTracker&) = delete;
    HeartbeatTracker& operator=(const HeartbeatTracker&) = delete;

    void touch(const std::string& assembly_full_name);

    void touch(const std::string& assembly_full_name, timestamp_t time);

    bool is_live(const std::string& assembly_full_name) const;

    // True iff a heartbeat exists and now < last heartbeat + poll interval.
    bool is_live(const std::string& assembly_full_name, timestamp_t now) const;

    std::optional<RunningHost> get(const std::string& assembly_full_name) const;

    std::chrono::milliseconds poll_interval() const
    {
      return _poll_interval;
    }

  private:
    const std::chrono::milliseconds _poll_interval;

    ConcurrentTable<timestamp_t>::table_t _hosts;
  };

} // namespace funcorch::orchestrator::heartbeat

#endif
