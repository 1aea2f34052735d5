#include <funcorch/orchestrator/heartbeat.hpp>

#include <funcorch/common/exceptions.hpp>

namespace funcorch::orchestrator::heartbeat {

  void HeartbeatTracker::touch(const std::string& assembly_full_name)
  {
    touch(assembly_full_name, std::chrono::system_clock::now());
  }

  void HeartbeatTracker::touch(const std::string& assembly_full_name, timestamp_t time)
  {
    if (assembly_full_name.empty()) {
      throw common::InvalidConfigurationError("Assembly name cannot be empty");
    }

    ConcurrentTable<timestamp_t>::rw_acc_t acc;
    _hosts.insert(acc, assembly_full_name);
    acc->second = time;
  }

  bool HeartbeatTracker::is_live(const std::string& assembly_full_name) const
  {
    return is_live(assembly_full_name, std::chrono::system_clock::now());
  }

  bool HeartbeatTracker::is_live(const std::string& assembly_full_name, timestamp_t now) const
  {
    auto last = ConcurrentTable<timestamp_t>::copy(_hosts, assembly_full_name);
    return last.has_value() && now < last.value() + _poll_interval;
  }

  std::optional<RunningHost> HeartbeatTracker::get(const std::string& assembly_full_name) const
  {
    auto last = ConcurrentTable<timestamp_t>::copy(_hosts, assembly_full_name);
    if (!last.has_value()) {
      return std::nullopt;
    }
    return RunningHost{assembly_full_name, last.value()};
  }

} // namespace funcorch::orchestrator::heartbeat
