#ifndef FUNCORCH_ORCHESTRATOR_LISTING_HPP
#define FUNCORCH_ORCHESTRATOR_LISTING_HPP

#include <funcorch/orchestrator/function.hpp>

#include <string>
#include <vector>

namespace funcorch::orchestrator {

  class Registry;

  namespace heartbeat {
    class HeartbeatTracker;
  } // namespace heartbeat

} // namespace funcorch::orchestrator

namespace funcorch::orchestrator::listing {

  struct FunctionModel {
    std::string id;
    timestamp_t timestamp;
    std::string description;
    std::string location_id;
    std::string location_name;
    bool host_is_running;
  };

  struct FunctionGroup {
    std::string key;
    std::vector<FunctionModel> functions;
  };

  struct FunctionList {
    // Sorted by grouping key.
    std::vector<FunctionGroup> groups;
    // Set when any function's host is not running.
    bool has_warning{};
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Lists registered functions grouped by location, each annotated with
  /// the liveness of the host running its assembly.
  ////////////////////////////////////////////////////////////////////////////////
  FunctionList
  list_functions(const Registry& registry, const heartbeat::HeartbeatTracker& heartbeats);

} // namespace funcorch::orchestrator::listing

#endif
