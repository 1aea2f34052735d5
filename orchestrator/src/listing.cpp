#include <funcorch/orchestrator/listing.hpp>

#include <funcorch/orchestrator/heartbeat.hpp>
#include <funcorch/orchestrator/registry.hpp>

#include <algorithm>
#include <map>

namespace funcorch::orchestrator::listing {

  FunctionList
  list_functions(const Registry& registry, const heartbeat::HeartbeatTracker& heartbeats)
  {
    std::map<std::string, std::vector<FunctionModel>> groups;

    // One clock reading for the entire listing.
    auto now = std::chrono::system_clock::now();
    for (const auto& func : registry.read_all()) {
      groups[location_grouping_key(func.location)].push_back(FunctionModel{
          func.id(), func.timestamp, func.description, location_id(func.location),
          location_shorter_name(func.location),
          heartbeats.is_live(func.assembly_full_name, now)});
    }

    FunctionList result;
    for (auto& [key, functions] : groups) {

      std::sort(functions.begin(), functions.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.id < rhs.id;
      });
      result.has_warning |= std::any_of(functions.begin(), functions.end(), [](const auto& f) {
        return !f.host_is_running;
      });

      result.groups.push_back(FunctionGroup{key, std::move(functions)});
    }

    return result;
  }

} // namespace funcorch::orchestrator::listing
