#ifndef FUNCORCH_ORCHESTRATOR_FUNCTION_HPP
#define FUNCORCH_ORCHESTRATOR_FUNCTION_HPP

#include <funcorch/orchestrator/location.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace funcorch::orchestrator {

  using timestamp_t = std::chrono::system_clock::time_point;

  struct FunctionDefinition {

    FunctionLocation location;

    std::string description;

    // Creation time, refreshed on every re-scan.
    timestamp_t timestamp;

    // Identity of the host assembly; joins the definition with its heartbeats.
    std::string assembly_full_name;

    // Exported symbol of function libraries.
    std::string entry_point;

    // Retry bound declared by the function itself, if any.
    std::optional<int> max_retry_count;

    std::string id() const
    {
      return location_id(location);
    }
  };

} // namespace funcorch::orchestrator

#endif
