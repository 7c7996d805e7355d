#pragma once
#include <cstdint>
#include <optional>

#include "lsim/events.hpp"
#include "lsim/location_graph.hpp"
#include "lsim/world_state.hpp"

namespace lsim {

struct TransitConfig {
  int64_t ticks_per_edge{1};  // uniform edge cost
};

// STATIONARY <-> IN_TRANSIT for agents on the location graph. Operates on the
// scheduler's working copy; the graph must outlive the machine.
class TransitMachine {
public:
  TransitMachine(const LocationGraph& graph, TransitConfig cfg);

  // Starts travel towards `to`. Refused (false) while already in transit, when
  // `to` is the current location, or when no path exists.
  bool begin(CanonicalWorldState& state, const AgentId& agent, const NodeId& to) const;

  // One tick of travel. The agent's location (and tree parent) changes when an
  // edge completes; on arrival the transit state is cleared and a MoveEvent from
  // the travel origin to the destination is returned.
  std::optional<MoveEvent> advance(CanonicalWorldState& state, const AgentId& agent) const;

  const TransitConfig& config() const noexcept { return cfg_; }

private:
  const LocationGraph& graph_;
  TransitConfig cfg_{};
};

} // namespace lsim
