#pragma once
#include <optional>
#include <vector>

#include "lsim/actions.hpp"
#include "lsim/location_graph.hpp"
#include "lsim/world_state.hpp"

namespace lsim {

struct PerceivedNode {
  WorldNode node{};
  std::optional<ObjectInstance> object{};  // set for object nodes

  bool operator==(const PerceivedNode&) const = default;
};

// What one agent sees at the start of a tick: its current location node followed
// by that location's immediate children (objects, co-located agents, sub-areas).
// Agents in transit perceive the intermediate node they occupy.
struct PerceptionSlice {
  Tick tick{};
  AgentId agent_id{};
  NodeId location_id{};
  bool in_transit{false};
  std::vector<PerceivedNode> nodes{};

  std::vector<NodeId> visible_ids() const;
  std::vector<const PerceivedNode*> of_kind(NodeKind kind) const;

  bool operator==(const PerceptionSlice&) const = default;
};

PerceptionSlice perceive(const CanonicalWorldState& state, const AgentId& agent, Tick tick);

// MOVE: locations reachable from the current one; INTERACT: objects in the
// current area; SAY: other agents in the current area. All empty while in transit.
ValidTargets compute_valid_targets(const CanonicalWorldState& state, const LocationGraph& graph,
                                   const AgentId& agent);

} // namespace lsim
