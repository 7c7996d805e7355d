#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "lsim/types.hpp"
#include "lsim/world_tree.hpp"

namespace lsim {

// IN_TRANSIT payload; absence means STATIONARY.
struct TransitState {
  NodeId origin{};
  std::vector<NodeId> path{};  // excludes origin, ends at the destination
  int64_t remaining_edges{0};
  int64_t edge_progress{0};    // ticks already spent on the current edge

  const NodeId& destination() const { return path.back(); }
  const NodeId& next_node() const { return path[path.size() - static_cast<std::size_t>(remaining_edges)]; }

  bool operator==(const TransitState&) const = default;
};

struct AgentRuntime {
  AgentId id{};
  std::string name{};
  NodeId location_id{};                  // always an area node
  std::optional<TransitState> transit{};
  std::string goal{};                    // standing goal, part of the retrieval query

  bool in_transit() const noexcept { return transit.has_value(); }

  bool operator==(const AgentRuntime&) const = default;
};

struct ObjectInstance {
  std::string type{};
  Attributes state{};

  bool operator==(const ObjectInstance&) const = default;
};

struct DynamicsState {
  std::string weather{"clear"};
  int64_t hour{0};          // hour of the simulated day
  int64_t day{0};
  uint64_t rng_state{0};    // splitmix64 state, advanced once per tick

  bool operator==(const DynamicsState&) const = default;
};

// Ground truth. Exclusively mutated by the scheduler (through a working copy).
struct CanonicalWorldState {
  WorldTree tree{};
  std::map<NodeId, ObjectInstance> objects{};
  std::map<AgentId, AgentRuntime> agents{};  // ordered: ascending agent id
  DynamicsState dynamics{};

  const AgentRuntime& agent(const AgentId& id) const;  // throws UnknownNode
  AgentRuntime& agent_mut(const AgentId& id);
  const ObjectInstance& object(const NodeId& id) const;
  ObjectInstance& object_mut(const NodeId& id);

  // Tree invariants plus: every agent sits in an area and its tree node is a
  // child of that area; every object instance has an object node.
  void validate() const;

  bool operator==(const CanonicalWorldState&) const = default;
};

} // namespace lsim
