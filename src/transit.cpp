#include "lsim/transit.hpp"

#include <string>

#include "lsim/errors.hpp"

namespace lsim {

TransitMachine::TransitMachine(const LocationGraph& graph, TransitConfig cfg)
  : graph_(graph), cfg_(cfg) {
  if (cfg_.ticks_per_edge < 1) {
    throw ConfigError("ticks_per_edge must be >= 1 (got " + std::to_string(cfg_.ticks_per_edge) + ")");
  }
}

bool TransitMachine::begin(CanonicalWorldState& state, const AgentId& agent, const NodeId& to) const {
  auto& a = state.agent_mut(agent);
  if (a.in_transit()) return false;

  auto path = graph_.shortest_path(a.location_id, to);
  if (path.empty()) return false;

  TransitState t{};
  t.origin = a.location_id;
  t.remaining_edges = static_cast<int64_t>(path.size());
  t.path = std::move(path);
  a.transit = std::move(t);
  return true;
}

std::optional<MoveEvent> TransitMachine::advance(CanonicalWorldState& state, const AgentId& agent) const {
  auto& a = state.agent_mut(agent);
  if (!a.transit) return std::nullopt;

  auto& t = *a.transit;
  if (++t.edge_progress < cfg_.ticks_per_edge) return std::nullopt;

  const NodeId next = t.next_node();
  state.tree.reparent(agent, next);
  a.location_id = next;
  t.edge_progress = 0;
  --t.remaining_edges;

  if (t.remaining_edges > 0) return std::nullopt;

  MoveEvent ev{};
  ev.agent_id = agent;
  ev.from = t.origin;
  ev.to = t.destination();
  a.transit.reset();
  return ev;
}

} // namespace lsim
