#include "lsim/perception.hpp"

namespace lsim {

std::vector<NodeId> PerceptionSlice::visible_ids() const {
  std::vector<NodeId> out;
  out.reserve(nodes.size());
  for (const auto& p : nodes) out.push_back(p.node.id);
  return out;
}

std::vector<const PerceivedNode*> PerceptionSlice::of_kind(NodeKind kind) const {
  std::vector<const PerceivedNode*> out;
  for (const auto& p : nodes) {
    if (p.node.kind == kind && p.node.id != location_id) out.push_back(&p);
  }
  return out;
}

namespace {

PerceivedNode perceived(const CanonicalWorldState& state, const WorldNode& n) {
  PerceivedNode p{};
  p.node = n;
  if (n.kind == NodeKind::Object) {
    auto it = state.objects.find(n.id);
    if (it != state.objects.end()) p.object = it->second;
  }
  return p;
}

} // namespace

PerceptionSlice perceive(const CanonicalWorldState& state, const AgentId& agent, Tick tick) {
  const auto& a = state.agent(agent);
  const auto& loc = state.tree.node(a.location_id);

  PerceptionSlice s{};
  s.tick = tick;
  s.agent_id = agent;
  s.location_id = a.location_id;
  s.in_transit = a.in_transit();

  s.nodes.reserve(loc.children.size() + 1);
  s.nodes.push_back(perceived(state, loc));
  for (const auto& c : loc.children) {
    s.nodes.push_back(perceived(state, state.tree.node(c)));
  }
  return s;
}

ValidTargets compute_valid_targets(const CanonicalWorldState& state, const LocationGraph& graph,
                                   const AgentId& agent) {
  const auto& a = state.agent(agent);

  ValidTargets t{};
  if (a.in_transit()) {
    t.in_transit = true;
    return t;
  }

  t.locations = graph.reachable_from(a.location_id);
  for (const auto& id : state.tree.children_of(a.location_id, NodeKind::Object)) t.objects.insert(id);
  for (const auto& id : state.tree.children_of(a.location_id, NodeKind::Agent)) {
    if (id != agent) t.agents.insert(id);
  }
  return t;
}

} // namespace lsim
