#include "lsim/agents/patrol_policy.hpp"

#include <algorithm>

namespace lsim::agents {

namespace {

bool offered(const std::set<NodeId>& ids, const NodeId& id) {
  return ids.count(id) != 0;
}

// Picks the verb that most likely changes the object's state.
Verb verb_for(const ObjectInstance& obj) {
  const auto& s = obj.state;
  if (auto it = s.find("open"); it != s.end()) {
    return it->second == "yes" ? Verb::Close : Verb::Open;
  }
  if (auto it = s.find("items"); it != s.end()) {
    return it->second == "0" ? Verb::Drop : Verb::Take;
  }
  return Verb::Use;
}

} // namespace

Action PatrolPolicy::decide(const DecisionRequest& req) {
  if (req.valid_targets.in_transit) return Idle{};

  switch (req.tick % 4) {
    case 0: return next_stop_(req);
    case 1: return poke_(req);
    case 2: {
      if (req.valid_targets.agents.empty()) return Idle{};
      return Say{*req.valid_targets.agents.begin(), cfg_.greeting};
    }
    default:
      return Idle{};
  }
}

Action PatrolPolicy::next_stop_(const DecisionRequest& req) const {
  // The plan wins over the route unless its location cannot be reached.
  if (req.plan) {
    if (req.plan->location_id == req.perception.location_id) return Idle{};
    if (offered(req.valid_targets.locations, req.plan->location_id)) return Move{req.plan->location_id};
  }

  auto it = cfg_.routes.find(req.agent_id);
  if (it == cfg_.routes.end() || it->second.empty()) return Idle{};
  const auto& route = it->second;

  // Resume after the stop we are standing on; otherwise start from the top.
  const auto here = std::find(route.begin(), route.end(), req.perception.location_id);
  std::size_t start = (here == route.end()) ? 0 : static_cast<std::size_t>(here - route.begin()) + 1;

  for (std::size_t i = 0; i < route.size(); ++i) {
    const auto& stop = route[(start + i) % route.size()];
    if (stop == req.perception.location_id) continue;
    if (offered(req.valid_targets.locations, stop)) return Move{stop};
  }
  return Idle{};
}

Action PatrolPolicy::poke_(const DecisionRequest& req) {
  for (const auto* p : req.perception.of_kind(NodeKind::Object)) {
    if (!p->object || !offered(req.valid_targets.objects, p->node.id)) continue;
    return Interact{p->node.id, verb_for(*p->object)};
  }
  return Idle{};
}

} // namespace lsim::agents
