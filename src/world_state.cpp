#include "lsim/world_state.hpp"

#include "lsim/errors.hpp"

namespace lsim {

const AgentRuntime& CanonicalWorldState::agent(const AgentId& id) const {
  auto it = agents.find(id);
  if (it == agents.end()) throw UnknownNode(id);
  return it->second;
}

AgentRuntime& CanonicalWorldState::agent_mut(const AgentId& id) {
  auto it = agents.find(id);
  if (it == agents.end()) throw UnknownNode(id);
  return it->second;
}

const ObjectInstance& CanonicalWorldState::object(const NodeId& id) const {
  auto it = objects.find(id);
  if (it == objects.end()) throw UnknownNode(id);
  return it->second;
}

ObjectInstance& CanonicalWorldState::object_mut(const NodeId& id) {
  auto it = objects.find(id);
  if (it == objects.end()) throw UnknownNode(id);
  return it->second;
}

void CanonicalWorldState::validate() const {
  tree.validate();

  for (const auto& [id, a] : agents) {
    const auto* n = tree.find(id);
    if (!n || n->kind != NodeKind::Agent) throw StructuralError("agent " + id + " has no agent node");

    const auto* loc = tree.find(a.location_id);
    if (!loc || loc->kind != NodeKind::Area) {
      throw StructuralError("agent " + id + " location " + a.location_id + " is not an area");
    }
    if (!n->parent_id || *n->parent_id != a.location_id) {
      throw StructuralError("agent " + id + " node is not a child of its location " + a.location_id);
    }
    if (a.transit && (a.transit->path.empty() || a.transit->remaining_edges <= 0 ||
                      a.transit->remaining_edges > static_cast<int64_t>(a.transit->path.size()))) {
      throw StructuralError("agent " + id + " has malformed transit state");
    }
  }

  for (const auto& [id, o] : objects) {
    const auto* n = tree.find(id);
    if (!n || n->kind != NodeKind::Object) throw StructuralError("object " + id + " has no object node");
  }
}

} // namespace lsim
