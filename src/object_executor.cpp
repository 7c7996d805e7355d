#include "lsim/object_executor.hpp"

namespace lsim {

ObjectStateChanged ObjectExecutor::execute(CanonicalWorldState& state, const AgentId& agent,
                                           const NodeId& object_id, Verb verb) const {
  auto& obj = state.object_mut(object_id);
  const auto& type = catalog_.get(obj.type);
  const Transition tr = type.table.lookup(obj.state, verb);

  ObjectStateChanged ev{};
  ev.agent_id = agent;
  ev.object_id = object_id;
  ev.verb = verb;
  ev.from_state = obj.state;
  ev.success = tr.success;
  ev.narration_key = tr.narration_key;

  if (tr.success) obj.state = tr.next_state;
  ev.to_state = obj.state;
  return ev;
}

} // namespace lsim
