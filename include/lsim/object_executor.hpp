#pragma once
#include "lsim/events.hpp"
#include "lsim/object_rules.hpp"
#include "lsim/world_state.hpp"

namespace lsim {

// Applies INTERACT actions against the working copy. The table is consulted with
// the object's state at the moment of execution, so an earlier agent in the same
// tick changes what a later one sees. Same agent order => same outcome; whether
// the outcome is physically plausible is up to the transition table.
class ObjectExecutor {
public:
  explicit ObjectExecutor(const ObjectCatalog& catalog) : catalog_(catalog) {}

  // On failure the object state is left untouched; the event is emitted either way.
  ObjectStateChanged execute(CanonicalWorldState& state, const AgentId& agent,
                             const NodeId& object_id, Verb verb) const;

private:
  const ObjectCatalog& catalog_;
};

} // namespace lsim
