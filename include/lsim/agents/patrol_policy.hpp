#pragma once
#include <map>
#include <string>
#include <vector>

#include "lsim/collaborators.hpp"

namespace lsim::agents {

struct PatrolPolicyConfig {
  // Areas each agent cycles through; agents without a route never move.
  std::map<AgentId, std::vector<NodeId>> routes{};
  std::string greeting{"hello"};
};

// Stateless four-phase routine keyed on tick % 4:
//   0 go to (or stay at) the active plan step's location; without a reachable
//     plan location, move to the next reachable stop on the route
//   1 poke the first visible object
//   2 greet the first visible agent
//   3 idle
// Anything not offered in valid_targets turns into IDLE, and so does any tick
// spent in transit. Safe to call concurrently.
class PatrolPolicy final : public DecisionPolicy {
public:
  explicit PatrolPolicy(PatrolPolicyConfig cfg) : cfg_(std::move(cfg)) {}

  Action decide(const DecisionRequest& req) override;

private:
  PatrolPolicyConfig cfg_{};

  Action next_stop_(const DecisionRequest& req) const;
  static Action poke_(const DecisionRequest& req);
};

} // namespace lsim::agents
