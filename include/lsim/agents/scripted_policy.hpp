#pragma once
#include <deque>
#include <map>
#include <mutex>
#include <vector>

#include "lsim/collaborators.hpp"

namespace lsim::agents {

// Replays a fixed queue of actions per agent, then idles. Keeps every request
// it was handed so tests can inspect what the kernel showed each agent.
class ScriptedPolicy final : public DecisionPolicy {
public:
  ScriptedPolicy() = default;

  void push(const AgentId& agent, Action a);
  void push_all(const AgentId& agent, std::vector<Action> actions);

  Action decide(const DecisionRequest& req) override;

  std::vector<DecisionRequest> requests_for(const AgentId& agent) const;
  std::size_t pending(const AgentId& agent) const;

private:
  mutable std::mutex mu_;
  std::map<AgentId, std::deque<Action>> queues_{};
  std::map<AgentId, std::vector<DecisionRequest>> seen_{};
};

} // namespace lsim::agents
