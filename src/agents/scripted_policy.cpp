#include "lsim/agents/scripted_policy.hpp"

namespace lsim::agents {

void ScriptedPolicy::push(const AgentId& agent, Action a) {
  std::lock_guard<std::mutex> lk(mu_);
  queues_[agent].push_back(std::move(a));
}

void ScriptedPolicy::push_all(const AgentId& agent, std::vector<Action> actions) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& q = queues_[agent];
  for (auto& a : actions) q.push_back(std::move(a));
}

Action ScriptedPolicy::decide(const DecisionRequest& req) {
  std::lock_guard<std::mutex> lk(mu_);
  seen_[req.agent_id].push_back(req);

  auto it = queues_.find(req.agent_id);
  if (it == queues_.end() || it->second.empty()) return Idle{};

  Action a = std::move(it->second.front());
  it->second.pop_front();
  return a;
}

std::vector<DecisionRequest> ScriptedPolicy::requests_for(const AgentId& agent) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = seen_.find(agent);
  return it == seen_.end() ? std::vector<DecisionRequest>{} : it->second;
}

std::size_t ScriptedPolicy::pending(const AgentId& agent) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = queues_.find(agent);
  return it == queues_.end() ? 0 : it->second.size();
}

} // namespace lsim::agents
