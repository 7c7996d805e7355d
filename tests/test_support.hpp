#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "lsim/agents/heuristics.hpp"
#include "lsim/agents/scripted_policy.hpp"
#include "lsim/scheduler.hpp"
#include "lsim/world_builder.hpp"

namespace lsim::testing {

class ConstantRater final : public ImportanceRater {
public:
  explicit ConstantRater(int v) : v_(v) {}
  int rate(std::string_view) override { return v_; }

private:
  int v_;
};

// world -> {x, y} with a portal x <-> y, one lamp in x, and the given agents in x.
inline WorldSetup two_rooms(const std::vector<AgentId>& agents_in_x) {
  WorldBuilder b;
  b.object_type(make_switch_type())
   .object_type(make_container_type("fridge", 1, 1));
  b.area("world", "world")
   .area("x", "room X", "world")
   .area("y", "room Y", "world")
   .object("lamp", "lamp", "x", "switch")
   .object("fridge", "fridge", "x", "fridge");
  for (const auto& a : agents_in_x) b.agent(a, a, "x");
  b.portal("x", "y");
  return b.build();
}

// No weather changes, generous decide timeout.
inline SchedulerConfig quiet_config() {
  SchedulerConfig cfg{};
  cfg.dynamics.change_probability = 0.0;
  cfg.decide_timeout = std::chrono::milliseconds(5000);
  return cfg;
}

inline Collaborators collaborators(std::shared_ptr<DecisionPolicy> policy, int importance = 3) {
  Collaborators c{};
  c.policy = std::move(policy);
  c.rater = std::make_shared<ConstantRater>(importance);
  c.embedder = std::make_shared<agents::HashEmbedder>();
  c.insights = std::make_shared<agents::TemplateInsightGenerator>();
  return c;
}

template <class T>
std::vector<T> events_of(const TickPayload& p) {
  std::vector<T> out;
  for (const auto& ev : p.events) {
    if (const auto* e = std::get_if<T>(&ev)) out.push_back(*e);
  }
  return out;
}

} // namespace lsim::testing
