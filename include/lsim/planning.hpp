#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "lsim/types.hpp"
#include "lsim/world_state.hpp"

namespace lsim {

// One stretch of an agent's day: be at location_id during [start_tick, end_tick).
struct PlanItem {
  Tick start_tick{};
  Tick end_tick{};
  NodeId location_id{};
  std::string description{};

  bool active_at(Tick t) const noexcept { return start_tick <= t && t < end_tick; }

  bool operator==(const PlanItem&) const = default;
};

struct PlanConfig {
  Tick step_ticks{1};        // day items are cut into steps of at most this many ticks
  std::size_t max_items{8};  // a longer day plan is truncated
};

// Drafts a coarse day plan starting at `start`. The kernel asks once an agent
// has no plan left, i.e. on its first tick and again after the last item ends.
class Planner {
public:
  virtual ~Planner() = default;
  virtual std::vector<PlanItem> plan_day(const AgentRuntime& agent, const WorldTree& tree, Tick start) = 0;
};

// Empty when the items form a usable plan at `now`: non-empty, every item
// non-empty and ordered without overlap, and not already over.
std::string plan_problem(const std::vector<PlanItem>& items, Tick now);

// Splits each item into consecutive steps of at most step_ticks, keeping the
// location and description.
std::vector<PlanItem> decompose(const std::vector<PlanItem>& items, Tick step_ticks);

// An agent's current day plan and its fine-grained steps.
class AgentPlan {
public:
  AgentPlan() = default;
  AgentPlan(std::vector<PlanItem> day, Tick step_ticks);

  const std::vector<PlanItem>& day() const noexcept { return day_; }
  const std::vector<PlanItem>& steps() const noexcept { return steps_; }

  // The step covering `now`, or nullptr in a gap between items.
  const PlanItem* active(Tick now) const noexcept;

  bool expired(Tick now) const noexcept { return day_.empty() || now >= day_.back().end_tick; }

  bool operator==(const AgentPlan&) const = default;

private:
  std::vector<PlanItem> day_{};
  std::vector<PlanItem> steps_{};
};

} // namespace lsim
