#include "lsim/planning.hpp"

#include <algorithm>

#include "lsim/errors.hpp"

namespace lsim {

std::string plan_problem(const std::vector<PlanItem>& items, Tick now) {
  if (items.empty()) return "plan has no items";

  for (std::size_t i = 0; i < items.size(); ++i) {
    const auto& it = items[i];
    const auto at = "item " + std::to_string(i) + ": ";
    if (it.end_tick <= it.start_tick) return at + "ends before it starts";
    if (it.location_id.empty()) return at + "no location";
    if (i > 0 && it.start_tick < items[i - 1].end_tick) return at + "overlaps the previous item";
  }
  if (items.back().end_tick <= now) return "plan is over before tick " + std::to_string(now);
  return {};
}

std::vector<PlanItem> decompose(const std::vector<PlanItem>& items, Tick step_ticks) {
  if (step_ticks <= 0) throw ConfigError("plan step_ticks must be > 0");

  std::vector<PlanItem> out;
  for (const auto& it : items) {
    for (Tick t = it.start_tick; t < it.end_tick; t += step_ticks) {
      PlanItem step = it;
      step.start_tick = t;
      step.end_tick = std::min(t + step_ticks, it.end_tick);
      out.push_back(std::move(step));
    }
  }
  return out;
}

AgentPlan::AgentPlan(std::vector<PlanItem> day, Tick step_ticks)
  : day_(std::move(day)), steps_(decompose(day_, step_ticks)) {}

const PlanItem* AgentPlan::active(Tick now) const noexcept {
  // Steps are sorted and disjoint.
  auto it = std::upper_bound(steps_.begin(), steps_.end(), now,
                             [](Tick t, const PlanItem& p) { return t < p.start_tick; });
  if (it == steps_.begin()) return nullptr;
  --it;
  return it->active_at(now) ? &*it : nullptr;
}

} // namespace lsim
