#include "lsim/validation.hpp"

#include <type_traits>

namespace lsim {

std::string_view to_string(RejectReason r) noexcept {
  switch (r) {
    case RejectReason::None:               return "none";
    case RejectReason::InTransit:          return "in_transit";
    case RejectReason::TargetNotReachable: return "target_not_reachable";
    case RejectReason::UnknownObject:      return "unknown_object";
    case RejectReason::UnknownAgent:       return "unknown_agent";
  }
  return "unknown";
}

namespace {

ActionDecision reject(RejectReason why) {
  ActionDecision d{};
  d.accept = false;
  d.reason = why;
  d.action = Idle{};
  return d;
}

} // namespace

ActionDecision validate_action(const Action& action, const ValidTargets& targets) {
  ActionDecision d{};
  d.action = action;

  std::visit([&](const auto& a) {
    using T = std::decay_t<decltype(a)>;

    if constexpr (std::is_same_v<T, Idle>) {
      return;
    } else if constexpr (std::is_same_v<T, Move>) {
      if (targets.in_transit) d = reject(RejectReason::InTransit);
      else if (!targets.locations.count(a.to_location_id)) d = reject(RejectReason::TargetNotReachable);
    } else if constexpr (std::is_same_v<T, Interact>) {
      if (targets.in_transit) d = reject(RejectReason::InTransit);
      else if (!targets.objects.count(a.object_id)) d = reject(RejectReason::UnknownObject);
    } else if constexpr (std::is_same_v<T, Say>) {
      if (targets.in_transit) d = reject(RejectReason::InTransit);
      else if (!targets.agents.count(a.to_agent_id)) d = reject(RejectReason::UnknownAgent);
    }
  }, action);

  return d;
}

} // namespace lsim
