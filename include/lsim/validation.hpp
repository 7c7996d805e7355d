#pragma once
#include <cstdint>
#include <string_view>

#include "lsim/actions.hpp"

namespace lsim {

enum class RejectReason : uint8_t {
  None = 0,
  InTransit,
  TargetNotReachable,
  UnknownObject,
  UnknownAgent
};

std::string_view to_string(RejectReason r) noexcept;

struct ActionDecision {
  bool accept{true};
  RejectReason reason{RejectReason::None};
  Action action{Idle{}};  // the input when accepted, Idle otherwise
};

// Checks every argument against the valid-target sets. Idle is always accepted.
// Applying it to an accepted action returns the same action unchanged.
ActionDecision validate_action(const Action& action, const ValidTargets& targets);

} // namespace lsim
