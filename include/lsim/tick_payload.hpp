#pragma once
#include <cstdint>
#include <map>
#include <string_view>
#include <vector>

#include "lsim/actions.hpp"
#include "lsim/belief.hpp"
#include "lsim/events.hpp"
#include "lsim/planning.hpp"
#include "lsim/validation.hpp"
#include "lsim/world_state.hpp"

namespace lsim {

// Busy: the agent's previous call is still running past its deadline, so no
// new call was made this tick.
enum class DecisionOutcome : uint8_t { Ok = 0, TimedOut, Failed, Busy };

inline std::string_view to_string(DecisionOutcome o) noexcept {
  switch (o) {
    case DecisionOutcome::Ok: return "OK";
    case DecisionOutcome::TimedOut: return "TIMED_OUT";
    case DecisionOutcome::Failed: return "FAILED";
    case DecisionOutcome::Busy: return "BUSY";
  }
  return "?";
}

// What the policy returned for one agent and what the kernel actually applied.
struct AgentDecision {
  Action proposed{Idle{}};
  Action applied{Idle{}};
  DecisionOutcome outcome{DecisionOutcome::Ok};
  RejectReason reason{RejectReason::None};

  bool operator==(const AgentDecision&) const = default;
};

struct StateSnapshot {
  CanonicalWorldState world{};
  std::map<AgentId, BeliefState> beliefs{};

  bool operator==(const StateSnapshot&) const = default;
};

// One committed tick. Published as shared_ptr<const TickPayload>; never mutated.
struct TickPayload {
  Tick tick{};
  StateSnapshot state{};
  std::vector<Event> events{};                  // agent order, then world dynamics
  std::map<AgentId, AgentDecision> decisions{};
  std::map<AgentId, PlanItem> plans{};          // active plan step, agents with one only

  bool operator==(const TickPayload&) const = default;
};

} // namespace lsim
