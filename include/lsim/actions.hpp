#pragma once
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <variant>

#include "lsim/object_rules.hpp"
#include "lsim/types.hpp"

namespace lsim {

struct Idle {
  bool operator==(const Idle&) const = default;
};

struct Move {
  NodeId to_location_id{};
  bool operator==(const Move&) const = default;
};

struct Interact {
  NodeId object_id{};
  Verb verb{Verb::Use};
  bool operator==(const Interact&) const = default;
};

struct Say {
  AgentId to_agent_id{};
  std::string utterance{};
  bool operator==(const Say&) const = default;
};

using Action = std::variant<Idle, Move, Interact, Say>;

enum class ActionType : uint8_t { Idle, Move, Interact, Say };

inline ActionType type_of(const Action& a) noexcept {
  return static_cast<ActionType>(a.index()); // relies on variant order above
}

inline std::string_view to_string(ActionType t) noexcept {
  switch (t) {
    case ActionType::Idle:     return "IDLE";
    case ActionType::Move:     return "MOVE";
    case ActionType::Interact: return "INTERACT";
    case ActionType::Say:      return "SAY";
  }
  return "UNKNOWN";
}

// Per-agent, per-tick admissible arguments. Computed from the frozen snapshot.
struct ValidTargets {
  std::set<NodeId> locations{};   // MOVE
  std::set<NodeId> objects{};     // INTERACT
  std::set<AgentId> agents{};     // SAY
  bool in_transit{false};

  bool operator==(const ValidTargets&) const = default;
};

} // namespace lsim
