#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "lsim/object_rules.hpp"
#include "lsim/types.hpp"

namespace lsim {

// Emitted once, on arrival.
struct MoveEvent {
  AgentId agent_id{};
  NodeId from{};
  NodeId to{};
  bool operator==(const MoveEvent&) const = default;
};

// Emitted for every executed INTERACT, including failed ones.
struct ObjectStateChanged {
  AgentId agent_id{};
  NodeId object_id{};
  Verb verb{Verb::Use};
  Attributes from_state{};
  Attributes to_state{};
  bool success{false};
  std::string narration_key{};
  bool operator==(const ObjectStateChanged&) const = default;
};

struct SayEvent {
  AgentId from_agent{};
  AgentId to_agent{};
  std::string utterance{};
  NodeId area_id{};
  bool operator==(const SayEvent&) const = default;
};

struct WeatherChanged {
  std::string old_weather{};
  std::string new_weather{};
  bool operator==(const WeatherChanged&) const = default;
};

struct TimeAdvanced {
  Tick tick{};
  int64_t day{};
  int64_t hour{};
  bool operator==(const TimeAdvanced&) const = default;
};

using Event = std::variant<MoveEvent, ObjectStateChanged, SayEvent, WeatherChanged, TimeAdvanced>;

enum class EventType : uint8_t { Move, ObjectStateChanged, Say, WeatherChanged, TimeAdvanced };

inline EventType type_of(const Event& e) noexcept {
  return static_cast<EventType>(e.index()); // relies on variant order above
}

inline std::string_view to_string(EventType t) noexcept {
  switch (t) {
    case EventType::Move:               return "MOVE";
    case EventType::ObjectStateChanged: return "OBJECT_STATE_CHANGED";
    case EventType::Say:                return "SAY";
    case EventType::WeatherChanged:     return "WEATHER_CHANGED";
    case EventType::TimeAdvanced:       return "TIME_ADVANCED";
  }
  return "UNKNOWN";
}

} // namespace lsim
