#pragma once
#include <string>
#include <string_view>

#include "lsim/memory.hpp"
#include "lsim/planning.hpp"
#include "lsim/tick_payload.hpp"

namespace lsim {

// Compact JSON text for the replay log and the gateway. Maps are written in
// key order, so equal values always produce identical text.
std::string json_escape(std::string_view s);
std::string json_string(std::string_view s);  // quoted + escaped

std::string to_json(const Attributes& attrs);
std::string to_json(const Action& a);
std::string to_json(const Event& e);
std::string to_json(const AgentRuntime& a);
std::string to_json(const CanonicalWorldState& s);
std::string to_json(const BeliefState& b);
std::string to_json(const AgentDecision& d);
std::string to_json(const PlanItem& p);
std::string to_json(const MemoryRecord& r);  // embedding omitted
std::string to_json(const TickPayload& p);

} // namespace lsim
