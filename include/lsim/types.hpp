#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace lsim {

using NodeId  = std::string;  // stable, unique across the world tree
using AgentId = NodeId;       // agents are world nodes
using Tick    = int64_t;      // logical step counter, starts at 0
using MemoryId = uint64_t;    // unique within one agent's stream

// Object-type-specific attributes, e.g. {power: "off"}. Ordered for stable output.
using Attributes = std::map<std::string, std::string>;

enum class NodeKind : uint8_t { Area = 0, Object = 1, Agent = 2 };

inline std::string_view to_string(NodeKind k) noexcept {
  switch (k) {
    case NodeKind::Area:   return "area";
    case NodeKind::Object: return "object";
    case NodeKind::Agent:  return "agent";
  }
  return "unknown";
}

} // namespace lsim
