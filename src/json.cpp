#include "lsim/json.hpp"

#include <cstdio>
#include <sstream>
#include <type_traits>
#include <variant>

namespace lsim {

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

std::string json_string(std::string_view s) {
  return "\"" + json_escape(s) + "\"";
}

namespace {

std::string opt_string(const std::optional<NodeId>& v) {
  return v ? json_string(*v) : "null";
}

template <class Seq>
std::string string_array(const Seq& ids) {
  std::ostringstream oss;
  oss << "[";
  bool first = true;
  for (const auto& id : ids) {
    if (!first) oss << ",";
    first = false;
    oss << json_string(id);
  }
  oss << "]";
  return oss.str();
}

std::string node_json(const WorldNode& n) {
  std::ostringstream oss;
  oss << "{"
      << "\"id\":" << json_string(n.id) << ","
      << "\"name\":" << json_string(n.name) << ","
      << "\"kind\":" << json_string(to_string(n.kind)) << ","
      << "\"parent\":" << opt_string(n.parent_id) << ","
      << "\"children\":" << string_array(n.children)
      << "}";
  return oss.str();
}

} // namespace

std::string to_json(const Attributes& attrs) {
  std::ostringstream oss;
  oss << "{";
  bool first = true;
  for (const auto& [k, v] : attrs) {
    if (!first) oss << ",";
    first = false;
    oss << json_string(k) << ":" << json_string(v);
  }
  oss << "}";
  return oss.str();
}

std::string to_json(const Action& a) {
  std::ostringstream oss;
  oss << "{\"type\":" << json_string(to_string(type_of(a)));
  std::visit([&](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, Move>) {
      oss << ",\"to\":" << json_string(x.to_location_id);
    } else if constexpr (std::is_same_v<T, Interact>) {
      oss << ",\"object\":" << json_string(x.object_id)
          << ",\"verb\":" << json_string(to_string(x.verb));
    } else if constexpr (std::is_same_v<T, Say>) {
      oss << ",\"to\":" << json_string(x.to_agent_id)
          << ",\"utterance\":" << json_string(x.utterance);
    }
  }, a);
  oss << "}";
  return oss.str();
}

std::string to_json(const Event& e) {
  std::ostringstream oss;
  oss << "{\"type\":" << json_string(to_string(type_of(e)));
  std::visit([&](const auto& x) {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, MoveEvent>) {
      oss << ",\"agent\":" << json_string(x.agent_id)
          << ",\"from\":" << json_string(x.from)
          << ",\"to\":" << json_string(x.to);
    } else if constexpr (std::is_same_v<T, ObjectStateChanged>) {
      oss << ",\"agent\":" << json_string(x.agent_id)
          << ",\"object\":" << json_string(x.object_id)
          << ",\"verb\":" << json_string(to_string(x.verb))
          << ",\"from_state\":" << to_json(x.from_state)
          << ",\"to_state\":" << to_json(x.to_state)
          << ",\"success\":" << (x.success ? "true" : "false")
          << ",\"narration_key\":" << json_string(x.narration_key);
    } else if constexpr (std::is_same_v<T, SayEvent>) {
      oss << ",\"from\":" << json_string(x.from_agent)
          << ",\"to\":" << json_string(x.to_agent)
          << ",\"utterance\":" << json_string(x.utterance)
          << ",\"area\":" << json_string(x.area_id);
    } else if constexpr (std::is_same_v<T, WeatherChanged>) {
      oss << ",\"old\":" << json_string(x.old_weather)
          << ",\"new\":" << json_string(x.new_weather);
    } else {
      oss << ",\"tick\":" << x.tick << ",\"day\":" << x.day << ",\"hour\":" << x.hour;
    }
  }, e);
  oss << "}";
  return oss.str();
}

std::string to_json(const AgentRuntime& a) {
  std::ostringstream oss;
  oss << "{"
      << "\"id\":" << json_string(a.id) << ","
      << "\"name\":" << json_string(a.name) << ","
      << "\"location\":" << json_string(a.location_id) << ","
      << "\"goal\":" << json_string(a.goal) << ","
      << "\"transit\":";
  if (a.transit) {
    const auto& t = *a.transit;
    oss << "{"
        << "\"origin\":" << json_string(t.origin) << ","
        << "\"path\":" << string_array(t.path) << ","
        << "\"remaining_edges\":" << t.remaining_edges << ","
        << "\"edge_progress\":" << t.edge_progress
        << "}";
  } else {
    oss << "null";
  }
  oss << "}";
  return oss.str();
}

std::string to_json(const CanonicalWorldState& s) {
  std::ostringstream oss;
  oss << "{";

  oss << "\"root\":" << opt_string(s.tree.root_id()) << ",";
  oss << "\"nodes\":[";
  bool first = true;
  for (const auto& [id, n] : s.tree.nodes()) {
    if (!first) oss << ",";
    first = false;
    oss << node_json(n);
  }
  oss << "],";

  oss << "\"objects\":{";
  first = true;
  for (const auto& [id, o] : s.objects) {
    if (!first) oss << ",";
    first = false;
    oss << json_string(id) << ":{\"type\":" << json_string(o.type) << ",\"state\":" << to_json(o.state) << "}";
  }
  oss << "},";

  oss << "\"agents\":{";
  first = true;
  for (const auto& [id, a] : s.agents) {
    if (!first) oss << ",";
    first = false;
    oss << json_string(id) << ":" << to_json(a);
  }
  oss << "},";

  const auto& d = s.dynamics;
  oss << "\"dynamics\":{"
      << "\"weather\":" << json_string(d.weather) << ","
      << "\"day\":" << d.day << ","
      << "\"hour\":" << d.hour << ","
      << "\"rng_state\":" << d.rng_state
      << "}";

  oss << "}";
  return oss.str();
}

std::string to_json(const BeliefState& b) {
  std::ostringstream oss;
  oss << "{";
  bool first = true;
  for (const auto& [id, e] : b.entries()) {
    if (!first) oss << ",";
    first = false;
    oss << json_string(id) << ":{"
        << "\"refreshed_at\":" << e.refreshed_at << ","
        << "\"node\":" << node_json(e.node);
    if (e.object) {
      oss << ",\"type\":" << json_string(e.object->type)
          << ",\"state\":" << to_json(e.object->state);
    }
    oss << "}";
  }
  oss << "}";
  return oss.str();
}

std::string to_json(const AgentDecision& d) {
  std::ostringstream oss;
  oss << "{"
      << "\"proposed\":" << to_json(d.proposed) << ","
      << "\"applied\":" << to_json(d.applied) << ","
      << "\"outcome\":" << json_string(to_string(d.outcome)) << ","
      << "\"reason\":" << json_string(to_string(d.reason))
      << "}";
  return oss.str();
}

std::string to_json(const PlanItem& p) {
  std::ostringstream oss;
  oss << "{"
      << "\"start_tick\":" << p.start_tick << ","
      << "\"end_tick\":" << p.end_tick << ","
      << "\"location\":" << json_string(p.location_id) << ","
      << "\"description\":" << json_string(p.description)
      << "}";
  return oss.str();
}

std::string to_json(const MemoryRecord& r) {
  std::ostringstream oss;
  oss << "{"
      << "\"id\":" << r.id << ","
      << "\"kind\":" << json_string(to_string(r.kind)) << ","
      << "\"description\":" << json_string(r.description) << ","
      << "\"created_at\":" << r.created_at << ","
      << "\"last_accessed_at\":" << r.last_accessed_at << ","
      << "\"importance\":" << r.importance << ","
      << "\"links\":[";
  bool first = true;
  for (const auto id : r.links) {
    if (!first) oss << ",";
    first = false;
    oss << id;
  }
  oss << "]}";
  return oss.str();
}

std::string to_json(const TickPayload& p) {
  std::ostringstream oss;
  oss << "{\"tick\":" << p.tick << ",";

  oss << "\"events\":[";
  for (std::size_t i = 0; i < p.events.size(); ++i) {
    if (i) oss << ",";
    oss << to_json(p.events[i]);
  }
  oss << "],";

  oss << "\"decisions\":{";
  bool first = true;
  for (const auto& [id, d] : p.decisions) {
    if (!first) oss << ",";
    first = false;
    oss << json_string(id) << ":" << to_json(d);
  }
  oss << "},";

  oss << "\"plans\":{";
  first = true;
  for (const auto& [id, item] : p.plans) {
    if (!first) oss << ",";
    first = false;
    oss << json_string(id) << ":" << to_json(item);
  }
  oss << "},";

  oss << "\"state\":{\"world\":" << to_json(p.state.world) << ",\"beliefs\":{";
  first = true;
  for (const auto& [id, b] : p.state.beliefs) {
    if (!first) oss << ",";
    first = false;
    oss << json_string(id) << ":" << to_json(b);
  }
  oss << "}}}";
  return oss.str();
}

} // namespace lsim
