#include "lsim/narration.hpp"

#include <type_traits>
#include <variant>

namespace lsim {

namespace {

std::string name_of(const WorldTree& names, const NodeId& id) {
  const auto* n = names.find(id);
  return (n && !n->name.empty()) ? n->name : id;
}

std::string join(const std::vector<std::string>& parts) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) out += ", ";
    out += parts[i];
  }
  return out;
}

std::string describe_state(const Attributes& a) {
  std::string out;
  for (const auto& [k, v] : a) {
    if (!out.empty()) out += ", ";
    out += k + "=" + v;
  }
  return out;
}

} // namespace

NarrationRenderer::NarrationRenderer() {
  templates_ = {
    {"MOVE", "{agent} moved from {from} to {to}."},
    {"SAY", "{agent} said to {target}: \"{utterance}\""},
    {"SAY.heard", "{agent} heard {speaker} say: \"{utterance}\""},
    {"WEATHER_CHANGED", "The weather turned from {old} to {new}."},
    {"TIME_ADVANCED", "Day {day}, hour {hour}."},
    {"OBSERVATION", "{agent} is at {location}."},
    {"OBSERVATION.company", "{agent} is at {location} and sees {visible}."},

    {"action.IDLE", "{agent} waits."},
    {"action.MOVE", "{agent} heads for {target}."},
    {"action.INTERACT", "{agent} tries to {verb} the {object}."},
    {"action.SAY", "{agent} speaks to {target}."},

    {"switch.on", "{agent} turned on the {object}."},
    {"switch.off", "{agent} turned off the {object}."},
    {"door.opened", "{agent} opened the {object}."},
    {"door.closed", "{agent} closed the {object}."},
    {"door.already_open", "{agent} found the {object} already open."},
    {"door.already_closed", "{agent} found the {object} already closed."},
    {"container.take", "{agent} took an item from the {object}."},
    {"container.empty", "{agent} found the {object} empty."},
    {"container.drop", "{agent} put an item into the {object}."},
    {"container.full", "{agent} could not fit anything into the {object}."},
    {"container.closed", "{agent} could not reach into the closed {object}."},
    {"container.opened", "{agent} opened the {object}."},
    {"container.closed_lid", "{agent} closed the {object}."},
    {"object.no_effect", "{agent} tried to {verb} the {object}, but nothing happened."},
  };
}

void NarrationRenderer::set_template(std::string key, std::string tmpl) {
  templates_[std::move(key)] = std::move(tmpl);
}

const std::string* NarrationRenderer::find_template(const std::string& key) const noexcept {
  auto it = templates_.find(key);
  return it == templates_.end() ? nullptr : &it->second;
}

std::string NarrationRenderer::fill(const std::string& tmpl, const std::map<std::string, std::string>& vars) {
  std::string out;
  out.reserve(tmpl.size());

  std::size_t i = 0;
  while (i < tmpl.size()) {
    if (tmpl[i] == '{') {
      const auto close = tmpl.find('}', i + 1);
      if (close != std::string::npos) {
        auto it = vars.find(tmpl.substr(i + 1, close - i - 1));
        if (it != vars.end()) {
          out += it->second;
          i = close + 1;
          continue;
        }
      }
    }
    out += tmpl[i++];
  }
  return out;
}

std::string NarrationRenderer::render_(const std::string& key,
                                       const std::map<std::string, std::string>& vars) const {
  if (const auto* t = find_template(key)) return fill(*t, vars);
  // Unknown key: still say who did what.
  auto it = vars.find("agent");
  return (it != vars.end() ? it->second + ": " : std::string{}) + key;
}

std::string NarrationRenderer::narrate(const Event& ev, const WorldTree& names) const {
  return std::visit([&](const auto& e) -> std::string {
    using T = std::decay_t<decltype(e)>;

    if constexpr (std::is_same_v<T, MoveEvent>) {
      return render_("MOVE", {{"agent", name_of(names, e.agent_id)},
                              {"from", name_of(names, e.from)},
                              {"to", name_of(names, e.to)}});
    } else if constexpr (std::is_same_v<T, ObjectStateChanged>) {
      return render_(e.narration_key, {{"agent", name_of(names, e.agent_id)},
                                       {"object", name_of(names, e.object_id)},
                                       {"verb", std::string(to_string(e.verb))},
                                       {"from", describe_state(e.from_state)},
                                       {"to", describe_state(e.to_state)}});
    } else if constexpr (std::is_same_v<T, SayEvent>) {
      return render_("SAY", {{"agent", name_of(names, e.from_agent)},
                             {"target", name_of(names, e.to_agent)},
                             {"utterance", e.utterance}});
    } else if constexpr (std::is_same_v<T, WeatherChanged>) {
      return render_("WEATHER_CHANGED", {{"old", e.old_weather}, {"new", e.new_weather}});
    } else {
      return render_("TIME_ADVANCED", {{"tick", std::to_string(e.tick)},
                                       {"day", std::to_string(e.day)},
                                       {"hour", std::to_string(e.hour)}});
    }
  }, ev);
}

std::string NarrationRenderer::narrate(const AgentId& actor, const Action& action, const WorldTree& names) const {
  std::map<std::string, std::string> vars{{"agent", name_of(names, actor)}};

  std::visit([&](const auto& a) {
    using T = std::decay_t<decltype(a)>;
    if constexpr (std::is_same_v<T, Move>) {
      vars["target"] = name_of(names, a.to_location_id);
    } else if constexpr (std::is_same_v<T, Interact>) {
      vars["object"] = name_of(names, a.object_id);
      vars["verb"] = std::string(to_string(a.verb));
    } else if constexpr (std::is_same_v<T, Say>) {
      vars["target"] = name_of(names, a.to_agent_id);
      vars["utterance"] = a.utterance;
    }
  }, action);

  return render_("action." + std::string(to_string(type_of(action))), vars);
}

std::string NarrationRenderer::observation(const PerceptionSlice& slice, const WorldTree& names) const {
  std::vector<std::string> visible;
  for (const auto& p : slice.nodes) {
    if (p.node.id == slice.location_id || p.node.id == slice.agent_id) continue;
    if (p.node.kind == NodeKind::Area) continue;
    visible.push_back(p.node.name.empty() ? p.node.id : p.node.name);
  }

  std::map<std::string, std::string> vars{{"agent", name_of(names, slice.agent_id)},
                                          {"location", name_of(names, slice.location_id)},
                                          {"visible", join(visible)}};
  return render_(visible.empty() ? "OBSERVATION" : "OBSERVATION.company", vars);
}

std::string NarrationRenderer::heard(const SayEvent& ev, const WorldTree& names) const {
  return render_("SAY.heard", {{"agent", name_of(names, ev.to_agent)},
                               {"speaker", name_of(names, ev.from_agent)},
                               {"utterance", ev.utterance}});
}

} // namespace lsim
