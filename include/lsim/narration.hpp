#pragma once
#include <map>
#include <string>

#include "lsim/actions.hpp"
#include "lsim/events.hpp"
#include "lsim/perception.hpp"
#include "lsim/world_tree.hpp"

namespace lsim {

// Formats actions, events and observations from templates keyed by kind (or by
// an object transition's narration key). Placeholders look like {agent}; ids
// are shown by node name when the tree knows them. No effect on state.
class NarrationRenderer {
public:
  NarrationRenderer();

  void set_template(std::string key, std::string tmpl);
  const std::string* find_template(const std::string& key) const noexcept;

  std::string narrate(const Event& ev, const WorldTree& names) const;
  std::string narrate(const AgentId& actor, const Action& action, const WorldTree& names) const;
  std::string observation(const PerceptionSlice& slice, const WorldTree& names) const;
  // Memory text for the listener of a SAY event.
  std::string heard(const SayEvent& ev, const WorldTree& names) const;

  static std::string fill(const std::string& tmpl, const std::map<std::string, std::string>& vars);

private:
  std::map<std::string, std::string> templates_{};

  std::string render_(const std::string& key, const std::map<std::string, std::string>& vars) const;
};

} // namespace lsim
