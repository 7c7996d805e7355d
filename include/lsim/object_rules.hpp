#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "lsim/types.hpp"

namespace lsim {

enum class Verb : uint8_t { Use = 0, Open = 1, Close = 2, Take = 3, Drop = 4 };

std::string_view to_string(Verb v) noexcept;
std::optional<Verb> parse_verb(std::string_view s) noexcept;

struct Transition {
  Attributes next_state{};
  bool success{false};
  std::string narration_key{};
};

// (current_state, verb) -> Transition. A missing entry is a failed
// interaction with narration key "object.no_effect".
class TransitionTable {
public:
  void add(Attributes from, Verb verb, Transition t);
  Transition lookup(const Attributes& state, Verb verb) const;
  std::size_t size() const noexcept { return rules_.size(); }

private:
  std::map<std::pair<Attributes, Verb>, Transition> rules_{};
};

struct ObjectType {
  std::string name{};
  Attributes initial_state{};
  TransitionTable table{};
};

// Object types by name. Supplied once by the world setup, read-only to the kernel.
class ObjectCatalog {
public:
  void add(ObjectType t);
  bool contains(const std::string& name) const noexcept { return types_.count(name) != 0; }
  const ObjectType& get(const std::string& name) const;  // throws UnknownNode

private:
  std::map<std::string, ObjectType> types_{};
};

// ---- built-in types ----
// {power: off|on}; USE toggles.
ObjectType make_switch_type(std::string name = "switch");
// {open: no|yes}; OPEN/CLOSE toggle, repeating fails.
ObjectType make_door_type(std::string name = "door");
// {items: 0..capacity} (+ {open: no|yes} when lidded). TAKE/DROP move one item;
// a lidded container must be open.
ObjectType make_container_type(std::string name, int capacity, int initial_items, bool lidded = false);

} // namespace lsim
