#include "lsim/object_rules.hpp"

#include <algorithm>

#include "lsim/errors.hpp"

namespace lsim {

std::string_view to_string(Verb v) noexcept {
  switch (v) {
    case Verb::Use:   return "USE";
    case Verb::Open:  return "OPEN";
    case Verb::Close: return "CLOSE";
    case Verb::Take:  return "TAKE";
    case Verb::Drop:  return "DROP";
  }
  return "UNKNOWN";
}

std::optional<Verb> parse_verb(std::string_view s) noexcept {
  if (s == "USE")   return Verb::Use;
  if (s == "OPEN")  return Verb::Open;
  if (s == "CLOSE") return Verb::Close;
  if (s == "TAKE")  return Verb::Take;
  if (s == "DROP")  return Verb::Drop;
  return std::nullopt;
}

void TransitionTable::add(Attributes from, Verb verb, Transition t) {
  rules_[{std::move(from), verb}] = std::move(t);
}

Transition TransitionTable::lookup(const Attributes& state, Verb verb) const {
  auto it = rules_.find({state, verb});
  if (it != rules_.end()) return it->second;

  Transition miss{};
  miss.next_state = state;
  miss.success = false;
  miss.narration_key = "object.no_effect";
  return miss;
}

void ObjectCatalog::add(ObjectType t) {
  const std::string name = t.name;
  types_[name] = std::move(t);
}

const ObjectType& ObjectCatalog::get(const std::string& name) const {
  auto it = types_.find(name);
  if (it == types_.end()) throw UnknownNode("object type " + name);
  return it->second;
}

namespace {

Transition ok(Attributes next, std::string key) {
  return Transition{std::move(next), true, std::move(key)};
}

Transition fail(Attributes same, std::string key) {
  return Transition{std::move(same), false, std::move(key)};
}

} // namespace

ObjectType make_switch_type(std::string name) {
  ObjectType t{};
  t.name = std::move(name);
  t.initial_state = {{"power", "off"}};

  const Attributes off{{"power", "off"}};
  const Attributes on{{"power", "on"}};
  t.table.add(off, Verb::Use, ok(on, "switch.on"));
  t.table.add(on, Verb::Use, ok(off, "switch.off"));
  return t;
}

ObjectType make_door_type(std::string name) {
  ObjectType t{};
  t.name = std::move(name);
  t.initial_state = {{"open", "no"}};

  const Attributes closed{{"open", "no"}};
  const Attributes open{{"open", "yes"}};
  t.table.add(closed, Verb::Open, ok(open, "door.opened"));
  t.table.add(open, Verb::Close, ok(closed, "door.closed"));
  t.table.add(open, Verb::Open, fail(open, "door.already_open"));
  t.table.add(closed, Verb::Close, fail(closed, "door.already_closed"));
  return t;
}

ObjectType make_container_type(std::string name, int capacity, int initial_items, bool lidded) {
  capacity = std::max(0, capacity);
  initial_items = std::clamp(initial_items, 0, capacity);

  ObjectType t{};
  t.name = std::move(name);
  t.initial_state = {{"items", std::to_string(initial_items)}};
  if (lidded) t.initial_state["open"] = "no";

  const auto state = [lidded](int items, bool open) {
    Attributes a{{"items", std::to_string(items)}};
    if (lidded) a["open"] = open ? "yes" : "no";
    return a;
  };

  for (int items = 0; items <= capacity; ++items) {
    for (bool open : {true, false}) {
      if (!lidded && !open) continue;
      const auto cur = state(items, open);

      if (!open) {
        t.table.add(cur, Verb::Take, fail(cur, "container.closed"));
        t.table.add(cur, Verb::Drop, fail(cur, "container.closed"));
        t.table.add(cur, Verb::Open, ok(state(items, true), "container.opened"));
        continue;
      }

      t.table.add(cur, Verb::Take, items > 0 ? ok(state(items - 1, true), "container.take")
                                             : fail(cur, "container.empty"));
      t.table.add(cur, Verb::Drop, items < capacity ? ok(state(items + 1, true), "container.drop")
                                                    : fail(cur, "container.full"));
      if (lidded) t.table.add(cur, Verb::Close, ok(state(items, false), "container.closed_lid"));
    }
  }
  return t;
}

} // namespace lsim
