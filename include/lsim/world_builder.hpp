#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "lsim/location_graph.hpp"
#include "lsim/object_rules.hpp"
#include "lsim/world_state.hpp"

namespace lsim {

// Everything the scheduler needs to start: initial state, the (fixed) location
// graph and the object catalog.
struct WorldSetup {
  CanonicalWorldState state{};
  LocationGraph graph{};
  ObjectCatalog catalog{};
};

// Declarative world construction. Parents must be declared before their
// children. build() validates the result and throws StructuralError for
// dangling parents, unknown object types or agents placed outside an area.
class WorldBuilder {
public:
  WorldBuilder& area(NodeId id, std::string name, std::optional<NodeId> parent = std::nullopt);
  WorldBuilder& object(NodeId id, std::string name, NodeId parent, std::string type,
                       std::optional<Attributes> state = std::nullopt);
  WorldBuilder& agent(AgentId id, std::string name, NodeId area, std::string goal = {});
  WorldBuilder& portal(NodeId a, NodeId b);
  WorldBuilder& object_type(ObjectType t);

  WorldSetup build() const;

private:
  struct Decl {
    NodeId id{};
    std::string name{};
    NodeKind kind{NodeKind::Area};
    std::optional<NodeId> parent{};
    std::string type{};                 // objects
    std::optional<Attributes> state{};  // objects
    std::string goal{};                 // agents
  };

  std::vector<Decl> decls_{};
  std::vector<Portal> portals_{};
  ObjectCatalog catalog_{};
};

// Small town used by the CLI, the gateway and the end-to-end tests:
//
//   world
//   └─ street ─┬─ cafe  (coffee_machine, cafe_door, cleo)
//              ├─ park
//              └─ home ── kitchen (fridge)
//                  (lamp)
//   ada and byron start on the street; cafe and park share a portal.
WorldSetup make_demo_world();

// Patrol routes (agent -> area ids) that walk the demo world.
std::map<AgentId, std::vector<NodeId>> demo_routes();

} // namespace lsim
