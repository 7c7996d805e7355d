#include "lsim/world_builder.hpp"

#include "lsim/errors.hpp"
#include "lsim/log.hpp"

namespace lsim {

WorldBuilder& WorldBuilder::area(NodeId id, std::string name, std::optional<NodeId> parent) {
  Decl d{};
  d.id = std::move(id);
  d.name = std::move(name);
  d.kind = NodeKind::Area;
  d.parent = std::move(parent);
  decls_.push_back(std::move(d));
  return *this;
}

WorldBuilder& WorldBuilder::object(NodeId id, std::string name, NodeId parent, std::string type,
                                   std::optional<Attributes> state) {
  Decl d{};
  d.id = std::move(id);
  d.name = std::move(name);
  d.kind = NodeKind::Object;
  d.parent = std::move(parent);
  d.type = std::move(type);
  d.state = std::move(state);
  decls_.push_back(std::move(d));
  return *this;
}

WorldBuilder& WorldBuilder::agent(AgentId id, std::string name, NodeId area, std::string goal) {
  Decl d{};
  d.id = std::move(id);
  d.name = std::move(name);
  d.kind = NodeKind::Agent;
  d.parent = std::move(area);
  d.goal = std::move(goal);
  decls_.push_back(std::move(d));
  return *this;
}

WorldBuilder& WorldBuilder::portal(NodeId a, NodeId b) {
  portals_.emplace_back(std::move(a), std::move(b));
  return *this;
}

WorldBuilder& WorldBuilder::object_type(ObjectType t) {
  catalog_.add(std::move(t));
  return *this;
}

WorldSetup WorldBuilder::build() const {
  WorldSetup out{};
  out.catalog = catalog_;

  auto& st = out.state;
  for (const auto& d : decls_) {
    st.tree.add_node(d.id, d.name, d.kind, d.parent);

    if (d.kind == NodeKind::Object) {
      if (!catalog_.contains(d.type)) {
        throw StructuralError("object " + d.id + " has unknown type " + d.type);
      }
      ObjectInstance obj{};
      obj.type = d.type;
      obj.state = d.state.value_or(catalog_.get(d.type).initial_state);
      st.objects.emplace(d.id, std::move(obj));
    } else if (d.kind == NodeKind::Agent) {
      AgentRuntime a{};
      a.id = d.id;
      a.name = d.name;
      a.location_id = *d.parent;
      a.goal = d.goal;
      st.agents.emplace(d.id, std::move(a));
    }
  }

  st.validate();
  out.graph = LocationGraph::from_tree(st.tree, portals_);

  logger()->debug("world built: {} nodes, {} locations, {} agents, {} objects",
                  st.tree.size(), out.graph.location_count(), st.agents.size(), st.objects.size());
  return out;
}

WorldSetup make_demo_world() {
  WorldBuilder b;
  b.object_type(make_switch_type())
   .object_type(make_door_type())
   .object_type(make_container_type("fridge", 3, 1));

  b.area("world", "the world")
   .area("street", "Main Street", "world")
   .area("cafe", "the cafe", "street")
   .area("park", "the park", "street")
   .area("home", "the house", "street")
   .area("kitchen", "the kitchen", "home");

  b.object("coffee_machine", "coffee machine", "cafe", "switch")
   .object("cafe_door", "cafe door", "cafe", "door")
   .object("lamp", "lamp", "home", "switch")
   .object("fridge", "fridge", "kitchen", "fridge");

  b.agent("ada", "Ada", "street", "get a coffee")
   .agent("byron", "Byron", "street", "take a walk in the park")
   .agent("cleo", "Cleo", "cafe", "keep the cafe running");

  b.portal("cafe", "park");
  return b.build();
}

std::map<AgentId, std::vector<NodeId>> demo_routes() {
  return {
    {"ada", {"cafe", "park", "street"}},
    {"byron", {"park", "home", "kitchen", "street"}},
    {"cleo", {"cafe"}},
  };
}

} // namespace lsim
