#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <utility>
#include <vector>

#include "lsim/types.hpp"
#include "lsim/world_tree.hpp"

namespace lsim {

using Portal = std::pair<NodeId, NodeId>;  // bidirectional edge between two areas

// Undirected graph over area nodes. Built once at startup, immutable afterwards.
class LocationGraph {
public:
  LocationGraph() = default;

  // Areas are adjacent to their parent area and child areas; portals add
  // extra edges. Throws StructuralError if a portal names a non-area.
  static LocationGraph from_tree(const WorldTree& tree, const std::vector<Portal>& portals = {});

  void add_location(const NodeId& id);
  void add_edge(const NodeId& a, const NodeId& b);

  bool has_location(const NodeId& id) const noexcept { return adj_.count(id) != 0; }
  const std::set<NodeId>& neighbors(const NodeId& id) const;  // throws UnknownNode
  std::size_t location_count() const noexcept { return adj_.size(); }

  // Shortest path by edge count, excluding `from`, ending at `to`. Among
  // equal-length paths the lexicographically smallest id sequence wins.
  // Empty when from == to or `to` is unreachable.
  std::vector<NodeId> shortest_path(const NodeId& from, const NodeId& to) const;

  // Every location reachable from `from`, excluding `from` itself.
  std::set<NodeId> reachable_from(const NodeId& from) const;

private:
  std::map<NodeId, std::set<NodeId>> adj_{};

  std::map<NodeId, std::size_t> distances_to_(const NodeId& goal) const;
};

} // namespace lsim
