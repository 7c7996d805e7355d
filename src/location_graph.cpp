#include "lsim/location_graph.hpp"

#include <deque>

#include "lsim/errors.hpp"

namespace lsim {

LocationGraph LocationGraph::from_tree(const WorldTree& tree, const std::vector<Portal>& portals) {
  LocationGraph g;
  for (const auto& [id, n] : tree.nodes()) {
    if (n.kind != NodeKind::Area) continue;
    g.add_location(id);
    if (n.parent_id) {
      const auto* p = tree.find(*n.parent_id);
      if (p && p->kind == NodeKind::Area) g.add_edge(id, p->id);
    }
  }

  for (const auto& [a, b] : portals) {
    const auto* na = tree.find(a);
    const auto* nb = tree.find(b);
    if (!na || !nb || na->kind != NodeKind::Area || nb->kind != NodeKind::Area) {
      throw StructuralError("portal must join two areas: " + a + " <-> " + b);
    }
    g.add_edge(a, b);
  }
  return g;
}

void LocationGraph::add_location(const NodeId& id) {
  adj_.try_emplace(id);
}

void LocationGraph::add_edge(const NodeId& a, const NodeId& b) {
  if (a == b) return;
  adj_[a].insert(b);
  adj_[b].insert(a);
}

const std::set<NodeId>& LocationGraph::neighbors(const NodeId& id) const {
  auto it = adj_.find(id);
  if (it == adj_.end()) throw UnknownNode(id);
  return it->second;
}

std::map<NodeId, std::size_t> LocationGraph::distances_to_(const NodeId& goal) const {
  std::map<NodeId, std::size_t> dist;
  if (!has_location(goal)) return dist;

  std::deque<NodeId> q{goal};
  dist[goal] = 0;
  while (!q.empty()) {
    const NodeId cur = q.front();
    q.pop_front();
    for (const auto& nb : adj_.at(cur)) {
      if (dist.count(nb)) continue;
      dist[nb] = dist[cur] + 1;
      q.push_back(nb);
    }
  }
  return dist;
}

std::vector<NodeId> LocationGraph::shortest_path(const NodeId& from, const NodeId& to) const {
  std::vector<NodeId> path;
  if (from == to || !has_location(from) || !has_location(to)) return path;

  const auto dist = distances_to_(to);
  auto it = dist.find(from);
  if (it == dist.end()) return path;

  // Greedy walk towards the goal: neighbors are ordered, so the first one that
  // is one step closer yields the lexicographically smallest shortest path.
  NodeId cur = from;
  std::size_t d = it->second;
  path.reserve(d);
  while (cur != to) {
    for (const auto& nb : adj_.at(cur)) {
      auto nd = dist.find(nb);
      if (nd != dist.end() && nd->second + 1 == d) {
        cur = nb;
        --d;
        break;
      }
    }
    path.push_back(cur);
  }
  return path;
}

std::set<NodeId> LocationGraph::reachable_from(const NodeId& from) const {
  std::set<NodeId> out;
  if (!has_location(from)) return out;
  for (const auto& [id, d] : distances_to_(from)) {
    if (id != from) out.insert(id);
  }
  return out;
}

} // namespace lsim
