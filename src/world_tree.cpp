#include "lsim/world_tree.hpp"

#include <algorithm>
#include <set>

#include "lsim/errors.hpp"

namespace lsim {

WorldTree WorldTree::from_nodes(std::vector<WorldNode> nodes) {
  WorldTree t;
  for (auto& n : nodes) {
    if (!n.parent_id) {
      if (t.root_) throw StructuralError("second root node: " + n.id);
      t.root_ = n.id;
    }
    const NodeId id = n.id;
    if (!t.nodes_.emplace(id, std::move(n)).second) throw StructuralError("duplicate node id: " + id);
  }
  t.validate();
  return t;
}

const WorldNode& WorldTree::add_node(NodeId id, std::string name, NodeKind kind,
                                     std::optional<NodeId> parent) {
  if (id.empty()) throw StructuralError("node id must not be empty");
  if (contains(id)) throw StructuralError("duplicate node id: " + id);

  if (!parent) {
    if (root_) throw StructuralError("second root node: " + id + " (root is " + *root_ + ")");
  } else if (!contains(*parent)) {
    throw StructuralError("dangling parent " + *parent + " for node " + id);
  }

  WorldNode n{};
  n.id = id;
  n.name = std::move(name);
  n.kind = kind;
  n.parent_id = parent;

  if (parent) node_mut_(*parent).children.push_back(id);
  else root_ = id;

  return nodes_.emplace(id, std::move(n)).first->second;
}

void WorldTree::reparent(const NodeId& id, const NodeId& new_parent) {
  if (!contains(id)) throw UnknownNode(id);
  if (!contains(new_parent)) throw StructuralError("dangling parent " + new_parent + " for node " + id);
  if (root_ && *root_ == id) throw StructuralError("cannot reparent the root node " + id);
  if (id == new_parent || is_ancestor_(id, new_parent)) {
    throw StructuralError("reparenting " + id + " under " + new_parent + " would create a cycle");
  }

  auto& n = node_mut_(id);
  if (n.parent_id && *n.parent_id == new_parent) return;

  if (n.parent_id) {
    auto& siblings = node_mut_(*n.parent_id).children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
  }
  node_mut_(new_parent).children.push_back(id);
  n.parent_id = new_parent;
}

void WorldTree::remove(const NodeId& id) {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) throw UnknownNode(id);
  if (!it->second.children.empty()) throw StructuralError("cannot remove non-leaf node " + id);

  if (it->second.parent_id) {
    auto& siblings = node_mut_(*it->second.parent_id).children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
  } else {
    root_.reset();
  }
  nodes_.erase(it);
}

const WorldNode* WorldTree::find(const NodeId& id) const noexcept {
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : &it->second;
}

const WorldNode& WorldTree::node(const NodeId& id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) throw UnknownNode(id);
  return it->second;
}

std::vector<NodeId> WorldTree::children_of(const NodeId& id, NodeKind kind) const {
  std::vector<NodeId> out;
  for (const auto& c : node(id).children) {
    const auto* cn = find(c);
    if (cn && cn->kind == kind) out.push_back(c);
  }
  return out;
}

void WorldTree::validate() const {
  if (nodes_.empty()) return;
  if (!root_ || !contains(*root_)) throw StructuralError("world tree has no root");

  for (const auto& [id, n] : nodes_) {
    if (n.id != id) throw StructuralError("node key/id mismatch: " + id);

    if (!n.parent_id) {
      if (id != *root_) throw StructuralError("second root node: " + id);
    } else {
      const auto* p = find(*n.parent_id);
      if (!p) throw StructuralError("dangling parent " + *n.parent_id + " for node " + id);
      if (std::find(p->children.begin(), p->children.end(), id) == p->children.end()) {
        throw StructuralError("parent " + p->id + " does not list child " + id);
      }
    }

    std::set<NodeId> seen;
    for (const auto& c : n.children) {
      if (!seen.insert(c).second) throw StructuralError("duplicate child " + c + " under " + id);
      const auto* cn = find(c);
      if (!cn) throw StructuralError("dangling child " + c + " under " + id);
      if (!cn->parent_id || *cn->parent_id != id) {
        throw StructuralError("child " + c + " does not point back to " + id);
      }
    }
  }

  // Every node must reach the root within size() hops.
  for (const auto& [id, n] : nodes_) {
    const WorldNode* cur = &n;
    std::size_t hops = 0;
    while (cur->parent_id) {
      if (++hops > nodes_.size()) throw StructuralError("cycle through node " + id);
      cur = &node(*cur->parent_id);
    }
    if (cur->id != *root_) throw StructuralError("node " + id + " is not connected to the root");
  }
}

WorldNode& WorldTree::node_mut_(const NodeId& id) {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) throw UnknownNode(id);
  return it->second;
}

bool WorldTree::is_ancestor_(const NodeId& maybe_ancestor, const NodeId& id) const {
  const WorldNode* cur = find(id);
  std::size_t hops = 0;
  while (cur && cur->parent_id) {
    if (*cur->parent_id == maybe_ancestor) return true;
    if (++hops > nodes_.size()) throw StructuralError("cycle through node " + id);
    cur = find(*cur->parent_id);
  }
  return false;
}

} // namespace lsim
