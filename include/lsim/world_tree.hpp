#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "lsim/types.hpp"

namespace lsim {

struct WorldNode {
  NodeId id{};
  std::string name{};
  NodeKind kind{NodeKind::Area};
  std::optional<NodeId> parent_id{};  // empty only for the root
  std::vector<NodeId> children{};     // insertion order

  bool operator==(const WorldNode&) const = default;
};

// Containment hierarchy stored as an arena keyed by id; parent/child links are
// ids, never owning pointers. Every mutation keeps parent.children and
// child.parent_id consistent or throws StructuralError without changing anything.
class WorldTree {
public:
  using NodeMap = std::map<NodeId, WorldNode>;

  WorldTree() = default;

  // Loader entry point: takes nodes as supplied (links already filled in) and
  // runs validate(). Throws StructuralError on any malformed input.
  static WorldTree from_nodes(std::vector<WorldNode> nodes);

  // First node without a parent becomes the root; a second parentless node throws.
  const WorldNode& add_node(NodeId id, std::string name, NodeKind kind,
                            std::optional<NodeId> parent = std::nullopt);

  // Move `id` (and its subtree) under `new_parent`. Rejects moving the root
  // or moving a node below itself.
  void reparent(const NodeId& id, const NodeId& new_parent);

  // Leaf removal only.
  void remove(const NodeId& id);

  bool contains(const NodeId& id) const noexcept { return nodes_.count(id) != 0; }
  const WorldNode* find(const NodeId& id) const noexcept;
  const WorldNode& node(const NodeId& id) const;  // throws UnknownNode

  const std::optional<NodeId>& root_id() const noexcept { return root_; }
  const NodeMap& nodes() const noexcept { return nodes_; }
  std::size_t size() const noexcept { return nodes_.size(); }

  // Children of `id` with the given kind, in child order.
  std::vector<NodeId> children_of(const NodeId& id, NodeKind kind) const;

  // Full structural check: single root, no dangling parent, no cycle,
  // symmetric parent/children links, no duplicate children.
  void validate() const;

  bool operator==(const WorldTree&) const = default;

private:
  NodeMap nodes_{};
  std::optional<NodeId> root_{};

  WorldNode& node_mut_(const NodeId& id);
  bool is_ancestor_(const NodeId& maybe_ancestor, const NodeId& id) const;
};

} // namespace lsim
