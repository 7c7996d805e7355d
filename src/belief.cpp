#include "lsim/belief.hpp"

namespace lsim {

void BeliefState::merge(const PerceptionSlice& slice, const CanonicalWorldState& committed, Tick tick) {
  for (const auto& p : slice.nodes) {
    const auto* n = committed.tree.find(p.node.id);
    if (!n) continue;  // removed canonically: keep the stale entry

    BeliefEntry e{};
    e.node = *n;
    if (n->kind == NodeKind::Object) {
      auto it = committed.objects.find(n->id);
      if (it != committed.objects.end()) e.object = it->second;
    }
    e.refreshed_at = tick;
    entries_[n->id] = std::move(e);
  }
}

const BeliefEntry* BeliefState::find(const NodeId& id) const noexcept {
  auto it = entries_.find(id);
  return it == entries_.end() ? nullptr : &it->second;
}

} // namespace lsim
