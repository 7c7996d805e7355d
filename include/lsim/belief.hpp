#pragma once
#include <cstddef>
#include <map>
#include <optional>

#include "lsim/perception.hpp"
#include "lsim/world_state.hpp"

namespace lsim {

struct BeliefEntry {
  WorldNode node{};
  std::optional<ObjectInstance> object{};
  Tick refreshed_at{};

  bool operator==(const BeliefEntry&) const = default;
};

// One agent's partial, possibly stale mirror of the canonical tree. Entries are
// only written by merge(); nothing is ever removed. Parent/child ids inside an
// entry may name nodes the agent has not perceived yet.
class BeliefState {
public:
  using EntryMap = std::map<NodeId, BeliefEntry>;

  // Refresh every id of `slice` from `committed`. Ids that no longer exist
  // canonically keep their old entry.
  void merge(const PerceptionSlice& slice, const CanonicalWorldState& committed, Tick tick);

  bool knows(const NodeId& id) const noexcept { return entries_.count(id) != 0; }
  const BeliefEntry* find(const NodeId& id) const noexcept;
  const EntryMap& entries() const noexcept { return entries_; }
  std::size_t size() const noexcept { return entries_.size(); }

  bool operator==(const BeliefState&) const = default;

private:
  EntryMap entries_{};
};

} // namespace lsim
