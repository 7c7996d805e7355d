#pragma once
#include <cstddef>
#include <vector>

#include "lsim/collaborators.hpp"
#include "lsim/memory.hpp"

namespace lsim {

struct ReflectionConfig {
  double threshold{10.0};
  std::size_t min_insights{3};
  std::size_t max_insights{5};
};

// Cumulative importance of the records appended since the last reflection.
// The counter only grows; reflect() is the only thing that resets it.
class ReflectionTracker {
public:
  explicit ReflectionTracker(ReflectionConfig cfg = {});

  void observe(const MemoryRecord& r) noexcept { since_last_ += r.importance; }
  bool should_reflect() const noexcept { return since_last_ >= cfg_.threshold; }

  double since_last() const noexcept { return since_last_; }
  std::size_t window_start() const noexcept { return window_start_; }
  std::size_t reflections() const noexcept { return reflections_; }
  const ReflectionConfig& config() const noexcept { return cfg_; }

  // When the threshold is met: hands the records since the last reflection to
  // `gen`, appends at most max_insights reflection records (links restricted to
  // ids present in the stream), resets the counter and feeds the new records
  // back into it. Returns the appended ids; empty when nothing triggered.
  std::vector<MemoryId> reflect(MemoryStream& stream, InsightGenerator& gen, ImportanceRater& rater,
                                Embedder& embedder, Tick now);

private:
  ReflectionConfig cfg_{};
  double since_last_{0.0};
  std::size_t window_start_{0};
  std::size_t reflections_{0};
};

} // namespace lsim
