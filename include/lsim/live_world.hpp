#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "lsim/scheduler.hpp"
#include "lsim/sinks.hpp"

namespace lsim {

// Agent row for the HTTP layer.
struct LiveAgent {
  AgentRuntime runtime{};
  std::size_t memories{0};
  std::size_t beliefs{0};
  std::size_t reflections{0};
};

// Thread-safe front for a scheduler: HTTP handlers read the latest payload and
// ask for ticks; only step() touches the scheduler, under the lock. Ticks never
// advance on their own.
class LiveWorld {
public:
  LiveWorld(WorldSetup setup, Collaborators collab, SchedulerConfig cfg = {});

  LiveWorld(const LiveWorld&) = delete;
  LiveWorld& operator=(const LiveWorld&) = delete;

  void add_sink(std::shared_ptr<TickSink> sink);

  // Advances up to n ticks. Returns the number actually run, which is less
  // than n only if the scheduler halted (the error is logged, not rethrown).
  std::size_t step(std::size_t n);

  std::shared_ptr<const TickPayload> latest() const { return latest_->latest(); }
  std::vector<LiveAgent> agents() const;
  SchedulerStats stats() const;
  Tick current_tick() const;
  bool halted() const;

private:
  mutable std::mutex mtx_;
  TickScheduler sched_;
  std::shared_ptr<LatestTickSink> latest_;
};

} // namespace lsim
