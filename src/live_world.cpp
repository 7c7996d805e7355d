#include "lsim/live_world.hpp"

#include <exception>

#include "lsim/log.hpp"

namespace lsim {

LiveWorld::LiveWorld(WorldSetup setup, Collaborators collab, SchedulerConfig cfg)
  : sched_(std::move(setup), std::move(collab), std::move(cfg)),
    latest_(std::make_shared<LatestTickSink>()) {
  sched_.add_sink(latest_);
}

void LiveWorld::add_sink(std::shared_ptr<TickSink> sink) {
  std::lock_guard<std::mutex> lk(mtx_);
  sched_.add_sink(std::move(sink));
}

std::size_t LiveWorld::step(std::size_t n) {
  std::lock_guard<std::mutex> lk(mtx_);
  std::size_t done = 0;
  for (; done < n; ++done) {
    if (sched_.halted()) break;
    try {
      sched_.step();
    } catch (const std::exception& e) {
      logger()->error("live world stopped at tick {}: {}", sched_.current_tick(), e.what());
      break;
    }
  }
  return done;
}

std::vector<LiveAgent> LiveWorld::agents() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<LiveAgent> out;
  out.reserve(sched_.state().agents.size());
  for (const auto& [id, a] : sched_.state().agents) {
    LiveAgent row{};
    row.runtime = a;
    row.memories = sched_.memory(id).size();
    row.beliefs = sched_.belief(id).size();
    row.reflections = sched_.reflection(id).reflections();
    out.push_back(std::move(row));
  }
  return out;
}

SchedulerStats LiveWorld::stats() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return sched_.stats();
}

Tick LiveWorld::current_tick() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return sched_.current_tick();
}

bool LiveWorld::halted() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return sched_.halted();
}

} // namespace lsim
