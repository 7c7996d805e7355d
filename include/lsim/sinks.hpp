#pragma once
#include <cstddef>
#include <memory>
#include <mutex>

#include "lsim/memory.hpp"
#include "lsim/tick_payload.hpp"

namespace lsim {

// Receives every committed tick, in order, on the scheduler thread. on_tick must
// return promptly; any backlog policy belongs to the sink.
class TickSink {
public:
  virtual ~TickSink() = default;
  virtual void on_tick(std::shared_ptr<const TickPayload> payload) = 0;
};

// Receives every memory record of a committed tick, in the order they were
// appended, right after the tick's payload went to the tick sinks. Records of an
// aborted tick are never delivered.
class MemorySink {
public:
  virtual ~MemorySink() = default;
  virtual void on_memory(const AgentId& agent, const MemoryRecord& record) = 0;
};

// Keep-latest-only consumer. Readers on other threads get the newest payload.
class LatestTickSink final : public TickSink {
public:
  void on_tick(std::shared_ptr<const TickPayload> payload) override {
    std::lock_guard<std::mutex> lk(mu_);
    latest_ = std::move(payload);
    ++received_;
  }

  std::shared_ptr<const TickPayload> latest() const {
    std::lock_guard<std::mutex> lk(mu_);
    return latest_;
  }

  std::size_t received() const {
    std::lock_guard<std::mutex> lk(mu_);
    return received_;
  }

private:
  mutable std::mutex mu_;
  std::shared_ptr<const TickPayload> latest_{};
  std::size_t received_{0};
};

} // namespace lsim
