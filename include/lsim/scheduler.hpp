#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "lsim/belief.hpp"
#include "lsim/collaborators.hpp"
#include "lsim/memory.hpp"
#include "lsim/narration.hpp"
#include "lsim/object_executor.hpp"
#include "lsim/planning.hpp"
#include "lsim/reflection.hpp"
#include "lsim/sinks.hpp"
#include "lsim/thread_pool.hpp"
#include "lsim/tick_payload.hpp"
#include "lsim/transit.hpp"
#include "lsim/world_builder.hpp"
#include "lsim/world_dynamics.hpp"

namespace lsim {

struct SchedulerConfig {
  RetrievalConfig retrieval{};
  ReflectionConfig reflection{};
  TransitConfig transit{};
  DynamicsConfig dynamics{};
  PlanConfig planning{};

  std::chrono::milliseconds decide_timeout{2000};
  std::size_t decide_threads{0};     // worker threads for decide calls; 0 = one per agent
  bool parallel_decide{true};        // all agents decide at once against one deadline
  bool halt_on_policy_error{false};  // PolicyError instead of IDLE substitution
};

// Injected capabilities. policy, rater, embedder and insights are required;
// narration falls back to the built-in templates. Without a planner agents
// simply have no plan.
struct Collaborators {
  std::shared_ptr<DecisionPolicy> policy{};
  std::shared_ptr<ImportanceRater> rater{};
  std::shared_ptr<Embedder> embedder{};
  std::shared_ptr<InsightGenerator> insights{};
  std::shared_ptr<const NarrationRenderer> narration{};
  std::shared_ptr<Planner> planner{};
};

// Decision counters count what happened, including during a tick that later
// aborted; memories, reflections and plans count committed ticks only.
struct SchedulerStats {
  uint64_t ticks{0};
  uint64_t decisions{0};
  uint64_t rejected{0};           // actions replaced by IDLE at validation
  uint64_t timeouts{0};
  uint64_t busy{0};               // no call made, the previous one is still running
  uint64_t policy_errors{0};
  uint64_t plans{0};
  uint64_t plan_failures{0};      // planner threw or returned an unusable plan
  uint64_t failed_transitions{0};
  uint64_t memories{0};
  uint64_t reflections{0};
  uint64_t sink_errors{0};
};

// The kernel. One step() = one tick:
//   freeze -> perceive -> decide -> validate -> execute -> dynamics -> commit
//   -> belief merge -> memory/reflection -> publish
// Canonical state and every agent's belief, memory, reflection and plan are
// worked on as copies and replaced together at commit; any exception before
// that leaves all of them as they were, halts the scheduler and is rethrown.
//
// Decide calls run on a pool owned by the scheduler. Each agent has at most one
// call in flight: a call that misses its deadline keeps running in the
// background and the agent reports BUSY until it returns.
class TickScheduler {
public:
  TickScheduler(WorldSetup setup, Collaborators collab, SchedulerConfig cfg = {});

  TickScheduler(const TickScheduler&) = delete;
  TickScheduler& operator=(const TickScheduler&) = delete;

  void add_sink(std::shared_ptr<TickSink> sink);
  void add_memory_sink(std::shared_ptr<MemorySink> sink);

  // Runs one tick and returns the published payload. Throws KernelHalted once a
  // previous tick failed.
  std::shared_ptr<const TickPayload> step();
  void run(std::size_t ticks);

  Tick current_tick() const noexcept { return tick_; }  // the tick step() will run next
  bool halted() const noexcept { return halted_; }

  const CanonicalWorldState& state() const noexcept { return setup_.state; }
  const LocationGraph& graph() const noexcept { return setup_.graph; }
  const ObjectCatalog& catalog() const noexcept { return setup_.catalog; }
  const SchedulerConfig& config() const noexcept { return cfg_; }
  const SchedulerStats& stats() const noexcept { return stats_; }

  const BeliefState& belief(const AgentId& id) const;          // throws UnknownNode
  const MemoryStream& memory(const AgentId& id) const;
  const ReflectionTracker& reflection(const AgentId& id) const;
  const AgentPlan& plan(const AgentId& id) const;

  std::size_t decide_threads() const noexcept { return pool_->size(); }

private:
  struct AgentMind {
    BeliefState belief;
    MemoryStream memory;
    ReflectionTracker reflection;
    AgentPlan plan{};
  };

  using NewMemories = std::vector<std::pair<AgentId, MemoryRecord>>;

  // Everything a tick changes, applied to the scheduler only at commit.
  struct TickWork {
    CanonicalWorldState state{};
    std::map<AgentId, AgentMind> minds{};
    NewMemories memories{};
    uint64_t reflections{0};
    uint64_t plans{0};
  };

  // Per-agent view of the frozen snapshot plus what became of its decision.
  struct Frame {
    AgentId agent{};
    bool was_in_transit{false};
    PerceptionSlice slice{};
    ValidTargets targets{};
    std::vector<MemoryRecord> excerpt{};
    std::optional<PlanItem> plan{};
    AgentDecision decision{};
  };

  SchedulerConfig cfg_;
  WorldSetup setup_;
  Collaborators collab_;
  GuardedRater rater_;
  GuardedEmbedder embedder_;
  TransitMachine transit_;
  ObjectExecutor executor_;
  WorldDynamics dynamics_;

  std::map<AgentId, AgentMind> minds_{};
  std::vector<std::shared_ptr<TickSink>> sinks_{};
  std::vector<std::shared_ptr<MemorySink>> memory_sinks_{};
  NewMemories committed_memories_{};

  std::unique_ptr<ThreadPool> pool_{};
  std::map<AgentId, std::future<Action>> abandoned_{};  // timed-out calls still running

  Tick tick_{0};
  bool halted_{false};
  SchedulerStats stats_{};

  std::shared_ptr<const TickPayload> run_tick_();

  std::vector<Frame> perceive_(Tick now, TickWork& work);
  void plan_(TickWork& work, const AgentRuntime& agent, Tick now);
  void decide_(std::vector<Frame>& frames, Tick now);
  void validate_(std::vector<Frame>& frames);
  std::vector<Event> execute_(const std::vector<Frame>& frames, CanonicalWorldState& working);
  void remember_(const std::vector<Frame>& frames, const std::vector<Event>& events, Tick now, TickWork& work);
  void append_memory_(TickWork& work, const AgentId& id, std::string description, MemoryKind kind, Tick now);
  void publish_(const std::shared_ptr<const TickPayload>& payload);

  AgentMind& mind_(const AgentId& id);
  const AgentMind& mind_(const AgentId& id) const;
};

} // namespace lsim
