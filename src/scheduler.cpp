#include "lsim/scheduler.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>

#include "lsim/errors.hpp"
#include "lsim/log.hpp"
#include "lsim/perception.hpp"
#include "lsim/validation.hpp"

namespace lsim {

TickScheduler::TickScheduler(WorldSetup setup, Collaborators collab, SchedulerConfig cfg)
  : cfg_(std::move(cfg)),
    setup_(std::move(setup)),
    collab_(std::move(collab)),
    rater_(collab_.rater),
    embedder_(collab_.embedder),
    transit_(setup_.graph, cfg_.transit),
    executor_(setup_.catalog),
    dynamics_(cfg_.dynamics) {
  if (!collab_.policy) throw ConfigError("decision policy must not be null");
  if (!collab_.insights) throw ConfigError("insight generator must not be null");
  if (cfg_.decide_timeout.count() <= 0) throw ConfigError("decide_timeout must be > 0");
  if (cfg_.planning.step_ticks <= 0) throw ConfigError("planning step_ticks must be > 0");
  if (cfg_.planning.max_items == 0) throw ConfigError("planning max_items must be > 0");
  if (!collab_.narration) collab_.narration = std::make_shared<const NarrationRenderer>();

  // Per-agent configs are checked here too, so an empty world still rejects them.
  static_cast<void>(MemoryStream{cfg_.retrieval});
  static_cast<void>(ReflectionTracker{cfg_.reflection});

  setup_.state.dynamics = dynamics_.initial_state();
  setup_.state.validate();

  for (const auto& [id, a] : setup_.state.agents) {
    minds_.emplace(id, AgentMind{BeliefState{}, MemoryStream{cfg_.retrieval}, ReflectionTracker{cfg_.reflection}});
  }

  const std::size_t threads = cfg_.decide_threads ? cfg_.decide_threads : std::max<std::size_t>(1, minds_.size());
  pool_ = std::make_unique<ThreadPool>(threads);

  logger()->info("scheduler ready: {} agents, {} locations, {} decide threads, seed {}",
                 minds_.size(), setup_.graph.location_count(), threads, cfg_.dynamics.seed);
}

void TickScheduler::add_sink(std::shared_ptr<TickSink> sink) {
  if (!sink) throw ConfigError("sink must not be null");
  sinks_.push_back(std::move(sink));
}

void TickScheduler::add_memory_sink(std::shared_ptr<MemorySink> sink) {
  if (!sink) throw ConfigError("memory sink must not be null");
  memory_sinks_.push_back(std::move(sink));
}

std::shared_ptr<const TickPayload> TickScheduler::step() {
  if (halted_) {
    throw KernelHalted("scheduler halted; tick " + std::to_string(tick_) + " was never committed");
  }

  std::shared_ptr<const TickPayload> payload;
  try {
    payload = run_tick_();
  } catch (const std::exception& e) {
    halted_ = true;
    logger()->error("tick {} aborted, halting: {}", tick_, e.what());
    throw;
  }

  publish_(payload);
  ++tick_;
  ++stats_.ticks;
  return payload;
}

void TickScheduler::run(std::size_t ticks) {
  for (std::size_t i = 0; i < ticks; ++i) step();
}

std::shared_ptr<const TickPayload> TickScheduler::run_tick_() {
  const Tick now = tick_;

  TickWork work{};
  work.minds = minds_;

  // Everything up to execute reads setup_.state, the frozen end of tick now-1.
  auto frames = perceive_(now, work);
  decide_(frames, now);
  validate_(frames);

  work.state = setup_.state;
  auto events = execute_(frames, work.state);

  auto ambient = dynamics_.step(work.state.dynamics, now);
  events.insert(events.end(), std::make_move_iterator(ambient.begin()), std::make_move_iterator(ambient.end()));
  work.state.validate();

  for (const auto& f : frames) {
    work.minds.at(f.agent).belief.merge(f.slice, work.state, now);
  }
  remember_(frames, events, now, work);

  auto payload = std::make_shared<TickPayload>();
  payload->tick = now;
  payload->state.world = work.state;
  for (const auto& [id, m] : work.minds) payload->state.beliefs.emplace(id, m.belief);
  for (auto& f : frames) {
    if (f.plan) payload->plans.emplace(f.agent, *f.plan);
    payload->decisions.emplace(f.agent, std::move(f.decision));
  }
  payload->events = std::move(events);

  // Commit.
  setup_.state = std::move(work.state);
  minds_ = std::move(work.minds);
  stats_.memories += work.memories.size();
  stats_.reflections += work.reflections;
  stats_.plans += work.plans;
  committed_memories_ = std::move(work.memories);
  logger()->debug("tick {}: committed {} events", now, payload->events.size());
  return payload;
}

std::vector<TickScheduler::Frame> TickScheduler::perceive_(Tick now, TickWork& work) {
  const auto& frozen = setup_.state;

  std::vector<Frame> frames;
  frames.reserve(frozen.agents.size());

  for (const auto& [id, a] : frozen.agents) {
    auto& mind = work.minds.at(id);
    if (collab_.planner && mind.plan.expired(now)) plan_(work, a, now);

    Frame f{};
    f.agent = id;
    f.was_in_transit = a.in_transit();
    f.slice = perceive(frozen, id, now);
    f.targets = compute_valid_targets(frozen, setup_.graph, id);
    if (const auto* step = mind.plan.active(now)) f.plan = *step;

    // Retrieval refreshes last_accessed_at, so it runs here in agent order
    // rather than inside the (unordered) decide phase.
    if (!mind.memory.empty()) {
      const auto* loc = frozen.tree.find(a.location_id);
      std::string query = a.name + " at " + (loc ? loc->name : a.location_id) + ".";
      if (f.plan) query += " " + f.plan->description;
      if (!a.goal.empty()) query += " " + a.goal;
      const auto q = embedder_.embed(query);
      f.excerpt = mind.memory.retrieve(q, now);
    }

    frames.push_back(std::move(f));
  }

  logger()->debug("tick {}: perceived {} agents", now, frames.size());
  return frames;
}

void TickScheduler::plan_(TickWork& work, const AgentRuntime& agent, Tick now) {
  std::vector<PlanItem> day;
  try {
    day = collab_.planner->plan_day(agent, setup_.state.tree, now);
  } catch (const std::exception& e) {
    // No plan this tick; asked again next tick.
    ++stats_.plan_failures;
    logger()->warn("tick {}: planner failed for {}: {}", now, agent.id, e.what());
    return;
  }

  if (day.size() > cfg_.planning.max_items) day.resize(cfg_.planning.max_items);
  if (const auto why = plan_problem(day, now); !why.empty()) {
    ++stats_.plan_failures;
    logger()->warn("tick {}: unusable plan for {}: {}", now, agent.id, why);
    return;
  }

  work.minds.at(agent.id).plan = AgentPlan{day, cfg_.planning.step_ticks};
  for (const auto& item : day) append_memory_(work, agent.id, item.description, MemoryKind::Plan, now);
  ++work.plans;
  logger()->debug("tick {}: {} planned {} items until tick {}", now, agent.id, day.size(), day.back().end_tick);
}

void TickScheduler::decide_(std::vector<Frame>& frames, Tick now) {
  using Clock = std::chrono::steady_clock;

  // Each call owns a copy of the request, so a call that outlives its deadline
  // never reads kernel state. An agent whose abandoned call is still running
  // gets no new call until it returns.
  auto launch = [&](const Frame& f) -> std::optional<std::future<Action>> {
    if (auto it = abandoned_.find(f.agent); it != abandoned_.end()) {
      if (it->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return std::nullopt;
      abandoned_.erase(it);
    }

    DecisionRequest req{};
    req.tick = now;
    req.agent_id = f.agent;
    req.agent_name = setup_.state.agent(f.agent).name;
    req.perception = f.slice;
    req.belief = mind_(f.agent).belief;
    req.memory_excerpt = f.excerpt;
    req.valid_targets = f.targets;
    req.plan = f.plan;

    return pool_->submit([policy = collab_.policy, req = std::move(req)]() { return policy->decide(req); });
  };

  auto collect = [&](Frame& f, std::optional<std::future<Action>>& fut, Clock::time_point deadline) {
    auto& d = f.decision;
    ++stats_.decisions;

    if (!fut) {
      d.outcome = DecisionOutcome::Busy;
      ++stats_.busy;
      logger()->warn("tick {}: policy for {} is still busy with an earlier call; using IDLE", now, f.agent);
    } else if (fut->wait_until(deadline) != std::future_status::ready) {
      d.outcome = DecisionOutcome::TimedOut;
      ++stats_.timeouts;
      abandoned_[f.agent] = std::move(*fut);
      logger()->warn("tick {}: policy for {} timed out after {} ms; using IDLE",
                     now, f.agent, cfg_.decide_timeout.count());
    } else {
      try {
        d.proposed = fut->get();
      } catch (const std::exception& e) {
        d.outcome = DecisionOutcome::Failed;
        ++stats_.policy_errors;
        logger()->warn("tick {}: policy for {} failed ({}); using IDLE", now, f.agent, e.what());
      }
    }

    if (d.outcome != DecisionOutcome::Ok && cfg_.halt_on_policy_error) {
      throw PolicyError("decision policy " + std::string(to_string(d.outcome)) + " for agent " + f.agent);
    }
  };

  if (cfg_.parallel_decide) {
    std::vector<std::optional<std::future<Action>>> futures;
    futures.reserve(frames.size());
    for (const auto& f : frames) futures.push_back(launch(f));

    const auto deadline = Clock::now() + cfg_.decide_timeout;
    for (std::size_t i = 0; i < frames.size(); ++i) collect(frames[i], futures[i], deadline);
  } else {
    for (auto& f : frames) {
      auto fut = launch(f);
      collect(f, fut, Clock::now() + cfg_.decide_timeout);
    }
  }
}

void TickScheduler::validate_(std::vector<Frame>& frames) {
  for (auto& f : frames) {
    auto& d = f.decision;
    const auto check = validate_action(d.proposed, f.targets);
    d.applied = check.action;
    d.reason = check.reason;

    if (!check.accept) {
      ++stats_.rejected;
      logger()->warn("tick {}: {} action {} rejected ({}); using IDLE",
                     tick_, f.agent, to_string(type_of(d.proposed)), to_string(check.reason));
    }
  }
}

std::vector<Event> TickScheduler::execute_(const std::vector<Frame>& frames, CanonicalWorldState& working) {
  std::vector<Event> events;

  // Ascending agent id; later agents see what earlier ones did to `working`.
  for (const auto& f : frames) {
    if (f.was_in_transit) {
      if (auto ev = transit_.advance(working, f.agent)) events.push_back(std::move(*ev));
      continue;
    }

    std::visit([&](const auto& a) {
      using T = std::decay_t<decltype(a)>;

      if constexpr (std::is_same_v<T, Move>) {
        if (!transit_.begin(working, f.agent, a.to_location_id)) {
          logger()->warn("tick {}: {} could not start travel to {}", tick_, f.agent, a.to_location_id);
        }
      } else if constexpr (std::is_same_v<T, Interact>) {
        auto ev = executor_.execute(working, f.agent, a.object_id, a.verb);
        if (!ev.success) ++stats_.failed_transitions;
        events.push_back(std::move(ev));
      } else if constexpr (std::is_same_v<T, Say>) {
        SayEvent ev{};
        ev.from_agent = f.agent;
        ev.to_agent = a.to_agent_id;
        ev.utterance = a.utterance;
        ev.area_id = working.agent(f.agent).location_id;
        events.push_back(std::move(ev));
      }
    }, f.decision.applied);
  }
  return events;
}

void TickScheduler::remember_(const std::vector<Frame>& frames, const std::vector<Event>& events, Tick now,
                              TickWork& work) {
  const auto& names = work.state.tree;
  const auto& narration = *collab_.narration;

  for (const auto& f : frames) {
    // What the agent saw at the start of the tick.
    append_memory_(work, f.agent, narration.observation(f.slice, names), MemoryKind::Observation, now);

    for (const auto& ev : events) {
      std::visit([&](const auto& e) {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, MoveEvent> || std::is_same_v<T, ObjectStateChanged>) {
          if (e.agent_id == f.agent) append_memory_(work, f.agent, narration.narrate(ev, names), MemoryKind::Action, now);
        } else if constexpr (std::is_same_v<T, SayEvent>) {
          if (e.from_agent == f.agent) {
            append_memory_(work, f.agent, narration.narrate(ev, names), MemoryKind::Action, now);
          } else if (e.to_agent == f.agent) {
            append_memory_(work, f.agent, narration.heard(e, names), MemoryKind::Observation, now);
          }
        }
      }, ev);
    }

    auto& mind = work.minds.at(f.agent);
    if (!mind.reflection.should_reflect()) continue;

    try {
      const auto ids = mind.reflection.reflect(mind.memory, *collab_.insights, rater_, embedder_, now);
      for (const auto id : ids) work.memories.emplace_back(f.agent, *mind.memory.find(id));
      ++work.reflections;
      logger()->info("tick {}: {} reflected ({} insights)", now, f.agent, ids.size());
    } catch (const std::exception& e) {
      // Counter untouched: the next tick tries again.
      logger()->warn("tick {}: insight generator failed for {}: {}", now, f.agent, e.what());
    }
  }
}

// Plan records are remembered but do not count toward reflection.
void TickScheduler::append_memory_(TickWork& work, const AgentId& id, std::string description, MemoryKind kind,
                                   Tick now) {
  auto& mind = work.minds.at(id);
  const int importance = rater_.rate(description);
  auto embedding = embedder_.embed(description);
  const auto& rec = mind.memory.append(std::move(description), kind, importance, std::move(embedding), now);
  if (kind != MemoryKind::Plan) mind.reflection.observe(rec);
  work.memories.emplace_back(id, rec);
}

void TickScheduler::publish_(const std::shared_ptr<const TickPayload>& payload) {
  for (const auto& sink : sinks_) {
    try {
      sink->on_tick(payload);
    } catch (const std::exception& e) {
      ++stats_.sink_errors;
      logger()->warn("tick {}: sink failed: {}", payload->tick, e.what());
    }
  }

  for (const auto& sink : memory_sinks_) {
    for (const auto& [agent, rec] : committed_memories_) {
      try {
        sink->on_memory(agent, rec);
      } catch (const std::exception& e) {
        ++stats_.sink_errors;
        logger()->warn("tick {}: memory sink failed: {}", payload->tick, e.what());
      }
    }
  }
  committed_memories_.clear();
}

TickScheduler::AgentMind& TickScheduler::mind_(const AgentId& id) {
  auto it = minds_.find(id);
  if (it == minds_.end()) throw UnknownNode(id);
  return it->second;
}

const TickScheduler::AgentMind& TickScheduler::mind_(const AgentId& id) const {
  auto it = minds_.find(id);
  if (it == minds_.end()) throw UnknownNode(id);
  return it->second;
}

const BeliefState& TickScheduler::belief(const AgentId& id) const { return mind_(id).belief; }
const MemoryStream& TickScheduler::memory(const AgentId& id) const { return mind_(id).memory; }
const ReflectionTracker& TickScheduler::reflection(const AgentId& id) const { return mind_(id).reflection; }
const AgentPlan& TickScheduler::plan(const AgentId& id) const { return mind_(id).plan; }

} // namespace lsim
