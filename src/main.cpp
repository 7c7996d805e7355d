#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "lsim/agents/heuristics.hpp"
#include "lsim/agents/patrol_policy.hpp"
#include "lsim/log.hpp"
#include "lsim/memory_log.hpp"
#include "lsim/narration.hpp"
#include "lsim/replay_log.hpp"
#include "lsim/scheduler.hpp"
#include "lsim/world_builder.hpp"

namespace {

// Collects every event as narrated text while the run progresses.
class EventCollector final : public lsim::TickSink {
public:
  explicit EventCollector(std::shared_ptr<const lsim::NarrationRenderer> narration)
    : narration_(std::move(narration)) {}

  void on_tick(std::shared_ptr<const lsim::TickPayload> p) override {
    for (const auto& ev : p->events) {
      rows_.push_back(Row{p->tick, std::string(lsim::to_string(lsim::type_of(ev))),
                          narration_->narrate(ev, p->state.world.tree)});
    }
  }

  struct Row {
    lsim::Tick tick{};
    std::string type{};
    std::string text{};
  };

  const std::vector<Row>& rows() const noexcept { return rows_; }

private:
  std::shared_ptr<const lsim::NarrationRenderer> narration_;
  std::vector<Row> rows_{};
};

} // namespace

static void write_events_csv(const std::string& path, const std::vector<EventCollector::Row>& rows) {
  std::ofstream f(path);
  f << "tick,type,text\n";
  for (const auto& r : rows) {
    std::string text = r.text;
    for (std::size_t i = 0; (i = text.find('"', i)) != std::string::npos; i += 2) text.insert(i, "\"");
    f << r.tick << "," << r.type << ",\"" << text << "\"\n";
  }
}

static void usage() {
  std::cout
    << "Usage:\n"
    << "  lsim_cli [seed] [ticks] [replay_path] [memory_log_path]\n";
}

int main(int argc, char** argv) {
  if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
    usage();
    return 0;
  }

  uint64_t seed = 1;
  std::size_t ticks = 48;
  std::string replay_path;
  std::string memory_log_path;

  try {
    if (argc >= 2) seed = static_cast<uint64_t>(std::stoull(argv[1]));
    if (argc >= 3) ticks = static_cast<std::size_t>(std::stoull(argv[2]));
  } catch (const std::exception&) {
    usage();
    return 1;
  }
  if (argc >= 4) replay_path = argv[3];
  if (argc >= 5) memory_log_path = argv[4];

  lsim::configure_logging(spdlog::level::info);

  lsim::SchedulerConfig cfg{};
  cfg.dynamics.seed = seed;

  lsim::agents::PatrolPolicyConfig patrol{};
  patrol.routes = lsim::demo_routes();

  auto narration = std::make_shared<const lsim::NarrationRenderer>();

  lsim::Collaborators collab{};
  collab.policy = std::make_shared<lsim::agents::PatrolPolicy>(patrol);
  collab.rater = std::make_shared<lsim::agents::KeywordImportanceRater>();
  collab.embedder = std::make_shared<lsim::agents::HashEmbedder>();
  collab.insights = std::make_shared<lsim::agents::TemplateInsightGenerator>();
  collab.narration = narration;

  lsim::agents::RoutePlannerConfig planning{};
  planning.routes = lsim::demo_routes();
  collab.planner = std::make_shared<lsim::agents::RoutePlanner>(planning);

  try {
    lsim::TickScheduler sched{lsim::make_demo_world(), std::move(collab), cfg};

    auto events = std::make_shared<EventCollector>(narration);
    sched.add_sink(events);
    if (!replay_path.empty()) {
      sched.add_sink(std::make_shared<lsim::ReplayWriter>(
          replay_path, std::map<std::string, std::string>{{"seed", std::to_string(seed)},
                                                         {"world", "demo"}}));
    }
    if (!memory_log_path.empty()) sched.add_memory_sink(std::make_shared<lsim::MemoryLogWriter>(memory_log_path));

    sched.run(ticks);
    write_events_csv("events.csv", events->rows());

    const auto& s = sched.stats();
    std::cout << "RUN COMPLETE "
              << "ticks=" << s.ticks
              << " events=" << events->rows().size()
              << " rejected=" << s.rejected
              << " timeouts=" << s.timeouts
              << " failed_transitions=" << s.failed_transitions
              << " memories=" << s.memories
              << " reflections=" << s.reflections
              << " plans=" << s.plans
              << " busy=" << s.busy
              << " weather=" << sched.state().dynamics.weather
              << "\n";
  } catch (const std::exception& e) {
    std::cerr << "lsim_cli: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
