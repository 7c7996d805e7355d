#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "httplib.h"

#include "lsim/agents/heuristics.hpp"
#include "lsim/agents/patrol_policy.hpp"
#include "lsim/json.hpp"
#include "lsim/live_world.hpp"
#include "lsim/log.hpp"
#include "lsim/world_builder.hpp"

namespace {

// Largest batch a single POST /api/step may request.
constexpr long long kMaxStepsPerRequest = 1000;

} // namespace

// ---------------- Helpers ----------------
static long long get_ll(const httplib::Request& req, const char* key, long long def = 0) {
  if (!req.has_param(key)) return def;
  try { return std::stoll(req.get_param_value(key)); }
  catch (const std::exception&) { return def; }
}

static void set_no_cache(httplib::Response& res) {
  res.set_header("Cache-Control", "no-store, max-age=0");
  res.set_header("Pragma", "no-cache");
}

int main(int argc, char** argv) {
  const int port = (argc >= 2) ? std::stoi(argv[1]) : 8080;
  const uint64_t seed = (argc >= 3) ? static_cast<uint64_t>(std::stoull(argv[2])) : 1;

  lsim::configure_logging(spdlog::level::info);

  lsim::SchedulerConfig cfg{};
  cfg.dynamics.seed = seed;

  lsim::Collaborators collab{};
  lsim::agents::PatrolPolicyConfig patrol{};
  patrol.routes = lsim::demo_routes();
  collab.policy = std::make_shared<lsim::agents::PatrolPolicy>(patrol);
  collab.rater = std::make_shared<lsim::agents::KeywordImportanceRater>();
  collab.embedder = std::make_shared<lsim::agents::HashEmbedder>();
  collab.insights = std::make_shared<lsim::agents::TemplateInsightGenerator>();
  lsim::agents::RoutePlannerConfig planning{};
  planning.routes = lsim::demo_routes();
  collab.planner = std::make_shared<lsim::agents::RoutePlanner>(planning);

  lsim::LiveWorld world{lsim::make_demo_world(), std::move(collab), cfg};

  httplib::Server svr;

  // Allow typing "exit" or "quit" to stop cleanly
  std::thread stdin_thread([&]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "exit" || line == "quit") {
        svr.stop();
        break;
      }
    }
  });

  // ---- APIs ----
  svr.Get("/api/tick", [&](const httplib::Request&, httplib::Response& res) {
    const auto p = world.latest();
    set_no_cache(res);
    res.set_content(p ? lsim::to_json(*p) : std::string("null"), "application/json");
  });

  svr.Get("/api/agents", [&](const httplib::Request&, httplib::Response& res) {
    const auto rows = world.agents();

    std::ostringstream oss;
    oss << "{";
    oss << "\"tick\":" << world.current_tick() << ",";
    oss << "\"agents\":[";
    for (std::size_t i = 0; i < rows.size(); ++i) {
      const auto& r = rows[i];
      if (i) oss << ",";
      oss << "{";
      oss << "\"agent\":" << lsim::to_json(r.runtime) << ",";
      oss << "\"memories\":" << r.memories << ",";
      oss << "\"beliefs\":" << r.beliefs << ",";
      oss << "\"reflections\":" << r.reflections;
      oss << "}";
    }
    oss << "]";
    oss << "}";

    set_no_cache(res);
    res.set_content(oss.str(), "application/json");
  });

  svr.Get("/api/stats", [&](const httplib::Request&, httplib::Response& res) {
    const auto s = world.stats();

    std::ostringstream oss;
    oss << "{";
    oss << "\"ticks\":" << s.ticks << ",";
    oss << "\"decisions\":" << s.decisions << ",";
    oss << "\"rejected\":" << s.rejected << ",";
    oss << "\"timeouts\":" << s.timeouts << ",";
    oss << "\"busy\":" << s.busy << ",";
    oss << "\"policy_errors\":" << s.policy_errors << ",";
    oss << "\"failed_transitions\":" << s.failed_transitions << ",";
    oss << "\"memories\":" << s.memories << ",";
    oss << "\"reflections\":" << s.reflections << ",";
    oss << "\"plans\":" << s.plans << ",";
    oss << "\"plan_failures\":" << s.plan_failures << ",";
    oss << "\"halted\":" << (world.halted() ? "true" : "false");
    oss << "}";

    set_no_cache(res);
    res.set_content(oss.str(), "application/json");
  });

  svr.Post("/api/step", [&](const httplib::Request& req, httplib::Response& res) {
    const auto n = get_ll(req, "n", 1);
    if (n < 1 || n > kMaxStepsPerRequest) {
      res.status = 400;
      res.set_content("{\"error\":\"n must be within [1," + std::to_string(kMaxStepsPerRequest) + "]\"}",
                      "application/json");
      return;
    }

    const auto done = world.step(static_cast<std::size_t>(n));

    std::ostringstream oss;
    oss << "{";
    oss << "\"requested\":" << n << ",";
    oss << "\"stepped\":" << done << ",";
    oss << "\"tick\":" << world.current_tick() << ",";
    oss << "\"halted\":" << (world.halted() ? "true" : "false");
    oss << "}";
    set_no_cache(res);
    res.set_content(oss.str(), "application/json");
  });

  std::cout << "LSIM gateway listening on http://localhost:" << port << "/api/tick\n";
  std::cout << "POST /api/step?n=1 advances the simulation.\n";
  std::cout << "Type 'exit' (or 'quit') then press Enter to stop cleanly.\n";

  svr.listen("0.0.0.0", port);

  if (stdin_thread.joinable()) stdin_thread.join();
  return 0;
}
