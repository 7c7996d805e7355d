#include <gtest/gtest.h>

#include <stdexcept>

#include "lsim/errors.hpp"
#include "lsim/planning.hpp"
#include "test_support.hpp"

using lsim::PlanItem;
using lsim::agents::ScriptedPolicy;
using namespace lsim::testing;

namespace {

PlanItem item(lsim::Tick from, lsim::Tick to, const std::string& where) {
  return PlanItem{from, to, where, "be at " + where};
}

class BrokenPlanner final : public lsim::Planner {
public:
  std::vector<PlanItem> plan_day(const lsim::AgentRuntime&, const lsim::WorldTree&, lsim::Tick) override {
    throw std::runtime_error("planner offline");
  }
};

// Returns the same items every time, whatever the start tick.
class FixedPlanner final : public lsim::Planner {
public:
  explicit FixedPlanner(std::vector<PlanItem> items) : items_(std::move(items)) {}

  std::vector<PlanItem> plan_day(const lsim::AgentRuntime&, const lsim::WorldTree&, lsim::Tick) override {
    return items_;
  }

private:
  std::vector<PlanItem> items_;
};

std::size_t plan_records(const lsim::MemoryStream& m) {
  std::size_t n = 0;
  for (const auto& r : m.records()) n += (r.kind == lsim::MemoryKind::Plan);
  return n;
}

lsim::Collaborators with_route_planner(std::shared_ptr<ScriptedPolicy> policy, lsim::Tick item_ticks) {
  auto c = collaborators(std::move(policy));
  lsim::agents::RoutePlannerConfig cfg{};
  cfg.routes["a"] = {"x", "y"};
  cfg.item_ticks = item_ticks;
  c.planner = std::make_shared<lsim::agents::RoutePlanner>(cfg);
  return c;
}

} // namespace

TEST(Planning, PlanProblemNamesTheFirstDefect) {
  EXPECT_EQ(lsim::plan_problem({item(0, 2, "x"), item(2, 4, "y")}, 0), "");
  EXPECT_EQ(lsim::plan_problem({item(0, 2, "x"), item(5, 6, "y")}, 3), "");  // gaps are fine

  EXPECT_NE(lsim::plan_problem({}, 0), "");
  EXPECT_NE(lsim::plan_problem({item(2, 2, "x")}, 0), "");
  EXPECT_NE(lsim::plan_problem({item(0, 3, "x"), item(2, 4, "y")}, 0), "");
  EXPECT_NE(lsim::plan_problem({item(0, 2, "")}, 0), "");
  EXPECT_NE(lsim::plan_problem({item(0, 2, "x")}, 2), "");  // already over
}

TEST(Planning, DecomposeCutsItemsIntoSteps) {
  const auto steps = lsim::decompose({item(0, 4, "x"), item(4, 5, "y")}, 3);
  ASSERT_EQ(steps.size(), 3u);
  EXPECT_EQ(steps[0], (PlanItem{0, 3, "x", "be at x"}));
  EXPECT_EQ(steps[1], (PlanItem{3, 4, "x", "be at x"}));
  EXPECT_EQ(steps[2], (PlanItem{4, 5, "y", "be at y"}));

  EXPECT_THROW(lsim::decompose({item(0, 1, "x")}, 0), lsim::ConfigError);
}

TEST(Planning, ActiveStepAndExpiry) {
  const lsim::AgentPlan plan{{item(2, 4, "x"), item(6, 7, "y")}, 1};
  EXPECT_EQ(plan.steps().size(), 3u);

  EXPECT_EQ(plan.active(1), nullptr);
  ASSERT_NE(plan.active(3), nullptr);
  EXPECT_EQ(*plan.active(3), (PlanItem{3, 4, "x", "be at x"}));
  EXPECT_EQ(plan.active(5), nullptr);
  ASSERT_NE(plan.active(6), nullptr);
  EXPECT_EQ(plan.active(6)->location_id, "y");

  EXPECT_FALSE(plan.expired(6));
  EXPECT_TRUE(plan.expired(7));
  EXPECT_TRUE(lsim::AgentPlan{}.expired(0));
}

TEST(RoutePlanner, OneItemPerStopBackToBack) {
  const auto setup = lsim::make_demo_world();
  lsim::agents::RoutePlannerConfig cfg{};
  cfg.routes = lsim::demo_routes();
  lsim::agents::RoutePlanner planner{cfg};

  const auto day = planner.plan_day(setup.state.agent("ada"), setup.state.tree, 10);
  ASSERT_EQ(day.size(), 3u);  // cafe, park, street
  EXPECT_EQ(day[0], (PlanItem{10, 14, "cafe", "Ada starts the day at the cafe."}));
  EXPECT_EQ(day[1].start_tick, 14);
  EXPECT_EQ(day[1].location_id, "park");
  EXPECT_EQ(day[2], (PlanItem{18, 22, "street", "Ada wraps up the day at Main Street."}));
  EXPECT_EQ(lsim::plan_problem(day, 10), "");

  // No route: stay where you are.
  lsim::agents::RoutePlanner idle{lsim::agents::RoutePlannerConfig{}};
  const auto stay = idle.plan_day(setup.state.agent("cleo"), setup.state.tree, 0);
  ASSERT_EQ(stay.size(), 1u);
  EXPECT_EQ(stay[0].location_id, "cafe");

  lsim::agents::RoutePlannerConfig bad{};
  bad.item_ticks = 0;
  EXPECT_THROW(lsim::agents::RoutePlanner{bad}, lsim::ConfigError);
}

TEST(Planning, PlansAreRememberedOnFirstTickAndOnExpiry) {
  auto policy = std::make_shared<ScriptedPolicy>();
  auto cfg = quiet_config();
  cfg.reflection.threshold = 1000.0;
  lsim::TickScheduler s{two_rooms({"a"}), with_route_planner(policy, 2), cfg};

  s.step();
  EXPECT_EQ(plan_records(s.memory("a")), 2u);
  EXPECT_EQ(s.plan("a").day().back().end_tick, 4);
  for (const auto& r : s.memory("a").records()) {
    if (r.kind == lsim::MemoryKind::Plan) EXPECT_EQ(r.created_at, 0);
  }

  s.run(3);  // ticks 1..3 stay within the plan
  EXPECT_EQ(plan_records(s.memory("a")), 2u);

  s.step();  // tick 4: the day is over, plan again
  EXPECT_EQ(plan_records(s.memory("a")), 4u);
  EXPECT_EQ(s.plan("a").day().front().start_tick, 4);
  EXPECT_EQ(s.memory("a").records().back().kind, lsim::MemoryKind::Observation);
  EXPECT_EQ(s.stats().plans, 2u);
}

TEST(Planning, ActiveStepReachesPolicyPayloadAndRetrieval) {
  auto policy = std::make_shared<ScriptedPolicy>();
  lsim::TickScheduler s{two_rooms({"a", "b"}), with_route_planner(policy, 2), quiet_config()};

  const auto p0 = s.step();
  s.step();
  const auto p2 = s.step();

  const auto seen = policy->requests_for("a");
  ASSERT_EQ(seen.size(), 3u);
  ASSERT_TRUE(seen[0].plan.has_value());
  EXPECT_EQ(*seen[0].plan, (PlanItem{0, 1, "x", "a starts the day at room X."}));
  ASSERT_TRUE(seen[2].plan.has_value());
  EXPECT_EQ(*seen[2].plan, (PlanItem{2, 3, "y", "a wraps up the day at room Y."}));

  // The plan records exist before the first decision and are retrieved for it.
  ASSERT_EQ(seen[0].memory_excerpt.size(), 2u);
  EXPECT_EQ(seen[0].memory_excerpt[0].kind, lsim::MemoryKind::Plan);

  EXPECT_EQ(p0->plans.at("a").location_id, "x");
  EXPECT_EQ(p2->plans.at("a").location_id, "y");
  // b has no route, so it plans to stay in x.
  EXPECT_EQ(p2->plans.at("b").location_id, "x");
}

TEST(Planning, PlanRecordsDoNotFeedReflection) {
  auto policy = std::make_shared<ScriptedPolicy>();
  lsim::TickScheduler s{two_rooms({"a"}), with_route_planner(policy, 2), quiet_config()};

  s.step();
  EXPECT_EQ(s.memory("a").size(), 3u);                // two plan items + one observation
  EXPECT_DOUBLE_EQ(s.reflection("a").since_last(), 3.0);  // the observation only
}

TEST(Planning, PlannerFailuresLeaveAgentsWithoutPlan) {
  auto policy = std::make_shared<ScriptedPolicy>();
  auto c = collaborators(policy);
  c.planner = std::make_shared<BrokenPlanner>();
  lsim::TickScheduler s{two_rooms({"a"}), c, quiet_config()};

  s.run(3);
  EXPECT_EQ(s.stats().plan_failures, 3u);  // asked again every tick
  EXPECT_EQ(s.stats().plans, 0u);
  EXPECT_EQ(plan_records(s.memory("a")), 0u);
  EXPECT_FALSE(policy->requests_for("a")[2].plan.has_value());
  EXPECT_FALSE(s.halted());
}

TEST(Planning, UnusablePlansAreRefusedAndLongOnesTruncated) {
  auto policy = std::make_shared<ScriptedPolicy>();
  auto c = collaborators(policy);
  c.planner = std::make_shared<FixedPlanner>(std::vector<PlanItem>{item(0, 3, "x"), item(2, 4, "y")});
  lsim::TickScheduler overlapping{two_rooms({"a"}), c, quiet_config()};
  overlapping.step();
  EXPECT_EQ(overlapping.stats().plan_failures, 1u);
  EXPECT_TRUE(overlapping.plan("a").day().empty());

  c.planner = std::make_shared<FixedPlanner>(
      std::vector<PlanItem>{item(0, 1, "x"), item(1, 2, "y"), item(2, 3, "x")});
  auto cfg = quiet_config();
  cfg.planning.max_items = 2;
  lsim::TickScheduler truncated{two_rooms({"a"}), c, cfg};
  truncated.step();
  EXPECT_EQ(truncated.plan("a").day().size(), 2u);
  EXPECT_EQ(plan_records(truncated.memory("a")), 2u);
}

TEST(Planning, RejectsInvalidConfig) {
  auto policy = std::make_shared<ScriptedPolicy>();

  auto cfg = quiet_config();
  cfg.planning.step_ticks = 0;
  EXPECT_THROW((lsim::TickScheduler{two_rooms({"a"}), collaborators(policy), cfg}), lsim::ConfigError);

  cfg = quiet_config();
  cfg.planning.max_items = 0;
  EXPECT_THROW((lsim::TickScheduler{two_rooms({"a"}), collaborators(policy), cfg}), lsim::ConfigError);
}
