#include <gtest/gtest.h>

#include <cmath>

#include "lsim/agents/heuristics.hpp"
#include "lsim/agents/patrol_policy.hpp"
#include "lsim/agents/scripted_policy.hpp"
#include "lsim/perception.hpp"
#include "lsim/world_builder.hpp"

namespace {

lsim::DecisionRequest request_for(const lsim::WorldSetup& setup, const lsim::AgentId& id, lsim::Tick tick) {
  lsim::DecisionRequest req{};
  req.tick = tick;
  req.agent_id = id;
  req.agent_name = setup.state.agent(id).name;
  req.perception = lsim::perceive(setup.state, id, tick);
  req.valid_targets = lsim::compute_valid_targets(setup.state, setup.graph, id);
  return req;
}

} // namespace

TEST(ScriptedPolicy, ReplaysQueueThenIdles) {
  const auto setup = lsim::make_demo_world();
  lsim::agents::ScriptedPolicy p;
  p.push_all("ada", {lsim::Move{"cafe"}, lsim::Say{"byron", "hi"}});

  EXPECT_EQ(p.decide(request_for(setup, "ada", 0)), lsim::Action{lsim::Move{"cafe"}});
  EXPECT_EQ(p.decide(request_for(setup, "byron", 0)), lsim::Action{lsim::Idle{}});
  EXPECT_EQ(p.decide(request_for(setup, "ada", 1)), (lsim::Action{lsim::Say{"byron", "hi"}}));
  EXPECT_EQ(p.decide(request_for(setup, "ada", 2)), lsim::Action{lsim::Idle{}});

  EXPECT_EQ(p.pending("ada"), 0u);
  const auto seen = p.requests_for("ada");
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[2].tick, 2);
}

TEST(PatrolPolicy, CyclesThroughPhases) {
  const auto setup = lsim::make_demo_world();
  lsim::agents::PatrolPolicyConfig cfg{};
  cfg.routes["cleo"] = {"cafe", "park"};
  cfg.routes["ada"] = {"cafe"};
  lsim::agents::PatrolPolicy p{cfg};

  // Standing in the cafe: the next stop is the park.
  EXPECT_EQ(p.decide(request_for(setup, "cleo", 0)), lsim::Action{lsim::Move{"park"}});
  // First visible object is the coffee machine (a switch).
  EXPECT_EQ(p.decide(request_for(setup, "cleo", 1)),
            (lsim::Action{lsim::Interact{"coffee_machine", lsim::Verb::Use}}));
  // Nobody else in the cafe.
  EXPECT_EQ(p.decide(request_for(setup, "cleo", 2)), lsim::Action{lsim::Idle{}});
  EXPECT_EQ(p.decide(request_for(setup, "ada", 2)), (lsim::Action{lsim::Say{"byron", "hello"}}));
  EXPECT_EQ(p.decide(request_for(setup, "ada", 3)), lsim::Action{lsim::Idle{}});
  // No route: stays put.
  EXPECT_EQ(p.decide(request_for(setup, "byron", 4)), lsim::Action{lsim::Idle{}});
}

TEST(PatrolPolicy, IdlesInTransit) {
  const auto setup = lsim::make_demo_world();
  lsim::agents::PatrolPolicyConfig cfg{};
  cfg.routes["ada"] = {"cafe"};
  lsim::agents::PatrolPolicy p{cfg};

  auto req = request_for(setup, "ada", 0);
  req.valid_targets = lsim::ValidTargets{};
  req.valid_targets.in_transit = true;
  EXPECT_EQ(p.decide(req), lsim::Action{lsim::Idle{}});
}

TEST(PatrolPolicy, ActivePlanStepWinsOverRoute) {
  const auto setup = lsim::make_demo_world();
  lsim::agents::PatrolPolicyConfig cfg{};
  cfg.routes["cleo"] = {"cafe", "park"};
  lsim::agents::PatrolPolicy p{cfg};

  auto req = request_for(setup, "cleo", 0);
  req.plan = lsim::PlanItem{0, 4, "kitchen", "Cleo fetches milk."};
  EXPECT_EQ(p.decide(req), lsim::Action{lsim::Move{"kitchen"}});

  // Already where the plan wants her.
  req.plan->location_id = "cafe";
  EXPECT_EQ(p.decide(req), lsim::Action{lsim::Idle{}});

  // Plan location not offered: back to the route.
  req.plan->location_id = "kitchen";
  req.valid_targets.locations.erase("kitchen");
  EXPECT_EQ(p.decide(req), lsim::Action{lsim::Move{"park"}});
}

TEST(HashEmbedder, DeterministicUnitVectors) {
  lsim::agents::HashEmbedder e{8};
  const auto a = e.embed("Ada drinks coffee");
  const auto b = e.embed("ada DRINKS coffee!");
  ASSERT_EQ(a.size(), 8u);
  EXPECT_EQ(a, b);

  double norm = 0.0;
  for (double x : a) norm += x * x;
  EXPECT_NEAR(std::sqrt(norm), 1.0, 1e-12);

  const auto zero = e.embed("   ");
  EXPECT_EQ(zero, std::vector<double>(8, 0.0));
  EXPECT_EQ(lsim::agents::HashEmbedder::fnv1a(""), 0xcbf29ce484222325ULL);
}

TEST(KeywordImportanceRater, AddsKeywordWeightsAndClamps) {
  lsim::agents::KeywordImportanceRater r{2, {{"fire", 9}, {"said", 2}}};
  EXPECT_EQ(r.rate("nothing here"), 2);
  EXPECT_EQ(r.rate("Ada said hello"), 4);
  EXPECT_EQ(r.rate("fire! Ada said fire"), 10);

  lsim::agents::KeywordImportanceRater low{-5, {}};
  EXPECT_EQ(low.rate("anything"), 1);
}

TEST(TemplateInsightGenerator, CitesTheRecordsItSummarises) {
  lsim::MemoryStream m;
  for (int i = 0; i < 5; ++i) m.append("m" + std::to_string(i), lsim::MemoryKind::Observation, 3, {}, i);

  lsim::agents::TemplateInsightGenerator g;
  const auto out = g.reflect(m.records());
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].supporting_ids, (std::set<lsim::MemoryId>{1, 2}));
  EXPECT_EQ(out[1].supporting_ids, (std::set<lsim::MemoryId>{3, 4}));
  EXPECT_EQ(out[2].supporting_ids, (std::set<lsim::MemoryId>{4, 5}));
  EXPECT_EQ(out[0].text, "Earlier: m0; m1");

  EXPECT_TRUE(g.reflect({}).empty());
}
