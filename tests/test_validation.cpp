#include <gtest/gtest.h>

#include "lsim/perception.hpp"
#include "lsim/transit.hpp"
#include "lsim/validation.hpp"
#include "lsim/world_builder.hpp"

namespace {

lsim::ValidTargets targets() {
  lsim::ValidTargets t{};
  t.locations = {"park"};
  t.objects = {"lamp"};
  t.agents = {"byron"};
  return t;
}

} // namespace

TEST(Validation, AcceptedActionsPassThroughUnchanged) {
  const auto t = targets();
  const std::vector<lsim::Action> actions{
    lsim::Idle{},
    lsim::Move{"park"},
    lsim::Interact{"lamp", lsim::Verb::Use},
    lsim::Say{"byron", "hi"},
  };

  for (const auto& a : actions) {
    const auto d = lsim::validate_action(a, t);
    EXPECT_TRUE(d.accept);
    EXPECT_EQ(d.reason, lsim::RejectReason::None);
    EXPECT_EQ(d.action, a);
    EXPECT_EQ(lsim::validate_action(d.action, t).action, a);
  }
}

TEST(Validation, InvalidActionsBecomeIdle) {
  const auto t = targets();

  auto check = [&](const lsim::Action& a, lsim::RejectReason why) {
    const auto d = lsim::validate_action(a, t);
    EXPECT_FALSE(d.accept);
    EXPECT_EQ(d.reason, why);
    EXPECT_EQ(d.action, lsim::Action{lsim::Idle{}});
  };

  check(lsim::Move{"moon"}, lsim::RejectReason::TargetNotReachable);
  check(lsim::Interact{"fridge", lsim::Verb::Take}, lsim::RejectReason::UnknownObject);
  check(lsim::Say{"cleo", "hi"}, lsim::RejectReason::UnknownAgent);
}

TEST(Validation, EmptyUtteranceToValidListenerIsAccepted) {
  const auto t = targets();
  const lsim::Action quiet = lsim::Say{"byron", ""};

  const auto d = lsim::validate_action(quiet, t);
  EXPECT_TRUE(d.accept);
  EXPECT_EQ(d.reason, lsim::RejectReason::None);
  EXPECT_EQ(d.action, quiet);
}

TEST(Validation, IdleIsAlwaysValidEvenInTransit) {
  lsim::ValidTargets t{};
  t.in_transit = true;
  EXPECT_TRUE(lsim::validate_action(lsim::Idle{}, t).accept);
  EXPECT_EQ(lsim::validate_action(lsim::Say{"byron", "hi"}, t).reason, lsim::RejectReason::InTransit);
}

TEST(Validation, AgentsInTransitAreOfferedNoTargets) {
  auto setup = lsim::make_demo_world();
  lsim::TransitMachine tm{setup.graph, lsim::TransitConfig{}};

  const auto before = lsim::compute_valid_targets(setup.state, setup.graph, "cleo");
  EXPECT_FALSE(before.in_transit);
  EXPECT_EQ(before.objects, (std::set<std::string>{"cafe_door", "coffee_machine"}));
  EXPECT_TRUE(before.agents.empty());
  EXPECT_TRUE(before.locations.count("park"));

  const auto street = lsim::compute_valid_targets(setup.state, setup.graph, "ada");
  EXPECT_EQ(street.agents, (std::set<std::string>{"byron"}));

  ASSERT_TRUE(tm.begin(setup.state, "cleo", "kitchen"));
  const auto during = lsim::compute_valid_targets(setup.state, setup.graph, "cleo");
  EXPECT_TRUE(during.in_transit);
  EXPECT_TRUE(during.locations.empty());
  EXPECT_TRUE(during.objects.empty());
  EXPECT_TRUE(during.agents.empty());
}
