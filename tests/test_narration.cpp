#include <gtest/gtest.h>

#include "lsim/narration.hpp"
#include "lsim/perception.hpp"
#include "lsim/world_builder.hpp"

using lsim::NarrationRenderer;

TEST(Narration, FillReplacesKnownPlaceholdersOnly) {
  EXPECT_EQ(NarrationRenderer::fill("{a} meets {b}", {{"a", "Ada"}, {"b", "Byron"}}), "Ada meets Byron");
  EXPECT_EQ(NarrationRenderer::fill("{a} and {unknown}", {{"a", "Ada"}}), "Ada and {unknown}");
  EXPECT_EQ(NarrationRenderer::fill("open { brace", {}), "open { brace");
}

TEST(Narration, EventsUseNodeNames) {
  const auto setup = lsim::make_demo_world();
  const auto& names = setup.state.tree;
  NarrationRenderer r;

  EXPECT_EQ(r.narrate(lsim::Event{lsim::MoveEvent{"ada", "street", "cafe"}}, names),
            "Ada moved from Main Street to the cafe.");

  lsim::ObjectStateChanged taken{};
  taken.agent_id = "byron";
  taken.object_id = "fridge";
  taken.verb = lsim::Verb::Take;
  taken.success = false;
  taken.narration_key = "container.empty";
  EXPECT_EQ(r.narrate(lsim::Event{taken}, names), "Byron found the fridge empty.");

  const lsim::SayEvent say{"ada", "byron", "hello", "street"};
  EXPECT_EQ(r.narrate(lsim::Event{say}, names), "Ada said to Byron: \"hello\"");
  EXPECT_EQ(r.heard(say, names), "Byron heard Ada say: \"hello\"");

  EXPECT_EQ(r.narrate(lsim::Event{lsim::WeatherChanged{"clear", "rain"}}, names),
            "The weather turned from clear to rain.");
}

TEST(Narration, ActionsAndObservations) {
  const auto setup = lsim::make_demo_world();
  const auto& names = setup.state.tree;
  NarrationRenderer r;

  EXPECT_EQ(r.narrate("ada", lsim::Action{lsim::Move{"park"}}, names), "Ada heads for the park.");
  EXPECT_EQ(r.narrate("cleo", lsim::Action{lsim::Interact{"coffee_machine", lsim::Verb::Use}}, names),
            "Cleo tries to USE the coffee machine.");
  EXPECT_EQ(r.narrate("ada", lsim::Action{lsim::Idle{}}, names), "Ada waits.");

  const auto slice = lsim::perceive(setup.state, "cleo", 0);
  EXPECT_EQ(r.observation(slice, names), "Cleo is at the cafe and sees coffee machine, cafe door.");
}

TEST(Narration, TemplatesCanBeReplacedAndUnknownKeysStillReadable) {
  const auto setup = lsim::make_demo_world();
  NarrationRenderer r;
  r.set_template("MOVE", "{agent}: {from} -> {to}");
  EXPECT_EQ(r.narrate(lsim::Event{lsim::MoveEvent{"ada", "street", "park"}}, setup.state.tree),
            "Ada: Main Street -> the park");

  lsim::ObjectStateChanged custom{};
  custom.agent_id = "ada";
  custom.narration_key = "oven.preheat";
  EXPECT_EQ(r.narrate(lsim::Event{custom}, setup.state.tree), "Ada: oven.preheat");
  EXPECT_EQ(r.find_template("oven.preheat"), nullptr);
}
