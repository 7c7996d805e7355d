#include <gtest/gtest.h>

#include "lsim/object_executor.hpp"
#include "lsim/world_builder.hpp"

namespace {

lsim::WorldSetup kitchen() {
  lsim::WorldBuilder b;
  b.object_type(lsim::make_container_type("fridge", 1, 1))
   .object_type(lsim::make_container_type("box", 2, 0, true))
   .object_type(lsim::make_switch_type())
   .object_type(lsim::make_door_type());
  b.area("world", "world").area("kitchen", "kitchen", "world");
  b.object("fridge", "fridge", "kitchen", "fridge")
   .object("box", "box", "kitchen", "box")
   .object("lamp", "lamp", "kitchen", "switch")
   .object("door", "door", "kitchen", "door");
  b.agent("a", "A", "kitchen").agent("b", "B", "kitchen");
  return b.build();
}

} // namespace

TEST(ObjectExecutor, SecondTakeFromSingleItemFridgeFails) {
  auto setup = kitchen();
  lsim::ObjectExecutor ex{setup.catalog};
  auto& st = setup.state;

  const auto first = ex.execute(st, "a", "fridge", lsim::Verb::Take);
  const auto second = ex.execute(st, "b", "fridge", lsim::Verb::Take);

  EXPECT_TRUE(first.success);
  EXPECT_EQ(first.from_state.at("items"), "1");
  EXPECT_EQ(first.to_state.at("items"), "0");
  EXPECT_EQ(first.narration_key, "container.take");

  EXPECT_FALSE(second.success);
  EXPECT_EQ(second.agent_id, "b");
  EXPECT_EQ(second.from_state, second.to_state);
  EXPECT_EQ(second.narration_key, "container.empty");
  EXPECT_EQ(st.object("fridge").state.at("items"), "0");
}

TEST(ObjectExecutor, SwitchTogglesAndDoorRefusesRepeats) {
  auto setup = kitchen();
  lsim::ObjectExecutor ex{setup.catalog};
  auto& st = setup.state;

  EXPECT_EQ(ex.execute(st, "a", "lamp", lsim::Verb::Use).narration_key, "switch.on");
  EXPECT_EQ(st.object("lamp").state.at("power"), "on");
  EXPECT_EQ(ex.execute(st, "a", "lamp", lsim::Verb::Use).narration_key, "switch.off");

  EXPECT_TRUE(ex.execute(st, "a", "door", lsim::Verb::Open).success);
  const auto again = ex.execute(st, "b", "door", lsim::Verb::Open);
  EXPECT_FALSE(again.success);
  EXPECT_EQ(again.narration_key, "door.already_open");
  EXPECT_EQ(st.object("door").state.at("open"), "yes");
}

TEST(ObjectExecutor, LiddedContainerMustBeOpen) {
  auto setup = kitchen();
  lsim::ObjectExecutor ex{setup.catalog};
  auto& st = setup.state;

  const auto closed = ex.execute(st, "a", "box", lsim::Verb::Drop);
  EXPECT_FALSE(closed.success);
  EXPECT_EQ(closed.narration_key, "container.closed");

  EXPECT_TRUE(ex.execute(st, "a", "box", lsim::Verb::Open).success);
  EXPECT_TRUE(ex.execute(st, "a", "box", lsim::Verb::Drop).success);
  EXPECT_TRUE(ex.execute(st, "a", "box", lsim::Verb::Drop).success);
  EXPECT_EQ(ex.execute(st, "a", "box", lsim::Verb::Drop).narration_key, "container.full");
  EXPECT_EQ(st.object("box").state, (lsim::Attributes{{"items", "2"}, {"open", "yes"}}));
}

TEST(ObjectExecutor, MissingTableEntryIsAFailedNoEffect) {
  auto setup = kitchen();
  lsim::ObjectExecutor ex{setup.catalog};
  auto& st = setup.state;

  const auto ev = ex.execute(st, "a", "lamp", lsim::Verb::Take);
  EXPECT_FALSE(ev.success);
  EXPECT_EQ(ev.narration_key, "object.no_effect");
  EXPECT_EQ(st.object("lamp").state.at("power"), "off");
}
