#include <gtest/gtest.h>

#include "lsim/errors.hpp"
#include "lsim/transit.hpp"
#include "lsim/world_builder.hpp"

namespace {

lsim::WorldSetup corridor() {
  lsim::WorldBuilder b;
  b.area("world", "world")
   .area("a", "A", "world")
   .area("b", "B", "world")
   .area("c", "C", "world");
  b.agent("ada", "Ada", "a");
  b.portal("a", "b").portal("b", "c");
  return b.build();
}

} // namespace

TEST(Transit, SingleEdgeArrivesOnFirstAdvance) {
  auto setup = corridor();
  lsim::TransitMachine tm{setup.graph, lsim::TransitConfig{}};
  auto& st = setup.state;

  ASSERT_TRUE(tm.begin(st, "ada", "b"));
  ASSERT_TRUE(st.agent("ada").in_transit());
  EXPECT_EQ(st.agent("ada").transit->remaining_edges, 1);
  EXPECT_EQ(st.agent("ada").location_id, "a");

  const auto ev = tm.advance(st, "ada");
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(ev->from, "a");
  EXPECT_EQ(ev->to, "b");
  EXPECT_FALSE(st.agent("ada").in_transit());
  EXPECT_EQ(st.agent("ada").location_id, "b");
  EXPECT_EQ(*st.tree.node("ada").parent_id, "b");
  EXPECT_NO_THROW(st.validate());
}

TEST(Transit, EmitsOneEventAtArrivalAndOccupiesIntermediateNodes) {
  auto setup = corridor();
  lsim::TransitMachine tm{setup.graph, lsim::TransitConfig{}};
  auto& st = setup.state;

  // a-b-c and a-world-c are both two edges; "b" sorts first.
  ASSERT_TRUE(tm.begin(st, "ada", "c"));
  EXPECT_EQ(st.agent("ada").transit->path, (std::vector<std::string>{"b", "c"}));

  EXPECT_FALSE(tm.advance(st, "ada").has_value());
  EXPECT_EQ(st.agent("ada").location_id, "b");
  EXPECT_EQ(st.agent("ada").transit->remaining_edges, 1);

  const auto ev = tm.advance(st, "ada");
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(ev->from, "a");
  EXPECT_EQ(ev->to, "c");
}

TEST(Transit, EdgeCostDelaysEachHop) {
  auto setup = corridor();
  lsim::TransitMachine tm{setup.graph, lsim::TransitConfig{3}};
  auto& st = setup.state;

  ASSERT_TRUE(tm.begin(st, "ada", "b"));
  EXPECT_FALSE(tm.advance(st, "ada").has_value());
  EXPECT_FALSE(tm.advance(st, "ada").has_value());
  EXPECT_EQ(st.agent("ada").location_id, "a");
  EXPECT_TRUE(tm.advance(st, "ada").has_value());
  EXPECT_EQ(st.agent("ada").location_id, "b");
}

TEST(Transit, BeginRefusedWhileMovingOrWithoutPath) {
  auto setup = corridor();
  lsim::TransitMachine tm{setup.graph, lsim::TransitConfig{}};
  auto& st = setup.state;

  EXPECT_FALSE(tm.begin(st, "ada", "a"));        // already there
  EXPECT_FALSE(tm.begin(st, "ada", "nowhere"));
  ASSERT_TRUE(tm.begin(st, "ada", "c"));
  EXPECT_FALSE(tm.begin(st, "ada", "b"));        // no re-planning mid-transit
  EXPECT_EQ(st.agent("ada").transit->path.back(), "c");
}

TEST(Transit, RejectsZeroEdgeCost) {
  auto setup = corridor();
  EXPECT_THROW((lsim::TransitMachine{setup.graph, lsim::TransitConfig{0}}), lsim::ConfigError);
}
