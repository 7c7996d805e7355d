#include <gtest/gtest.h>

#include <thread>

#include "lsim/live_world.hpp"
#include "test_support.hpp"

using namespace lsim::testing;

TEST(LiveWorld, StepsOnRequestAndExposesLatest) {
  auto policy = std::make_shared<lsim::agents::ScriptedPolicy>();
  policy->push("a", lsim::Move{"y"});
  lsim::LiveWorld w{two_rooms({"a", "b"}), collaborators(policy), quiet_config()};

  EXPECT_EQ(w.latest(), nullptr);
  EXPECT_EQ(w.current_tick(), 0);

  EXPECT_EQ(w.step(2), 2u);
  ASSERT_NE(w.latest(), nullptr);
  EXPECT_EQ(w.latest()->tick, 1);
  EXPECT_EQ(w.stats().ticks, 2u);

  const auto rows = w.agents();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].runtime.id, "a");
  EXPECT_EQ(rows[0].runtime.location_id, "y");
  EXPECT_EQ(rows[0].memories, 3u);  // two observations + arrival
  EXPECT_GT(rows[1].beliefs, 0u);
}

TEST(LiveWorld, ConcurrentReadersSeeCommittedTicksOnly) {
  lsim::LiveWorld w{two_rooms({"a", "b"}), collaborators(std::make_shared<lsim::agents::ScriptedPolicy>()),
                    quiet_config()};

  std::thread reader([&]() {
    lsim::Tick last = -1;
    for (int i = 0; i < 200; ++i) {
      if (const auto p = w.latest()) {
        EXPECT_GE(p->tick, last);
        last = p->tick;
      }
    }
  });
  EXPECT_EQ(w.step(10), 10u);
  reader.join();
  EXPECT_EQ(w.latest()->tick, 9);
}

TEST(LiveWorld, StopsStepOnHalt) {
  auto setup = two_rooms({"a"});
  setup.catalog = lsim::ObjectCatalog{};
  auto policy = std::make_shared<lsim::agents::ScriptedPolicy>();
  policy->push("a", lsim::Interact{"lamp", lsim::Verb::Use});
  lsim::LiveWorld w{std::move(setup), collaborators(policy), quiet_config()};

  EXPECT_EQ(w.step(5), 0u);
  EXPECT_TRUE(w.halted());
  EXPECT_EQ(w.step(1), 0u);
}
