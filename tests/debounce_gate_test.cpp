#include "paneld/watch/debounce_gate.hpp"

#include "paneld/core/runtime.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace paneld;

TEST(DebounceGateTest, StartsOpen) {
  DebounceGate gate;
  EXPECT_TRUE(gate.is_open());
}

TEST(DebounceGateTest, SecondCloseLoses) {
  DebounceGate gate;
  EXPECT_TRUE(gate.try_close());
  EXPECT_FALSE(gate.is_open());
  EXPECT_FALSE(gate.try_close());
  gate.reopen();
  EXPECT_TRUE(gate.try_close());
}

TEST(DebounceGateTest, SingleWinnerUnderContention) {
  DebounceGate gate;
  constexpr int kThreads = 8;
  std::atomic<int> winners{0};
  test::SimpleBarrier barrier(kThreads);

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      barrier.arrive_and_wait();
      for (int j = 0; j < 100; ++j) {
        if (gate.try_close()) {
          winners.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(winners.load(), 1);
}

TEST(DebounceGateTest, ReopensAfterCooldown) {
  Runtime rt(1);
  rt.start();

  auto gate = std::make_shared<DebounceGate>();
  ASSERT_TRUE(gate->try_close());
  rt.spawn(reopen_after(gate, std::chrono::milliseconds(50)));

  test::sleep_ms(std::chrono::milliseconds(10));
  EXPECT_FALSE(gate->is_open());
  EXPECT_TRUE(test::wait_until([&] { return gate->is_open(); }));
  rt.stop();
}
