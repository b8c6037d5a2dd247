#include "paneld/lifecycle/exit_signal.hpp"

#include "paneld/core/runtime.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace paneld;

namespace {

auto wait_and_count(ExitSignal& signal, std::atomic<int>* woken) -> spawn_task {
  co_await signal.wait();
  woken->fetch_add(1);
}

auto wait_returns(ExitSignal& signal) -> task<bool> {
  co_await signal.wait();
  co_return true;
}

}  // namespace

TEST(ExitSignalTest, StartsUnsignaled) {
  ExitSignal signal;
  EXPECT_FALSE(signal.is_signaled());
}

TEST(ExitSignalTest, OnlyFirstSignalFlips) {
  ExitSignal signal;
  EXPECT_TRUE(signal.signal());
  EXPECT_FALSE(signal.signal());
  EXPECT_FALSE(signal.signal());
  EXPECT_TRUE(signal.is_signaled());
}

TEST(ExitSignalTest, ConcurrentSignalsHaveOneWinner) {
  ExitSignal signal;
  constexpr int kThreads = 8;
  std::atomic<int> winners{0};
  test::SimpleBarrier barrier(kThreads);

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      barrier.arrive_and_wait();
      if (signal.signal()) {
        winners.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(winners.load(), 1);
}

TEST(ExitSignalTest, WakesEveryPendingWaiterOnce) {
  Runtime rt(2);
  rt.start();

  ExitSignal signal;
  std::atomic<int> woken{0};
  constexpr int kWaiters = 5;
  for (int i = 0; i < kWaiters; ++i) {
    rt.spawn(wait_and_count(signal, &woken));
  }

  test::sleep_ms(std::chrono::milliseconds(30));
  EXPECT_EQ(woken.load(), 0);

  signal.signal();
  signal.signal();
  EXPECT_TRUE(test::wait_until([&] { return woken.load() == kWaiters; }));

  test::sleep_ms(std::chrono::milliseconds(20));
  EXPECT_EQ(woken.load(), kWaiters);
  rt.stop();
}

TEST(ExitSignalTest, WaitAfterSignalCompletesImmediately) {
  Runtime rt(1);
  rt.start();

  ExitSignal signal;
  signal.signal();
  auto result = test::block_on(rt, wait_returns(signal),
                               std::chrono::milliseconds(500));
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(*result);
  rt.stop();
}

TEST(ExitSignalTest, BlockingWaitReturnsOnSignal) {
  ExitSignal signal;
  std::atomic<bool> returned{false};
  std::thread waiter([&] {
    signal.wait_blocking();
    returned.store(true);
  });

  test::sleep_ms(std::chrono::milliseconds(20));
  EXPECT_FALSE(returned.load());
  signal.signal();
  waiter.join();
  EXPECT_TRUE(returned.load());
}
