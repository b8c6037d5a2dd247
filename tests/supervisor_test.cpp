#include "paneld/lifecycle/supervisor.hpp"

#include "paneld/core/runtime.hpp"
#include "paneld/lifecycle/exit_signal.hpp"

#include <atomic>
#include <stdexcept>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace paneld;

namespace {

auto succeed_after(std::chrono::milliseconds d, std::atomic<int>* done)
    -> task<Result<void>> {
  (void)co_await async_sleep(d);
  done->fetch_add(1);
  co_return ok();
}

auto fail_after(std::chrono::milliseconds d, Error e) -> task<Result<void>> {
  (void)co_await async_sleep(d);
  co_return fail(e);
}

auto never_finish(ExitSignal& never) -> task<Result<void>> {
  co_await never.wait();
  co_return ok();
}

auto throw_now() -> task<Result<void>> {
  throw std::runtime_error("task blew up");
  co_return ok();
}

}  // namespace

TEST(SupervisorTest, SucceedsWhenEveryTaskSucceeds) {
  Runtime rt(2);
  rt.start();

  std::atomic<int> done{0};
  Supervisor supervisor(rt);
  supervisor.add("a", succeed_after(std::chrono::milliseconds(5), &done));
  supervisor.add("b", succeed_after(std::chrono::milliseconds(15), &done));
  supervisor.add("c", succeed_after(std::chrono::milliseconds(1), &done));
  EXPECT_EQ(supervisor.size(), 3u);

  auto result = test::block_on(rt, supervisor.run());
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has_value());
  EXPECT_EQ(done.load(), 3);
  rt.stop();
}

TEST(SupervisorTest, EmptySupervisorSucceeds) {
  Runtime rt(1);
  rt.start();
  Supervisor supervisor(rt);
  auto result = test::block_on(rt, supervisor.run());
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->has_value());
  rt.stop();
}

TEST(SupervisorTest, FirstFailureReturnsWithoutWaitingForOthers) {
  Runtime rt(2);
  rt.start();

  ExitSignal never;
  Supervisor supervisor(rt);
  supervisor.add("forever", never_finish(never));
  supervisor.add("broken",
                 fail_after(std::chrono::milliseconds(10), Error::WatchSetupFailed));

  auto result = test::block_on(rt, supervisor.run(), std::chrono::seconds(2));
  ASSERT_TRUE(result.has_value());
  ASSERT_FALSE(result->has_value());
  EXPECT_EQ(result->error(), Error::WatchSetupFailed);

  never.signal();
  rt.stop();
}

TEST(SupervisorTest, ThrowingTaskCountsAsFailure) {
  Runtime rt(1);
  rt.start();

  Supervisor supervisor(rt);
  supervisor.add("thrower", throw_now());

  auto result = test::block_on(rt, supervisor.run());
  ASSERT_TRUE(result.has_value());
  ASSERT_FALSE(result->has_value());
  EXPECT_EQ(result->error(), Error::Unknown);
  rt.stop();
}
