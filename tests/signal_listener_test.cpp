#include "paneld/lifecycle/signal_listener.hpp"

#include "paneld/core/runtime.hpp"

#include <signal.h>
#include <unistd.h>

#include <memory>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace paneld;

namespace {

auto run_listener(SignalListener& listener) -> spawn_task {
  (void)co_await listener.run();
}

}  // namespace

TEST(SignalListenerTest, RunWithoutSetupFails) {
  ExitSignal exit_signal;
  SignalListener listener(exit_signal, {SIGUSR1});

  Runtime rt(1);
  rt.start();
  auto result = test::block_on(rt, listener.run());
  ASSERT_TRUE(result.has_value());
  ASSERT_FALSE(result->has_value());
  EXPECT_EQ(result->error(), Error::SignalSetupFailed);
  rt.stop();
}

TEST(SignalListenerTest, SignalTriggersShutdown) {
  ExitSignal exit_signal;
  SignalListener listener(exit_signal, {SIGUSR1});
  ASSERT_TRUE(listener.setup().has_value());

  Runtime rt(1);
  rt.start();
  rt.spawn(run_listener(listener));

  test::sleep_ms(std::chrono::milliseconds(20));
  EXPECT_FALSE(exit_signal.is_signaled());

  ASSERT_EQ(::kill(::getpid(), SIGUSR1), 0);
  EXPECT_TRUE(test::wait_until([&] { return exit_signal.is_signaled(); }));
  rt.stop();
}

TEST(SignalListenerTest, RepeatedSignalsShutDownOnce) {
  ExitSignal exit_signal;
  SignalListener listener(exit_signal, {SIGUSR1, SIGUSR2});
  ASSERT_TRUE(listener.setup().has_value());

  Runtime rt(1);
  rt.start();
  rt.spawn(run_listener(listener));

  ASSERT_EQ(::kill(::getpid(), SIGUSR1), 0);
  EXPECT_TRUE(test::wait_until([&] { return listener.signals_received() >= 1; }));
  ASSERT_EQ(::kill(::getpid(), SIGUSR2), 0);
  EXPECT_TRUE(test::wait_until([&] { return listener.signals_received() >= 2; }));

  EXPECT_TRUE(exit_signal.is_signaled());
  // The signal was already flipped by the first delivery.
  EXPECT_FALSE(exit_signal.signal());
  rt.stop();
}

TEST(SignalListenerTest, SignalSourceIsClosedWithListener) {
  auto before = test::open_fd_count();
  {
    ExitSignal exit_signal;
    SignalListener listener(exit_signal, {SIGUSR2});
    ASSERT_TRUE(listener.setup().has_value());
    ASSERT_TRUE(listener.setup().has_value());
    EXPECT_EQ(test::open_fd_count(), before + 1);
  }
  EXPECT_EQ(test::open_fd_count(), before);
}
