#include "paneld/core/oneshot.hpp"
#include "paneld/core/runtime.hpp"

#include <optional>
#include <string>
#include <thread>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace paneld;

namespace {

auto await_value(OneshotReceiver<std::string> rx)
    -> task<std::optional<std::string>> {
  co_return co_await rx;
}

}  // namespace

TEST(OneshotTest, ValueSentBeforeAwait) {
  auto [tx, rx] = make_oneshot<int>();
  EXPECT_FALSE(rx.is_settled());
  EXPECT_TRUE(tx.send(42));
  EXPECT_TRUE(rx.is_settled());
  EXPECT_EQ(rx.try_take(), 42);
}

TEST(OneshotTest, SecondSendFails) {
  auto [tx, rx] = make_oneshot<int>();
  EXPECT_TRUE(tx.send(1));
  EXPECT_FALSE(tx.send(2));
  EXPECT_EQ(rx.try_take(), 1);
}

TEST(OneshotTest, SendFailsWhenReceiverGone) {
  auto channel = make_oneshot<int>();
  auto tx = std::move(channel.first);
  { auto rx = std::move(channel.second); }
  EXPECT_TRUE(tx.is_closed());
  EXPECT_FALSE(tx.send(1));
}

TEST(OneshotTest, DroppedSenderSettlesEmpty) {
  auto channel = make_oneshot<int>();
  auto rx = std::move(channel.second);
  { auto tx = std::move(channel.first); }
  EXPECT_TRUE(rx.is_settled());
  EXPECT_FALSE(rx.try_take().has_value());
}

TEST(OneshotTest, AwaitResumesWhenValueArrives) {
  Runtime rt(1);
  rt.start();

  auto channel = make_oneshot<std::string>();
  auto results =
      std::make_shared<test::BlockingQueue<std::optional<std::string>>>();
  rt.spawn(test::deliver_to(await_value(std::move(channel.second)), results));

  test::sleep_ms(std::chrono::milliseconds(20));
  EXPECT_EQ(results->size(), 0u);

  std::thread sender([tx = std::move(channel.first)]() mutable {
    (void)tx.send("done");
  });
  sender.join();

  auto got = results->try_pop_for(std::chrono::seconds(2));
  ASSERT_TRUE(got.has_value());
  ASSERT_TRUE(got->has_value());
  EXPECT_EQ(**got, "done");
  rt.stop();
}

TEST(OneshotTest, AwaitResumesEmptyWhenSenderDropped) {
  Runtime rt(1);
  rt.start();

  auto channel = make_oneshot<std::string>();
  auto results =
      std::make_shared<test::BlockingQueue<std::optional<std::string>>>();
  rt.spawn(test::deliver_to(await_value(std::move(channel.second)), results));

  test::sleep_ms(std::chrono::milliseconds(20));
  { auto tx = std::move(channel.first); }

  auto got = results->try_pop_for(std::chrono::seconds(2));
  ASSERT_TRUE(got.has_value());
  EXPECT_FALSE(got->has_value());
  rt.stop();
}
