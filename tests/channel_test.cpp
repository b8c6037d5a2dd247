#include "paneld/core/channel.hpp"
#include "paneld/core/runtime.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace paneld;

namespace {

auto collect(Receiver<int>& rx, std::size_t n) -> task<std::vector<int>> {
  std::vector<int> out;
  while (out.size() < n) {
    auto v = co_await rx.recv();
    if (!v) {
      break;
    }
    out.push_back(*v);
  }
  co_return out;
}

auto drain_until_closed(Receiver<int>& rx) -> task<std::size_t> {
  std::size_t count = 0;
  while (auto v = co_await rx.recv()) {
    ++count;
  }
  co_return count;
}

}  // namespace

TEST(ChannelTest, TryRecvOnEmptyChannel) {
  auto [tx, rx] = make_channel<int>();
  EXPECT_FALSE(rx.try_recv().has_value());
  EXPECT_FALSE(rx.is_closed());
}

TEST(ChannelTest, SingleSenderIsFifo) {
  auto [tx, rx] = make_channel<int>();
  for (int i = 0; i < 100; ++i) {
    ASSERT_TRUE(tx.send(i).has_value());
  }
  for (int i = 0; i < 100; ++i) {
    auto v = rx.try_recv();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, i);
  }
}

TEST(ChannelTest, MoveOnlyValues) {
  auto [tx, rx] = make_channel<std::unique_ptr<std::string>>();
  ASSERT_TRUE(tx.send(std::make_unique<std::string>("hello")).has_value());
  auto v = rx.try_recv();
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(**v, "hello");
}

TEST(ChannelTest, SendFailsAfterReceiverDropped) {
  auto channel = make_channel<int>();
  auto tx = std::move(channel.first);
  {
    auto rx = std::move(channel.second);
  }
  EXPECT_TRUE(tx.is_closed());
  auto r = tx.send(1);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::ChannelClosed);
}

TEST(ChannelTest, ClosedOnlyWhenLastSenderDropped) {
  auto channel = make_channel<int>();
  auto rx = std::move(channel.second);
  auto tx1 = std::move(channel.first);
  auto tx2 = tx1;

  { auto gone = std::move(tx1); }
  EXPECT_FALSE(rx.is_closed());

  ASSERT_TRUE(tx2.send(7).has_value());
  { auto gone = std::move(tx2); }

  // Queued values survive the close.
  EXPECT_FALSE(rx.is_closed());
  EXPECT_EQ(rx.try_recv(), 7);
  EXPECT_TRUE(rx.is_closed());
}

TEST(ChannelTest, RecvSuspendsUntilValueArrives) {
  Runtime rt(1);
  rt.start();

  auto [tx, rx] = make_channel<int>();
  auto results = std::make_shared<test::BlockingQueue<std::vector<int>>>();
  rt.spawn(test::deliver_to(collect(rx, 3), results));

  test::sleep_ms(std::chrono::milliseconds(20));
  EXPECT_EQ(results->size(), 0u);

  std::thread producer([&tx] {
    for (int i = 1; i <= 3; ++i) {
      (void)tx.send(i);
      test::sleep_ms(std::chrono::milliseconds(5));
    }
  });
  producer.join();

  auto got = results->try_pop_for(std::chrono::seconds(2));
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(*got, (std::vector<int>{1, 2, 3}));
  rt.stop();
}

TEST(ChannelTest, RecvReturnsNulloptWhenAllSendersGone) {
  Runtime rt(1);
  rt.start();

  auto channel = make_channel<int>();
  auto rx = std::move(channel.second);
  auto results = std::make_shared<test::BlockingQueue<std::size_t>>();
  rt.spawn(test::deliver_to(drain_until_closed(rx), results));

  {
    auto tx = std::move(channel.first);
    (void)tx.send(1);
    (void)tx.send(2);
  }

  auto got = results->try_pop_for(std::chrono::seconds(2));
  ASSERT_TRUE(got.has_value());
  EXPECT_EQ(*got, 2u);
  rt.stop();
}

TEST(ChannelTest, PerSenderOrderWithConcurrentProducers) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 500;

  Runtime consumer_rt(1);
  consumer_rt.start();

  auto channel = make_channel<int>();
  auto rx = std::move(channel.second);
  auto results = std::make_shared<test::BlockingQueue<std::vector<int>>>();
  consumer_rt.spawn(
      test::deliver_to(collect(rx, kProducers * kPerProducer), results));

  {
    auto tx = std::move(channel.first);
    test::SimpleBarrier barrier(kProducers);
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
      producers.emplace_back([&barrier, sender = tx, p]() mutable {
        barrier.arrive_and_wait();
        for (int i = 0; i < kPerProducer; ++i) {
          (void)sender.send(p * kPerProducer + i);
        }
      });
    }
    for (auto& t : producers) {
      t.join();
    }
  }

  auto got = results->try_pop_for(std::chrono::seconds(5));
  ASSERT_TRUE(got.has_value());
  ASSERT_EQ(got->size(), static_cast<std::size_t>(kProducers * kPerProducer));

  std::vector<int> last(kProducers, -1);
  for (int v : *got) {
    int producer = v / kPerProducer;
    int seq = v % kPerProducer;
    EXPECT_GT(seq, last[producer]);
    last[producer] = seq;
  }
  consumer_rt.stop();
}
