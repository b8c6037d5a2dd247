#pragma once

#include "paneld/core/coroutine.hpp"
#include "paneld/core/error.hpp"
#include "paneld/core/lockfree_queue.hpp"
#include "paneld/core/waiter.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

namespace paneld {

template <QueueElement T>
class Sender;
template <QueueElement T>
class Receiver;

namespace detail {

template <QueueElement T>
struct ChannelNode : MPSCNode {
  explicit ChannelNode(T v) : value(std::move(v)) {
  }
  T value;
};

template <QueueElement T>
struct ChannelState {
  MPSCQueue<ChannelNode<T>> queue;
  // Incremented before a node is pushed, decremented after it is popped.
  std::atomic<std::size_t> pending{0};
  std::atomic<std::size_t> senders{1};
  std::atomic<bool> closed{false};
  std::atomic<bool> receiver_alive{true};
  WaiterSlot waiter;

  ChannelState() = default;
  ChannelState(const ChannelState&) = delete;
  ChannelState& operator=(const ChannelState&) = delete;

  // Values nobody received are destroyed with the channel.
  ~ChannelState() {
    queue.drain([](ChannelNode<T>* node) { delete node; });
  }

  [[nodiscard]] auto has_items() const noexcept -> bool {
    return pending.load(std::memory_order_seq_cst) > 0;
  }
};

}  // namespace detail

// Unbounded multi-producer single-consumer channel. Senders may live on any
// thread; the receiver is awaited from one coroutine at a time. Values are
// delivered in the order their send() calls completed.
template <QueueElement T>
[[nodiscard]] auto make_channel() -> std::pair<Sender<T>, Receiver<T>> {
  auto state = std::make_shared<detail::ChannelState<T>>();
  return {Sender<T>{state}, Receiver<T>{state}};
}

template <QueueElement T>
class Sender {
public:
  Sender(const Sender& other) noexcept : state_(other.state_) {
    if (state_) {
      state_->senders.fetch_add(1, std::memory_order_relaxed);
    }
  }

  Sender& operator=(const Sender& other) noexcept {
    if (this != &other) {
      release();
      state_ = other.state_;
      if (state_) {
        state_->senders.fetch_add(1, std::memory_order_relaxed);
      }
    }
    return *this;
  }

  Sender(Sender&& other) noexcept = default;

  Sender& operator=(Sender&& other) noexcept {
    if (this != &other) {
      release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~Sender() {
    release();
  }

  // Fails with ChannelClosed once the receiver has been dropped.
  auto send(T value) -> Result<void> {
    if (!state_ || !state_->receiver_alive.load(std::memory_order_acquire)) {
      return fail(Error::ChannelClosed);
    }
    auto* node = new detail::ChannelNode<T>(std::move(value));
    state_->pending.fetch_add(1, std::memory_order_seq_cst);
    state_->queue.push(node);
    state_->waiter.notify();
    return ok();
  }

  [[nodiscard]] auto is_closed() const noexcept -> bool {
    return !state_ || !state_->receiver_alive.load(std::memory_order_acquire);
  }

private:
  friend auto make_channel<T>() -> std::pair<Sender<T>, Receiver<T>>;

  explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) noexcept
      : state_(std::move(state)) {
  }

  auto release() -> void {
    if (!state_)
      return;
    if (state_->senders.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      state_->closed.store(true, std::memory_order_seq_cst);
      state_->waiter.notify();
    }
    state_.reset();
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

template <QueueElement T>
class Receiver {
public:
  Receiver(Receiver&&) noexcept = default;
  Receiver& operator=(Receiver&& other) noexcept {
    if (this != &other) {
      release();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  Receiver(const Receiver&) = delete;
  Receiver& operator=(const Receiver&) = delete;

  ~Receiver() {
    release();
  }

  // Next value, or nullopt once every sender is gone and the queue is empty.
  auto recv() -> task<std::optional<T>> {
    auto* state = state_.get();
    while (true) {
      if (auto value = try_recv()) {
        co_return value;
      }
      if (state->closed.load(std::memory_order_seq_cst)) {
        // A last send may have landed between the pop and the closed check.
        co_return try_recv();
      }
      co_await detail::ready_awaiter{state->waiter, [state] {
                                       return state->has_items() ||
                                              state->closed.load(
                                                  std::memory_order_seq_cst);
                                     }};
    }
  }

  [[nodiscard]] auto try_recv() -> std::optional<T> {
    auto* state = state_.get();
    while (state->has_items()) {
      if (auto* node = state->queue.try_pop()) {
        state->pending.fetch_sub(1, std::memory_order_seq_cst);
        std::optional<T> value{std::move(node->value)};
        delete node;
        return value;
      }
      // Counted but not yet linked; the producer is mid-push.
      std::this_thread::yield();
    }
    return std::nullopt;
  }

  [[nodiscard]] auto is_closed() const noexcept -> bool {
    return state_->closed.load(std::memory_order_acquire) &&
           !state_->has_items();
  }

private:
  friend auto make_channel<T>() -> std::pair<Sender<T>, Receiver<T>>;

  explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) noexcept
      : state_(std::move(state)) {
  }

  auto release() noexcept -> void {
    if (state_) {
      state_->receiver_alive.store(false, std::memory_order_release);
      state_.reset();
    }
  }

  std::shared_ptr<detail::ChannelState<T>> state_;
};

}  // namespace paneld
