#pragma once

#include "paneld/core/lockfree_queue.hpp"
#include "paneld/core/waiter.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

namespace paneld {

template <QueueElement T>
class OneshotSender;
template <QueueElement T>
class OneshotReceiver;

namespace detail {

enum class OneshotStatus : std::uint8_t {
  Empty,
  Ready,
  Dropped
};

template <QueueElement T>
struct OneshotState {
  std::optional<T> value;
  std::atomic<OneshotStatus> status{OneshotStatus::Empty};
  std::atomic<bool> receiver_alive{true};
  WaiterSlot waiter;

  [[nodiscard]] auto settled() const noexcept -> bool {
    return status.load(std::memory_order_seq_cst) != OneshotStatus::Empty;
  }
};

}  // namespace detail

// Single-value handoff, used to carry a reply back to whoever issued a
// command. Dropping the sender without sending settles the receiver empty.
template <QueueElement T>
[[nodiscard]] auto make_oneshot()
    -> std::pair<OneshotSender<T>, OneshotReceiver<T>> {
  auto state = std::make_shared<detail::OneshotState<T>>();
  return {OneshotSender<T>{state}, OneshotReceiver<T>{state}};
}

template <QueueElement T>
class OneshotSender {
public:
  OneshotSender(OneshotSender&&) noexcept = default;
  OneshotSender& operator=(OneshotSender&& other) noexcept {
    if (this != &other) {
      release();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  OneshotSender(const OneshotSender&) = delete;
  OneshotSender& operator=(const OneshotSender&) = delete;

  ~OneshotSender() {
    release();
  }

  // False if the value was already sent or nobody is listening any more.
  auto send(T value) -> bool {
    if (!state_)
      return false;
    auto state = std::exchange(state_, nullptr);
    if (!state->receiver_alive.load(std::memory_order_acquire))
      return false;
    state->value.emplace(std::move(value));
    state->status.store(detail::OneshotStatus::Ready,
                        std::memory_order_seq_cst);
    state->waiter.notify();
    return true;
  }

  [[nodiscard]] auto is_closed() const noexcept -> bool {
    return !state_ || !state_->receiver_alive.load(std::memory_order_acquire);
  }

private:
  friend auto make_oneshot<T>()
      -> std::pair<OneshotSender<T>, OneshotReceiver<T>>;

  explicit OneshotSender(std::shared_ptr<detail::OneshotState<T>> s) noexcept
      : state_(std::move(s)) {
  }

  auto release() -> void {
    if (state_) {
      state_->status.store(detail::OneshotStatus::Dropped,
                           std::memory_order_seq_cst);
      state_->waiter.notify();
      state_.reset();
    }
  }

  std::shared_ptr<detail::OneshotState<T>> state_;
};

// co_await yields the sent value, or nullopt if the sender went away.
template <QueueElement T>
class OneshotReceiver {
public:
  OneshotReceiver(OneshotReceiver&&) noexcept = default;
  OneshotReceiver& operator=(OneshotReceiver&& other) noexcept {
    if (this != &other) {
      release();
      state_ = std::move(other.state_);
    }
    return *this;
  }
  OneshotReceiver(const OneshotReceiver&) = delete;
  OneshotReceiver& operator=(const OneshotReceiver&) = delete;

  ~OneshotReceiver() {
    release();
  }

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return state_->settled();
  }

  auto await_suspend(std::coroutine_handle<> h) -> bool {
    state_->waiter.arm(h);
    if (state_->settled()) {
      return !state_->waiter.disarm();
    }
    return true;
  }

  auto await_resume() -> std::optional<T> {
    return try_take();
  }

  // Non-blocking; nullopt while nothing has been sent.
  [[nodiscard]] auto try_take() -> std::optional<T> {
    if (state_->status.load(std::memory_order_acquire) !=
            detail::OneshotStatus::Ready ||
        !state_->value) {
      return std::nullopt;
    }
    return std::exchange(state_->value, std::nullopt);
  }

  [[nodiscard]] auto is_settled() const noexcept -> bool {
    return state_->settled();
  }

private:
  friend auto make_oneshot<T>()
      -> std::pair<OneshotSender<T>, OneshotReceiver<T>>;

  explicit OneshotReceiver(std::shared_ptr<detail::OneshotState<T>> s) noexcept
      : state_(std::move(s)) {
  }

  auto release() noexcept -> void {
    if (state_) {
      state_->receiver_alive.store(false, std::memory_order_release);
      state_.reset();
    }
  }

  std::shared_ptr<detail::OneshotState<T>> state_;
};

}  // namespace paneld
