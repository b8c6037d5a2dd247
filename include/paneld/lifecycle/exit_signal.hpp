#pragma once

#include "paneld/core/runtime.hpp"

#include <atomic>
#include <coroutine>
#include <mutex>
#include <utility>
#include <vector>

namespace paneld {

// Process-wide shutdown broadcast. Once signaled it stays signaled: every
// pending waiter is resumed exactly once and later waits complete immediately.
class ExitSignal {
public:
  ExitSignal() = default;
  ExitSignal(const ExitSignal&) = delete;
  ExitSignal& operator=(const ExitSignal&) = delete;

  // Returns true for the call that actually flipped the signal.
  auto signal() -> bool;

  [[nodiscard]] auto is_signaled() const noexcept -> bool {
    return signaled_.load(std::memory_order_acquire);
  }

  // For threads that are not running coroutines.
  auto wait_blocking() const -> void {
    signaled_.wait(false, std::memory_order_acquire);
  }

  class awaiter {
  public:
    explicit awaiter(ExitSignal& signal) noexcept : signal_(signal) {
    }

    [[nodiscard]] auto await_ready() const noexcept -> bool {
      return signal_.is_signaled();
    }

    auto await_suspend(std::coroutine_handle<> h) -> bool {
      return signal_.park(h);
    }

    auto await_resume() const noexcept -> void {
    }

  private:
    ExitSignal& signal_;
  };

  [[nodiscard]] auto wait() noexcept -> awaiter {
    return awaiter{*this};
  }

private:
  // False if the signal fired before the waiter could be parked.
  auto park(std::coroutine_handle<> h) -> bool;

  std::atomic<bool> signaled_{false};
  std::mutex mutex_;
  std::vector<std::pair<std::coroutine_handle<>, ResumePoint>> waiters_;
};

}  // namespace paneld
