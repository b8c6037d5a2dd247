#pragma once

#include "paneld/core/runtime.hpp"

#include <atomic>
#include <coroutine>

namespace paneld::detail {

// Holds at most one parked consumer coroutine. The consumer arms the slot and
// then rechecks its condition; a producer publishes its data first and then
// notifies. With seq_cst on both sides one of them always observes the other.
class WaiterSlot {
public:
  auto arm(std::coroutine_handle<> h) noexcept -> void {
    where_ = ResumePoint::here();
    handle_.store(h.address(), std::memory_order_seq_cst);
  }

  // True when the consumer got its handle back before any producer took it.
  [[nodiscard]] auto disarm() noexcept -> bool {
    return handle_.exchange(nullptr, std::memory_order_seq_cst) != nullptr;
  }

  auto notify() -> void {
    auto* addr = handle_.exchange(nullptr, std::memory_order_seq_cst);
    if (addr != nullptr) {
      where_.resume(std::coroutine_handle<>::from_address(addr));
    }
  }

private:
  std::atomic<void*> handle_{nullptr};
  ResumePoint where_;
};

// Suspends until ready() holds. ready() must be safe to call from any thread.
template <typename Ready>
class ready_awaiter {
public:
  ready_awaiter(WaiterSlot& slot, Ready ready) noexcept
      : slot_(slot), ready_(std::move(ready)) {
  }

  [[nodiscard]] auto await_ready() const -> bool {
    return ready_();
  }

  auto await_suspend(std::coroutine_handle<> h) -> bool {
    slot_.arm(h);
    if (ready_()) {
      // A producer that already took the handle will resume us itself.
      return !slot_.disarm();
    }
    return true;
  }

  auto await_resume() const noexcept -> void {
  }

private:
  WaiterSlot& slot_;
  Ready ready_;
};

}  // namespace paneld::detail
