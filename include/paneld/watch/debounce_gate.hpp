#pragma once

#include "paneld/core/coroutine.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace paneld {

// Lets one trigger through per cooldown window. Starts open; the caller that
// closes it owns the window and is responsible for reopening it.
class DebounceGate {
public:
  DebounceGate() = default;
  DebounceGate(const DebounceGate&) = delete;
  DebounceGate& operator=(const DebounceGate&) = delete;

  // True only for the call that moved the gate from open to closed.
  [[nodiscard]] auto try_close() noexcept -> bool {
    return open_.exchange(false, std::memory_order_acq_rel);
  }

  auto reopen() noexcept -> void {
    open_.store(true, std::memory_order_release);
  }

  [[nodiscard]] auto is_open() const noexcept -> bool {
    return open_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> open_{true};
};

// Sleeps for the cooldown on the current shard, then reopens the gate.
auto reopen_after(std::shared_ptr<DebounceGate> gate,
                  std::chrono::milliseconds cooldown) -> spawn_task;

}  // namespace paneld
