#include "paneld/lifecycle/exit_signal.hpp"

namespace paneld {

auto ExitSignal::signal() -> bool {
  std::vector<std::pair<std::coroutine_handle<>, ResumePoint>> waiters;
  {
    std::lock_guard lock(mutex_);
    if (signaled_.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    waiters.swap(waiters_);
  }

  signaled_.notify_all();
  for (auto& [handle, where] : waiters) {
    where.resume(handle);
  }
  return true;
}

auto ExitSignal::park(std::coroutine_handle<> h) -> bool {
  std::lock_guard lock(mutex_);
  if (signaled_.load(std::memory_order_acquire)) {
    return false;
  }
  waiters_.emplace_back(h, ResumePoint::here());
  return true;
}

}  // namespace paneld
