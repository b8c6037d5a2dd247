#include "paneld/core/shard.hpp"

#include <sys/eventfd.h>

#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <thread>

namespace paneld {

namespace {

// Frames free themselves (spawn_task) or are freed by their awaiter (task), so
// a handle must not be touched after it has been resumed.
auto resume_if_live(std::coroutine_handle<> h) -> bool {
  if (!h || h.done())
    return false;
  h.resume();
  return true;
}

}  // namespace

Shard::Shard(shard_id id)
    : id_(id), wake_fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!wake_fd_) {
    wake_errno_ = errno;
  }
}

auto Shard::health() const -> Result<void> {
  if (!wake_fd_)
    return fail_errno(wake_errno_);
  if (!ring_.valid())
    return fail(ring_.init_error());
  return ok();
}

auto Shard::attach() -> void {
  (void)ring_.arm_wakeup(wake_fd_.get());
}

auto Shard::schedule_local(std::coroutine_handle<> h) -> void {
  if (h && !h.done()) {
    local_queue_.push_back(h);
  }
}

auto Shard::schedule_remote(std::coroutine_handle<> h) -> bool {
  return remote_queue_.push(h);
}

auto Shard::notify() -> void {
  if (!wake_fd_)
    return;

  std::uint64_t one = 1;
  while (::write(wake_fd_.get(), &one, sizeof(one)) < 0 && errno == EINTR) {
  }
  // EAGAIN means the counter is saturated, so a wakeup is already pending.
}

auto Shard::drain_wakeups() -> void {
  std::uint64_t count = 0;
  while (::read(wake_fd_.get(), &count, sizeof(count)) > 0) {
  }
}

auto Shard::acquire_io_data() -> io_data* {
  io_data* data = nullptr;
  if (io_free_.empty()) {
    data = io_slab_.emplace_back(std::make_unique<io_data>()).get();
  } else {
    data = io_free_.back();
    io_free_.pop_back();
    *data = io_data{};
  }
  data->owner_shard = id_;
  return data;
}

auto Shard::release_io_data(io_data* data) -> void {
  if (data == nullptr)
    return;
  parked_.erase(data);
  data->coroutine = nullptr;
  io_free_.push_back(data);
}

auto Shard::submit_io(IoRequest req) -> void {
  parked_.insert(req.data);
  io_queue_.push_back(std::move(req));
}

auto Shard::process_ready() -> bool {
  bool resumed = false;

  // Handles scheduled while this batch runs wait for the next pass.
  std::deque<std::coroutine_handle<>> batch;
  batch.swap(local_queue_);
  for (auto h : batch) {
    resumed |= resume_if_live(h);
  }

  while (auto h = remote_queue_.try_pop()) {
    resumed |= resume_if_live(*h);
  }

  return resumed;
}

auto Shard::process_io() -> void {
  while (!io_queue_.empty()) {
    if (!ring_.prepare(io_queue_.front()))
      return;
    io_queue_.pop_front();
  }
}

auto Shard::reap_completions() -> bool {
  auto reaped = ring_.reap(
      [](io_data* data, int res) {
        data->result = res;
        if (data->coroutine != nullptr) {
          resume_if_live(std::coroutine_handle<>::from_address(data->coroutine));
        }
      },
      [this] { drain_wakeups(); });

  // The kernel may end a multishot poll on its own; re-arm it.
  if (!ring_.wakeup_armed()) {
    attach();
  }
  return reaped > 0;
}

auto Shard::idle_wait(std::chrono::milliseconds timeout) -> void {
  if (has_work())
    return;

  if (!ring_.valid()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return;
  }
  ring_.wait(timeout);
}

auto Shard::has_work() const noexcept -> bool {
  return !local_queue_.empty() || !remote_queue_.empty() || !io_queue_.empty();
}

// Ready handles are dropped without being resumed. Parked frames are destroyed
// so their RAII members (descriptors, channel handles) are released.
auto Shard::release_parked() -> std::size_t {
  io_queue_.clear();
  local_queue_.clear();
  remote_queue_.drain([](std::coroutine_handle<>) {});

  std::size_t destroyed = 0;
  for (auto* data : parked_) {
    if (data->coroutine != nullptr) {
      auto h = std::coroutine_handle<>::from_address(data->coroutine);
      data->coroutine = nullptr;
      h.destroy();
      ++destroyed;
    }
  }
  parked_.clear();
  return destroyed;
}

}  // namespace paneld
