#pragma once

#include "paneld/core/error.hpp"
#include "paneld/core/io_ring.hpp"
#include "paneld/core/lockfree_queue.hpp"
#include "paneld/util/unique_fd.hpp"

#include <chrono>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <memory>
#include <unordered_set>
#include <vector>

namespace paneld {

// One scheduler thread's state. notify() and schedule_remote() may be called
// from any thread; everything else belongs to the thread running the shard.
class Shard {
public:
  static constexpr std::size_t kRemoteQueueCapacity = 4096;

  explicit Shard(shard_id id);

  Shard(const Shard&) = delete;
  Shard& operator=(const Shard&) = delete;

  [[nodiscard]] auto id() const noexcept -> shard_id {
    return id_;
  }
  [[nodiscard]] auto ring() noexcept -> IoRing& {
    return ring_;
  }

  // Reports why the shard cannot do I/O, if it cannot.
  [[nodiscard]] auto health() const -> Result<void>;

  // Called once on the shard thread before the loop starts.
  auto attach() -> void;

  auto schedule_local(std::coroutine_handle<> h) -> void;
  [[nodiscard]] auto schedule_remote(std::coroutine_handle<> h) -> bool;
  auto notify() -> void;

  [[nodiscard]] auto acquire_io_data() -> io_data*;
  auto release_io_data(io_data* data) -> void;
  auto submit_io(IoRequest req) -> void;

  auto process_ready() -> bool;
  auto process_io() -> void;
  auto reap_completions() -> bool;
  auto idle_wait(std::chrono::milliseconds timeout) -> void;

  [[nodiscard]] auto has_work() const noexcept -> bool;

  // Destroys coroutines still parked on I/O once the thread has exited.
  // Returns how many were destroyed.
  auto release_parked() -> std::size_t;

private:
  auto drain_wakeups() -> void;

  shard_id id_;
  UniqueFd wake_fd_;
  int wake_errno_ = 0;
  IoRing ring_;

  std::deque<std::coroutine_handle<>> local_queue_;
  BoundedMPSCQueue<std::coroutine_handle<>> remote_queue_{
      kRemoteQueueCapacity};
  std::deque<IoRequest> io_queue_;
  std::unordered_set<io_data*> parked_;

  std::vector<std::unique_ptr<io_data>> io_slab_;
  std::vector<io_data*> io_free_;
};

}  // namespace paneld
