#pragma once

#include "paneld/core/coroutine.hpp"
#include "paneld/core/io_ring.hpp"
#include "paneld/core/shard.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace paneld {

// A set of shard threads, each running coroutines to completion one at a time
// and driving its own io_uring ring. A one-shard runtime is a strictly
// serialized domain; the daemon runs one of those for the UI and a multi-shard
// one for background work.
class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0, std::string name = "runtime");
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto is_current_shard() const noexcept -> bool;

  auto schedule_on(shard_id target, std::coroutine_handle<> handle) -> void;
  // Hands the handle to the next shard in turn, so spawned tasks are spread
  // over every shard instead of piling onto one.
  auto schedule_external(std::coroutine_handle<> handle) -> void;
  auto spawn(spawn_task&& t) -> void;
  auto submit_io(IoRequest req) -> bool;

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }
  [[nodiscard]] auto name() const noexcept -> std::string_view {
    return name_;
  }

  [[nodiscard]] auto current_shard() const noexcept -> shard_id;

  [[nodiscard]] auto alloc_io_data() -> io_data*;
  auto free_io_data(io_data* data) -> void;

private:
  auto run_shard(shard_id id) -> void;
  auto wake_shard(shard_id id) -> void;

  unsigned num_shards_;
  std::string name_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::vector<std::thread> threads_;

  std::atomic<unsigned> next_shard_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
};

// Thread-local for internal use only
namespace detail {
inline thread_local shard_id current_shard_id = INVALID_SHARD;
inline thread_local Runtime* current_runtime = nullptr;
}  // namespace detail

inline auto current_runtime() noexcept -> Runtime* {
  return detail::current_runtime;
}

// Where a suspended coroutine should be resumed: the runtime shard it was
// running on when it parked. Producers on other threads use this to hand the
// handle back instead of resuming it on their own stack.
struct ResumePoint {
  Runtime* runtime{nullptr};
  shard_id shard{INVALID_SHARD};

  [[nodiscard]] static auto here() noexcept -> ResumePoint {
    return {detail::current_runtime, detail::current_shard_id};
  }

  auto resume(std::coroutine_handle<> h) const -> void {
    if (runtime != nullptr) {
      runtime->schedule_on(shard, h);
    } else {
      h.resume();
    }
  }
};

[[nodiscard]] inline auto decode_result(std::int32_t result) noexcept
    -> std::expected<std::uint32_t, std::errc> {
  if (result < 0)
    return std::unexpected{static_cast<std::errc>(-result)};
  return static_cast<std::uint32_t>(result);
}

[[nodiscard]] inline auto decode_void_result(std::int32_t result) noexcept
    -> std::expected<void, std::errc> {
  if (result < 0)
    return std::unexpected{static_cast<std::errc>(-result)};
  return {};
}

// Base for single-submission io_uring awaiters. Must be awaited from a
// coroutine running on a Runtime shard.
class io_awaiter_base {
public:
  io_awaiter_base() noexcept = default;
  io_awaiter_base(const io_awaiter_base&) = delete;
  io_awaiter_base& operator=(const io_awaiter_base&) = delete;

  [[nodiscard]] auto await_ready() const noexcept -> bool {
    return false;
  }

protected:
  auto submit(std::coroutine_handle<> handle, IoOp op) noexcept -> bool;
  auto take_result() noexcept -> std::int32_t;

  io_data* data_{nullptr};
  std::int32_t submit_error_{-EINVAL};
};

class read_awaiter : public io_awaiter_base {
public:
  read_awaiter(int fd, void* buf, std::uint32_t len) noexcept
      : fd_{fd}, buf_{buf}, len_{len} {
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  [[nodiscard]] auto await_resume() noexcept
      -> std::expected<std::uint32_t, std::errc> {
    return decode_result(take_result());
  }

private:
  int fd_;
  void* buf_;
  std::uint32_t len_;
};

class write_awaiter : public io_awaiter_base {
public:
  write_awaiter(int fd, const void* buf, std::uint32_t len) noexcept
      : fd_{fd}, buf_{buf}, len_{len} {
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  [[nodiscard]] auto await_resume() noexcept
      -> std::expected<std::uint32_t, std::errc> {
    return decode_result(take_result());
  }

private:
  int fd_;
  const void* buf_;
  std::uint32_t len_;
};

class send_awaiter : public io_awaiter_base {
public:
  send_awaiter(int fd, const void* buf, std::uint32_t len) noexcept
      : fd_{fd}, buf_{buf}, len_{len} {
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  [[nodiscard]] auto await_resume() noexcept
      -> std::expected<std::uint32_t, std::errc> {
    return decode_result(take_result());
  }

private:
  int fd_;
  const void* buf_;
  std::uint32_t len_;
};

class poll_awaiter : public io_awaiter_base {
public:
  poll_awaiter(int fd, std::uint32_t mask) noexcept : fd_{fd}, mask_{mask} {
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  [[nodiscard]] auto await_resume() noexcept
      -> std::expected<std::uint32_t, std::errc> {
    return decode_result(take_result());
  }

private:
  int fd_;
  std::uint32_t mask_;
};

class accept_awaiter : public io_awaiter_base {
public:
  explicit accept_awaiter(int listen_fd) noexcept : listen_fd_{listen_fd} {
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  // Accepted descriptor on success.
  [[nodiscard]] auto await_resume() noexcept -> std::expected<int, std::errc> {
    auto result = take_result();
    if (result < 0)
      return std::unexpected{static_cast<std::errc>(-result)};
    return static_cast<int>(result);
  }

private:
  int listen_fd_;
};

class sleep_awaiter : public io_awaiter_base {
public:
  explicit sleep_awaiter(std::chrono::milliseconds duration) noexcept
      : duration_{duration} {
  }

  auto await_suspend(std::coroutine_handle<> handle) noexcept -> bool;
  [[nodiscard]] auto await_resume() noexcept -> std::expected<void, std::errc> {
    auto result = take_result();
    if (result == -ETIME)
      return {};
    return decode_void_result(result);
  }

private:
  std::chrono::milliseconds duration_;
};

[[nodiscard]] inline auto async_read(int fd, void* buf,
                                     std::uint32_t len) noexcept
    -> read_awaiter {
  return read_awaiter{fd, buf, len};
}

[[nodiscard]] inline auto async_write(int fd, const void* buf,
                                      std::uint32_t len) noexcept
    -> write_awaiter {
  return write_awaiter{fd, buf, len};
}

// For sockets whose peer may already be gone; fails with broken_pipe.
[[nodiscard]] inline auto async_send(int fd, const void* buf,
                                     std::uint32_t len) noexcept
    -> send_awaiter {
  return send_awaiter{fd, buf, len};
}

[[nodiscard]] inline auto async_poll(int fd, std::uint32_t mask) noexcept
    -> poll_awaiter {
  return poll_awaiter{fd, mask};
}

[[nodiscard]] inline auto async_accept(int listen_fd) noexcept
    -> accept_awaiter {
  return accept_awaiter{listen_fd};
}

[[nodiscard]] inline auto
async_sleep(std::chrono::milliseconds duration) noexcept -> sleep_awaiter {
  return sleep_awaiter{duration};
}

}  // namespace paneld
