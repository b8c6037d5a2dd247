#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <variant>

#include <liburing.h>

namespace paneld {

using shard_id = unsigned;
inline constexpr shard_id INVALID_SHARD = ~0u;

// Completion record for one in-flight operation. Owned by the shard that
// submitted it; the parked coroutine is resumed on that same shard.
struct io_data {
  void* coroutine = nullptr;
  std::int32_t result = 0;
  __kernel_timespec ts{};
  shard_id owner_shard = INVALID_SHARD;
};

// The operations the daemon issues. Reads and writes are on streams (pipes,
// sockets, inotify and signal descriptors), so no file offset is carried.
namespace io_op {
struct Read {
  int fd;
  void* buf;
  std::uint32_t len;
};
struct Write {
  int fd;
  const void* buf;
  std::uint32_t len;
};
// Socket write; a closed peer yields -EPIPE instead of SIGPIPE.
struct Send {
  int fd;
  const void* buf;
  std::uint32_t len;
};
struct Poll {
  int fd;
  std::uint32_t mask;
};
struct Accept {
  int listen_fd;
};
struct Timeout {
  std::chrono::nanoseconds duration;
};
}  // namespace io_op

using IoOp = std::variant<io_op::Read, io_op::Write, io_op::Send,
                          io_op::Poll, io_op::Accept, io_op::Timeout>;

struct IoRequest {
  IoOp op;
  io_data* data{nullptr};
};

class IoRing {
public:
  static constexpr unsigned kDefaultEntries = 256;
  // Queued submissions are handed to the kernel once this many accumulate,
  // or whenever the shard is about to block.
  static constexpr unsigned kSubmitBatch = 8;

  explicit IoRing(unsigned entries = kDefaultEntries);
  ~IoRing();

  IoRing(const IoRing&) = delete;
  IoRing& operator=(const IoRing&) = delete;

  [[nodiscard]] auto valid() const noexcept -> bool {
    return init_errno_ == 0;
  }
  [[nodiscard]] auto init_error() const noexcept -> std::error_code {
    return {init_errno_, std::system_category()};
  }
  [[nodiscard]] auto in_flight() const noexcept -> std::size_t {
    return in_flight_;
  }
  [[nodiscard]] auto wakeup_armed() const noexcept -> bool {
    return wakeup_armed_;
  }

  [[nodiscard]] auto prepare(const IoRequest& req) -> bool;
  auto flush() -> int;
  auto flush_if_batched() -> int;

  // Multishot poll on an eventfd. Its completions are routed to the wakeup
  // callback of reap() instead of being treated as operation results.
  auto arm_wakeup(int fd) -> bool;

  template <typename OnComplete, typename OnWakeup>
  auto reap(OnComplete&& on_complete, OnWakeup&& on_wakeup) -> unsigned {
    if (!valid())
      return 0;

    io_uring_cqe* cqe = nullptr;
    unsigned head = 0;
    unsigned seen = 0;
    io_uring_for_each_cqe(&ring_, head, cqe) {
      ++seen;
      auto* tag = io_uring_cqe_get_data(cqe);
      if (tag == wakeup_tag()) {
        if (!(cqe->flags & IORING_CQE_F_MORE))
          wakeup_armed_ = false;
        on_wakeup();
        continue;
      }
      if (tag == nullptr)
        continue;
      --in_flight_;
      on_complete(static_cast<io_data*>(tag), cqe->res);
    }
    io_uring_cq_advance(&ring_, seen);
    return seen;
  }

  // Blocks until a completion arrives or the timeout passes.
  auto wait(std::chrono::milliseconds timeout) -> void;

private:
  [[nodiscard]] auto wakeup_tag() noexcept -> void* {
    return &wakeup_armed_;
  }
  [[nodiscard]] auto next_sqe() -> io_uring_sqe*;

  io_uring ring_{};
  int init_errno_ = 0;
  unsigned unsubmitted_ = 0;
  std::size_t in_flight_ = 0;
  bool wakeup_armed_ = false;
};

}  // namespace paneld
