#include "paneld/core/io_ring.hpp"

#include <sys/socket.h>

#include <poll.h>

namespace paneld {

namespace {

// Fills a submission entry for each kind of operation.
struct SqePreparer {
  io_uring_sqe* sqe;
  io_data* data;

  auto operator()(const io_op::Read& op) const -> void {
    io_uring_prep_read(sqe, op.fd, op.buf, op.len, static_cast<__u64>(-1));
  }
  auto operator()(const io_op::Write& op) const -> void {
    io_uring_prep_write(sqe, op.fd, op.buf, op.len, static_cast<__u64>(-1));
  }
  auto operator()(const io_op::Send& op) const -> void {
    io_uring_prep_send(sqe, op.fd, op.buf, op.len, MSG_NOSIGNAL);
  }
  auto operator()(const io_op::Poll& op) const -> void {
    io_uring_prep_poll_add(sqe, op.fd, op.mask);
  }
  auto operator()(const io_op::Accept& op) const -> void {
    io_uring_prep_accept(sqe, op.listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
  }
  // The timespec must outlive the submission, so it lives in io_data.
  auto operator()(const io_op::Timeout& op) const -> void {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(op.duration);
    data->ts.tv_sec = secs.count();
    data->ts.tv_nsec = (op.duration - secs).count();
    io_uring_prep_timeout(sqe, &data->ts, 0, 0);
  }
};

}  // namespace

IoRing::IoRing(unsigned entries) {
  if (auto ret = io_uring_queue_init(entries, &ring_, 0); ret < 0) {
    init_errno_ = -ret;
  }
}

IoRing::~IoRing() {
  if (valid()) {
    io_uring_queue_exit(&ring_);
  }
}

auto IoRing::next_sqe() -> io_uring_sqe* {
  auto* sqe = io_uring_get_sqe(&ring_);
  if (sqe == nullptr) {
    // Submission queue full: push what is queued and retry once.
    flush();
    sqe = io_uring_get_sqe(&ring_);
  }
  return sqe;
}

auto IoRing::prepare(const IoRequest& req) -> bool {
  if (!valid() || req.data == nullptr)
    return false;

  auto* sqe = next_sqe();
  if (sqe == nullptr)
    return false;

  std::visit(SqePreparer{sqe, req.data}, req.op);
  io_uring_sqe_set_data(sqe, req.data);
  ++unsubmitted_;
  ++in_flight_;
  return true;
}

auto IoRing::flush() -> int {
  if (unsubmitted_ == 0)
    return 0;
  unsubmitted_ = 0;
  return io_uring_submit(&ring_);
}

auto IoRing::flush_if_batched() -> int {
  if (unsubmitted_ < kSubmitBatch)
    return 0;
  return flush();
}

auto IoRing::arm_wakeup(int fd) -> bool {
  if (!valid() || fd < 0)
    return false;
  if (wakeup_armed_)
    return true;

  auto* sqe = next_sqe();
  if (sqe == nullptr)
    return false;

  io_uring_prep_poll_multishot(sqe, fd, POLLIN);
  io_uring_sqe_set_data(sqe, wakeup_tag());
  ++unsubmitted_;
  wakeup_armed_ = true;
  flush();
  return true;
}

auto IoRing::wait(std::chrono::milliseconds timeout) -> void {
  if (!valid())
    return;

  flush();
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  __kernel_timespec ts{
      .tv_sec = secs.count(),
      .tv_nsec =
          std::chrono::duration_cast<std::chrono::nanoseconds>(timeout - secs)
              .count()};
  io_uring_cqe* cqe = nullptr;
  // -ETIME and -EINTR both just mean "go round the loop again".
  (void)io_uring_wait_cqe_timeout(&ring_, &cqe, &ts);
}

}  // namespace paneld
