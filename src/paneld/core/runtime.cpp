#include "paneld/core/runtime.hpp"

#include "paneld/core/constants.hpp"
#include "paneld/util/log.hpp"

#include <pthread.h>

#include <exception>
#include <format>
#include <ranges>

namespace paneld {

Runtime::Runtime(unsigned num_shards, std::string name)
    : name_(std::move(name)) {
  if (num_shards == 0) {
    num_shards = std::thread::hardware_concurrency();
    if (num_shards == 0)
      num_shards = 1;
  }
  num_shards_ = num_shards;

  shards_.reserve(num_shards);
  for (auto i : std::views::iota(0u, num_shards)) {
    shards_.emplace_back(std::make_unique<Shard>(i));
  }
}

Runtime::~Runtime() {
  stop();
}

auto Runtime::start() -> void {
  if (running_.exchange(true))
    return;
  stop_requested_.store(false);

  for (auto& shard : shards_) {
    if (auto health = shard->health(); !health) {
      log::warn("Runtime '{}' shard {} cannot do I/O: {}", name_, shard->id(),
                health.error().message());
    }
  }

  threads_.reserve(num_shards_);
  for (auto i : std::views::iota(0u, num_shards_)) {
    threads_.emplace_back([this, i] { run_shard(i); });
  }
  log::debug("Runtime '{}' started with {} shard(s)", name_, num_shards_);
}

auto Runtime::stop() -> void {
  if (!running_.exchange(false))
    return;
  stop_requested_.store(true);

  for (auto i : std::views::iota(0u, num_shards_)) {
    wake_shard(i);
  }

  for (auto& t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();

  for (auto& shard : shards_) {
    if (auto n = shard->release_parked(); n > 0) {
      log::debug("Runtime '{}' shard {} dropped {} parked coroutine(s)", name_,
                 shard->id(), n);
    }
  }
  log::debug("Runtime '{}' stopped", name_);
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::current_shard() const noexcept -> shard_id {
  return is_current_shard() ? detail::current_shard_id : INVALID_SHARD;
}

auto Runtime::run_shard(shard_id id) -> void {
  detail::current_shard_id = id;
  detail::current_runtime = this;

  // Linux limits thread names to 15 characters.
  auto thread_name = std::format("{}-{}", name_, id).substr(0, 15);
  pthread_setname_np(pthread_self(), thread_name.c_str());

  auto& shard = *shards_[id];
  shard.attach();

  while (!stop_requested_.load(std::memory_order_acquire)) {
    bool progressed = shard.process_ready();
    shard.process_io();
    progressed |= shard.ring().flush_if_batched() > 0;
    progressed |= shard.reap_completions();
    if (progressed || shard.has_work())
      continue;

    shard.idle_wait(timing::kShardIdleWait);
    shard.reap_completions();
  }

  detail::current_shard_id = INVALID_SHARD;
  detail::current_runtime = nullptr;
}

auto Runtime::is_current_shard() const noexcept -> bool {
  return detail::current_shard_id != INVALID_SHARD &&
         this == detail::current_runtime;
}

auto Runtime::schedule_on(shard_id target, std::coroutine_handle<> handle)
    -> void {
  if (!handle || handle.done())
    return;
  if (target >= num_shards_)
    target = 0;

  if (is_current_shard() && target == detail::current_shard_id) {
    shards_[target]->schedule_local(handle);
  } else {
    while (!shards_[target]->schedule_remote(handle)) {
      std::this_thread::yield();
    }
    wake_shard(target);
  }
}

auto Runtime::schedule_external(std::coroutine_handle<> handle) -> void {
  auto target = next_shard_.fetch_add(1, std::memory_order_relaxed) % num_shards_;
  schedule_on(target, handle);
}

auto Runtime::spawn(spawn_task&& t) -> void {
  schedule_external(t.take());
}

auto Runtime::submit_io(IoRequest req) -> bool {
  if (!is_current_shard()) {
    log::error("Cannot submit IO: not in a shard context of '{}'", name_);
    return false;
  }

  auto& shard = *shards_[detail::current_shard_id];
  if (auto health = shard.health(); !health) {
    log::error("Cannot submit IO on '{}': {}", name_, health.error().message());
    return false;
  }

  shard.submit_io(std::move(req));
  return true;
}

auto Runtime::wake_shard(shard_id id) -> void {
  if (id < num_shards_) {
    shards_[id]->notify();
  }
}

auto Runtime::alloc_io_data() -> io_data* {
  return shards_[detail::current_shard_id]->acquire_io_data();
}

auto Runtime::free_io_data(io_data* data) -> void {
  if (data == nullptr)
    return;
  shards_[data->owner_shard]->release_io_data(data);
}

auto io_awaiter_base::submit(std::coroutine_handle<> handle, IoOp op) noexcept
    -> bool {
  auto* rt = detail::current_runtime;
  if (rt == nullptr || detail::current_shard_id == INVALID_SHARD) {
    submit_error_ = -EINVAL;
    return false;
  }

  data_ = rt->alloc_io_data();
  data_->coroutine = handle.address();
  if (!rt->submit_io(IoRequest{.op = op, .data = data_})) {
    rt->free_io_data(data_);
    data_ = nullptr;
    submit_error_ = -ENOTSUP;
    return false;
  }
  return true;
}

auto io_awaiter_base::take_result() noexcept -> std::int32_t {
  if (data_ == nullptr)
    return submit_error_;
  auto result = data_->result;
  detail::current_runtime->free_io_data(data_);
  data_ = nullptr;
  return result;
}

auto read_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  return submit(handle, io_op::Read{fd_, buf_, len_});
}

auto write_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  return submit(handle, io_op::Write{fd_, buf_, len_});
}

auto send_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  return submit(handle, io_op::Send{fd_, buf_, len_});
}

auto poll_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  return submit(handle, io_op::Poll{fd_, mask_});
}

auto accept_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  return submit(handle, io_op::Accept{listen_fd_});
}

auto sleep_awaiter::await_suspend(std::coroutine_handle<> handle) noexcept
    -> bool {
  return submit(handle, io_op::Timeout{duration_});
}

auto spawn_task::promise_type::unhandled_exception() const noexcept -> void {
  try {
    std::rethrow_exception(std::current_exception());
  } catch (const std::exception& e) {
    log::error("Detached task failed with exception: {}", e.what());
  } catch (...) {
    log::error("Detached task failed with a non-standard exception");
  }
}

}  // namespace paneld
