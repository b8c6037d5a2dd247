#pragma once

#include "paneld/app/app.hpp"
#include "paneld/app/command.hpp"
#include "paneld/core/coroutine.hpp"

#include <atomic>
#include <cstddef>

namespace paneld {

class Runtime;

// Single consumer of the command queue. Runs on a one-shard runtime and
// applies commands strictly one after another until told to stop or every
// sender is gone.
class UiLoop {
public:
  UiLoop(Runtime& ui_runtime, CommandReceiver receiver,
         ICommandHandler& handler);

  UiLoop(const UiLoop&) = delete;
  UiLoop& operator=(const UiLoop&) = delete;

  auto start() -> void;
  // Blocks the calling thread until the loop has ended.
  auto wait() const -> void;

  [[nodiscard]] auto is_finished() const noexcept -> bool {
    return finished_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto commands_applied() const noexcept -> std::size_t {
    return applied_.load(std::memory_order_acquire);
  }

private:
  auto run() -> spawn_task;

  Runtime& runtime_;
  CommandReceiver receiver_;
  ICommandHandler& handler_;
  std::atomic<std::size_t> applied_{0};
  std::atomic<bool> finished_{false};
};

}  // namespace paneld
