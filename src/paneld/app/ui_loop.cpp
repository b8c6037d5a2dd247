#include "paneld/app/ui_loop.hpp"

#include "paneld/core/runtime.hpp"
#include "paneld/util/log.hpp"

#include <exception>

namespace paneld {

UiLoop::UiLoop(Runtime& ui_runtime, CommandReceiver receiver,
               ICommandHandler& handler)
    : runtime_(ui_runtime), receiver_(std::move(receiver)), handler_(handler) {
}

auto UiLoop::start() -> void {
  runtime_.spawn(run());
}

auto UiLoop::wait() const -> void {
  finished_.wait(false, std::memory_order_acquire);
}

auto UiLoop::run() -> spawn_task {
  while (true) {
    auto cmd = co_await receiver_.recv();
    if (!cmd) {
      log::info("Command queue closed, leaving the UI loop");
      break;
    }

    auto control = LoopControl::Continue;
    try {
      control = handler_.handle(std::move(*cmd));
    } catch (const std::exception& e) {
      log::error("Command handler threw: {}", e.what());
    }
    applied_.fetch_add(1, std::memory_order_release);

    if (control == LoopControl::Stop) {
      break;
    }
  }

  finished_.store(true, std::memory_order_release);
  finished_.notify_all();
}

}  // namespace paneld
