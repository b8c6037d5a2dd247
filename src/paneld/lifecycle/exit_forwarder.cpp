#include "paneld/lifecycle/exit_forwarder.hpp"

#include "paneld/util/log.hpp"

namespace paneld {

auto forward_exit(ExitSignal& exit_signal, CommandSender sink)
    -> task<Result<void>> {
  co_await exit_signal.wait();

  if (auto r = sink.send(command::KillServer{}); !r) {
    log::warn("Could not forward shutdown to the UI loop: {}",
              r.error().message());
  } else {
    log::debug("Forwarded shutdown to the UI loop");
  }
  co_return ok();
}

}  // namespace paneld
