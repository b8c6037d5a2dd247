#pragma once

#include "paneld/core/coroutine.hpp"
#include "paneld/core/error.hpp"
#include "paneld/lifecycle/exit_signal.hpp"
#include "paneld/util/unique_fd.hpp"

#include <csignal>
#include <cstddef>
#include <vector>

namespace paneld {

// Turns delivered process signals into ExitSignal::signal() through a
// signalfd, so no work happens inside an async signal handler.
class SignalListener {
public:
  explicit SignalListener(ExitSignal& exit_signal,
                          std::vector<int> signals = {SIGINT, SIGTERM});

  SignalListener(const SignalListener&) = delete;
  SignalListener& operator=(const SignalListener&) = delete;

  // Blocks the signals in the calling thread and opens the signalfd. Must run
  // before any runtime thread is created so every thread inherits the mask.
  [[nodiscard]] auto setup() -> Result<void>;

  // Runs on a runtime shard until the runtime stops. Returns only when reading
  // the signal source fails.
  auto run() -> task<Result<void>>;

  [[nodiscard]] auto signals_received() const noexcept -> std::size_t {
    return received_;
  }

private:
  ExitSignal& exit_signal_;
  std::vector<int> signals_;
  UniqueFd fd_;
  std::size_t received_{0};
};

}  // namespace paneld
