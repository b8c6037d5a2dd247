#pragma once

#include "paneld/app/command.hpp"
#include "paneld/core/coroutine.hpp"
#include "paneld/core/error.hpp"
#include "paneld/lifecycle/exit_signal.hpp"

namespace paneld {

// Waits for shutdown and asks the UI loop to stop, once.
auto forward_exit(ExitSignal& exit_signal, CommandSender sink)
    -> task<Result<void>>;

}  // namespace paneld
