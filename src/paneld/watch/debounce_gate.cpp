#include "paneld/watch/debounce_gate.hpp"

#include "paneld/core/runtime.hpp"
#include "paneld/util/log.hpp"

#include <system_error>

namespace paneld {

auto reopen_after(std::shared_ptr<DebounceGate> gate,
                  std::chrono::milliseconds cooldown) -> spawn_task {
  auto slept = co_await async_sleep(cooldown);
  if (!slept) {
    // Never leave the gate stuck closed.
    log::warn("Debounce timer failed ({}), reopening early",
              std::make_error_code(slept.error()).message());
  }
  gate->reopen();
}

}  // namespace paneld
