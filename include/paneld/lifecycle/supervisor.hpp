#pragma once

#include "paneld/core/coroutine.hpp"
#include "paneld/core/error.hpp"

#include <string>
#include <vector>

namespace paneld {

class Runtime;

// Runs a fixed set of long-lived tasks concurrently and reports the first
// failure. Tasks are not restarted.
class Supervisor {
public:
  explicit Supervisor(Runtime& runtime) noexcept : runtime_(runtime) {
  }

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  auto add(std::string name, task<Result<void>> body) -> void;

  // Spawns every added task on the runtime, then waits. Completes with the
  // first error without waiting for the rest, or with success once every task
  // has finished successfully.
  auto run() -> task<Result<void>>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return tasks_.size();
  }

private:
  struct Entry {
    std::string name;
    task<Result<void>> body;
  };

  Runtime& runtime_;
  std::vector<Entry> tasks_;
};

}  // namespace paneld
