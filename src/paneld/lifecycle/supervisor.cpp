#include "paneld/lifecycle/supervisor.hpp"

#include "paneld/core/channel.hpp"
#include "paneld/core/runtime.hpp"
#include "paneld/util/log.hpp"

#include <exception>

namespace paneld {

namespace {

struct TaskOutcome {
  std::string name;
  Result<void> result;
};

auto run_supervised(std::string name, task<Result<void>> body,
                    Sender<TaskOutcome> outcomes) -> spawn_task {
  Result<void> result = ok();
  try {
    result = co_await std::move(body);
  } catch (const std::exception& e) {
    log::error("Task '{}' threw: {}", name, e.what());
    result = fail(Error::Unknown);
  }
  // The supervisor may already have returned on an earlier failure.
  (void)outcomes.send(TaskOutcome{std::move(name), std::move(result)});
}

}  // namespace

auto Supervisor::add(std::string name, task<Result<void>> body) -> void {
  tasks_.push_back(Entry{std::move(name), std::move(body)});
}

auto Supervisor::run() -> task<Result<void>> {
  auto channel = make_channel<TaskOutcome>();
  auto outcome_rx = std::move(channel.second);
  auto total = tasks_.size();

  {
    // Only the spawned tasks may keep the channel open.
    auto outcome_tx = std::move(channel.first);
    for (auto& entry : tasks_) {
      log::debug("Starting task '{}'", entry.name);
      runtime_.spawn(
          run_supervised(entry.name, std::move(entry.body), outcome_tx));
    }
    tasks_.clear();
  }

  std::size_t finished = 0;
  while (finished < total) {
    auto outcome = co_await outcome_rx.recv();
    if (!outcome) {
      log::error("Supervised tasks vanished without reporting");
      co_return fail(Error::Cancelled);
    }
    if (!outcome->result) {
      log::error("Task '{}' failed: {}", outcome->name,
                 outcome->result.error().message());
      co_return fail(outcome->result.error());
    }
    log::info("Task '{}' finished", outcome->name);
    ++finished;
  }
  co_return ok();
}

}  // namespace paneld
