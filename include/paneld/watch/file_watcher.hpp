#pragma once

#include "paneld/app/command.hpp"
#include "paneld/core/constants.hpp"
#include "paneld/core/coroutine.hpp"
#include "paneld/core/error.hpp"
#include "paneld/util/unique_fd.hpp"
#include "paneld/watch/debounce_gate.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <unordered_map>

namespace paneld {

class Runtime;

// Watches the configuration tree and asks the UI loop to reload when a widget
// or stylesheet file changes, at most once per cooldown window.
class FileWatcher {
public:
  FileWatcher(Runtime& runtime, std::filesystem::path directory,
              std::chrono::milliseconds cooldown = timing::kDebounceCooldown);

  FileWatcher(const FileWatcher&) = delete;
  FileWatcher& operator=(const FileWatcher&) = delete;

  // Runs on a shard of `runtime` until the runtime stops. Returns early when
  // the watch cannot be set up or the command queue is gone.
  auto run(CommandSender sink) -> task<Result<void>>;

  // Filters, debounces and, if this change wins the gate, emits a reload.
  auto notify_change(const std::filesystem::path& path, CommandSender& sink)
      -> Result<void>;

  [[nodiscard]] static auto is_relevant_change(
      const std::filesystem::path& path) -> bool;

  [[nodiscard]] auto gate() const noexcept -> const DebounceGate& {
    return *gate_;
  }
  [[nodiscard]] auto reloads_requested() const noexcept -> std::size_t {
    return reloads_requested_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto directory() const noexcept
      -> const std::filesystem::path& {
    return directory_;
  }

private:
  auto setup() -> Result<void>;
  auto add_watch_recursive(const std::filesystem::path& dir) -> Result<void>;
  auto add_watch(const std::filesystem::path& dir) -> Result<void>;
  auto handle_events(std::span<const std::byte> events, CommandSender& sink)
      -> Result<void>;

  Runtime& runtime_;
  std::filesystem::path directory_;
  std::chrono::milliseconds cooldown_;
  std::shared_ptr<DebounceGate> gate_;
  UniqueFd inotify_fd_;
  std::unordered_map<int, std::filesystem::path> watches_;
  std::atomic<std::size_t> reloads_requested_{0};
};

}  // namespace paneld
