#pragma once

#include "paneld/core/lockfree_queue.hpp"

#include <pthread.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace paneld::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

inline constexpr std::array<std::string_view, 5> kLevelNames = {
    "trace", "debug", "info", "warn", "error"};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  return kLevelNames[static_cast<std::size_t>(level)];
}

// Used by both --log-level and daemon.yaml, so an unknown name is rejected
// the same way in both places.
[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  for (std::size_t i = 0; i < kLevelNames.size(); ++i) {
    if (kLevelNames[i] == name)
      return static_cast<Level>(i);
  }
  return std::nullopt;
}

namespace detail {

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  switch (level) {
    case Level::Trace:
      return "\033[90m";
    case Level::Debug:
      return "\033[36m";
    case Level::Info:
      return "\033[32m";
    case Level::Warn:
      return "\033[33m";
    case Level::Error:
      return "\033[31m";
  }
  return "";
}

// Runtime shards name their threads "<runtime>-<shard>"; that name is what
// identifies a line's origin in the daemon log. Other threads show whatever
// the OS reports, which is the process name for the main thread.
inline auto thread_label() -> const std::string& {
  thread_local const std::string label = [] {
    std::array<char, 16> name{};
    if (::pthread_getname_np(::pthread_self(), name.data(), name.size()) == 0 &&
        name[0] != '\0') {
      return std::string{name.data()};
    }
    return std::string{"?"};
  }();
  return label;
}

inline thread_local std::string t_line = [] {
  std::string s;
  s.reserve(1024);
  return s;
}();

}  // namespace detail

// Async logger. Producers format on their own thread and push the finished
// line; a writer thread prints them to stderr, which the daemon has pointed
// at its log file by then. stdout is left to command output.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kWriteBatch = 64;
  static constexpr auto kIdleSleep = std::chrono::milliseconds(1);

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<bool> colored_{false};
  BoundedMPSCQueue<std::string> queue_{kQueueCapacity};
  std::thread writer_;

  static auto write_line(std::string_view line) -> void {
    std::print(stderr, "{}", line);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(kWriteBatch);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < kWriteBatch) {
        auto line = queue_.try_pop();
        if (!line)
          break;
        batch.push_back(std::move(*line));
      }

      if (batch.empty()) {
        std::this_thread::sleep_for(kIdleSleep);
        continue;
      }
      for (const auto& line : batch) {
        write_line(line);
      }
      std::fflush(stderr);
    }

    // accepting_ is already false here, nothing new can arrive
    queue_.drain([](std::string&& line) { write_line(line); });
    std::fflush(stderr);
  }

  template <typename... Args>
  auto format_line(std::string& out, Level level,
                   std::format_string<Args...> fmt, Args&&... args) -> void {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    bool colored = colored_.load(std::memory_order_relaxed);
    std::format_to(std::back_inserter(out), "[{:%Y-%m-%d %H:%M:%S}] ", now);
    if (colored) {
      std::format_to(std::back_inserter(out), "{}{:<5}\033[0m",
                     detail::level_color(level), level_name(level));
    } else {
      std::format_to(std::back_inserter(out), "{:<5}", level_name(level));
    }
    std::format_to(std::back_inserter(out), " [{}] ", detail::thread_label());
    std::format_to(std::back_inserter(out), fmt, std::forward<Args>(args)...);
    out.push_back('\n');
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Must not be called before the daemon has forked; the writer is a thread.
  auto start() -> void {
    if (running_.exchange(true))
      return;
    colored_.store(::isatty(STDERR_FILENO) == 1, std::memory_order_relaxed);
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] {
      ::pthread_setname_np(::pthread_self(), "log-writer");
      writer_loop();
    });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (!running_.exchange(false))
      return;

    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (!enabled(level))
      return;

    auto& line = detail::t_line;
    line.clear();
    format_line(line, level, fmt, std::forward<Args>(args)...);

    // Synchronous before start() and after stop(), and when the queue is full
    if (!accepting_.load(std::memory_order_acquire) || !queue_.push(line)) {
      write_line(line);
      std::fflush(stderr);
    }
  }
};

inline auto logger() -> Logger& {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

// Unknown names leave the level unchanged.
inline auto set_level(std::string_view name) noexcept -> void {
  if (auto level = parse_level(name)) {
    logger().set_level(*level);
  }
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace paneld::log
