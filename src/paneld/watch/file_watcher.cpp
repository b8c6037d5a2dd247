#include "paneld/watch/file_watcher.hpp"

#include "paneld/core/runtime.hpp"
#include "paneld/util/log.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace paneld {

namespace {

constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE |
                                     IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO |
                                     IN_ATTRIB;

auto log_reload_response(ResponseReceiver response) -> spawn_task {
  auto result = co_await response;
  if (!result) {
    log::warn("Reload request ended without a response");
  } else if (result->is_success()) {
    log::info("Configuration reloaded");
  } else {
    log::error("Reload failed: {}", result->text);
  }
}

}  // namespace

FileWatcher::FileWatcher(Runtime& runtime, std::filesystem::path directory,
                         std::chrono::milliseconds cooldown)
    : runtime_(runtime),
      directory_(std::move(directory)),
      cooldown_(cooldown),
      gate_(std::make_shared<DebounceGate>()) {
}

auto FileWatcher::is_relevant_change(const std::filesystem::path& path)
    -> bool {
  const auto ext = path.extension().native();
  return ext == files::kWidgetExtension || ext == files::kStylesheetExtension;
}

auto FileWatcher::notify_change(const std::filesystem::path& path,
                                CommandSender& sink) -> Result<void> {
  if (!is_relevant_change(path)) {
    log::trace("Ignoring change to {}", path.string());
    return ok();
  }

  if (!gate_->try_close()) {
    log::trace("Reload already triggered, coalescing change to {}",
               path.string());
    return ok();
  }

  runtime_.spawn(reopen_after(gate_, cooldown_));

  log::debug("{} changed, requesting reload", path.string());
  auto [response_tx, response_rx] = make_oneshot<DaemonResponse>();
  if (auto r = sink.send(command::ReloadConfigAndCss{std::move(response_tx)});
      !r) {
    log::error("Cannot request reload: {}", r.error().message());
    return r;
  }
  reloads_requested_.fetch_add(1, std::memory_order_relaxed);
  runtime_.spawn(log_reload_response(std::move(response_rx)));
  return ok();
}

auto FileWatcher::setup() -> Result<void> {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory_, ec)) {
    log::error("Cannot watch {}: not a directory", directory_.string());
    return fail(Error::WatchSetupFailed);
  }

  inotify_fd_.reset(inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
  if (!inotify_fd_) {
    log::error("Failed to initialize inotify: {}", strerror(errno));
    return fail(Error::WatchSetupFailed);
  }

  return add_watch_recursive(directory_);
}

auto FileWatcher::add_watch(const std::filesystem::path& dir) -> Result<void> {
  int wd = inotify_add_watch(inotify_fd_.get(), dir.c_str(), kWatchMask);
  if (wd < 0) {
    log::error("Failed to add watch on {}: {}", dir.string(), strerror(errno));
    return fail(Error::WatchSetupFailed);
  }
  watches_[wd] = dir;
  return ok();
}

auto FileWatcher::add_watch_recursive(const std::filesystem::path& dir)
    -> Result<void> {
  if (auto r = add_watch(dir); !r) {
    return r;
  }

  std::error_code ec;
  auto it = std::filesystem::recursive_directory_iterator(
      dir, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    log::error("Failed to scan {}: {}", dir.string(), ec.message());
    return fail(Error::WatchSetupFailed);
  }

  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      log::error("Failed to scan {}: {}", dir.string(), ec.message());
      return fail(Error::WatchSetupFailed);
    }
    if (it->is_directory(ec)) {
      if (auto r = add_watch(it->path()); !r) {
        return r;
      }
    }
  }
  return ok();
}

auto FileWatcher::run(CommandSender sink) -> task<Result<void>> {
  if (auto r = setup(); !r) {
    co_return r;
  }
  log::info("Watching {} for changes ({} directories)", directory_.string(),
            watches_.size());

  alignas(inotify_event) std::array<std::byte, io::kEventBufferSize> buffer{};

  while (true) {
    auto polled = co_await async_poll(inotify_fd_.get(), POLLIN);
    if (!polled) {
      log::error("Polling inotify failed: {}",
                 std::make_error_code(polled.error()).message());
      co_return fail(Error::WatchSetupFailed);
    }

    auto len = ::read(inotify_fd_.get(), buffer.data(), buffer.size());
    if (len < 0) {
      if (errno != EAGAIN && errno != EINTR) {
        log::warn("Reading file events failed: {}", strerror(errno));
      }
      continue;
    }

    auto events = std::span<const std::byte>(buffer.data(),
                                             static_cast<std::size_t>(len));
    if (auto r = handle_events(events, sink); !r) {
      co_return r;
    }
  }
}

auto FileWatcher::handle_events(std::span<const std::byte> events,
                                CommandSender& sink) -> Result<void> {
  std::size_t i = 0;
  while (i + sizeof(inotify_event) <= events.size()) {
    const auto* event = reinterpret_cast<const inotify_event*>(events.data() + i);
    i += sizeof(inotify_event) + event->len;

    if (event->mask & IN_Q_OVERFLOW) {
      log::warn("File event queue overflowed, some changes were missed");
      continue;
    }
    if (event->mask & IN_IGNORED) {
      watches_.erase(event->wd);
      continue;
    }
    if (event->len == 0) {
      continue;
    }

    auto dir = watches_.find(event->wd);
    if (dir == watches_.end()) {
      continue;
    }
    auto path = dir->second / event->name;

    if ((event->mask & IN_ISDIR) && (event->mask & (IN_CREATE | IN_MOVED_TO))) {
      if (auto r = add_watch_recursive(path); !r) {
        log::warn("New directory {} is not watched", path.string());
      }
      continue;
    }

    if (auto r = notify_change(path, sink); !r) {
      return r;
    }
  }
  return ok();
}

}  // namespace paneld
