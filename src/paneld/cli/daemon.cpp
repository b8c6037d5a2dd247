#include "paneld/app/app.hpp"
#include "paneld/app/ui_loop.hpp"
#include "paneld/cli/commands.hpp"
#include "paneld/config/daemon_config.hpp"
#include "paneld/config/paths.hpp"
#include "paneld/core/channel.hpp"
#include "paneld/core/runtime.hpp"
#include "paneld/ipc/client.hpp"
#include "paneld/ipc/command_server.hpp"
#include "paneld/lifecycle/exit_forwarder.hpp"
#include "paneld/lifecycle/exit_signal.hpp"
#include "paneld/lifecycle/signal_listener.hpp"
#include "paneld/lifecycle/supervisor.hpp"
#include "paneld/util/daemon.hpp"
#include "paneld/util/log.hpp"
#include "paneld/watch/file_watcher.hpp"

#include <unistd.h>

#include <atomic>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <print>

namespace paneld::cli {

namespace {

// Losing the signal source means the daemon can no longer be stopped cleanly.
auto listen_for_signals(SignalListener& listener) -> spawn_task {
  auto r = co_await listener.run();
  if (!r) {
    log::error("Signal handling failed: {}", r.error().message());
    log::stop();
    ::_exit(1);
  }
}

auto supervise(Supervisor& supervisor, ExitSignal& exit_signal,
               std::atomic<bool>& failed) -> spawn_task {
  auto r = co_await supervisor.run();
  if (!r) {
    failed.store(true, std::memory_order_release);
    log::error("Background task failed, shutting down: {}",
               r.error().message());
    exit_signal.signal();
  }
}

}  // namespace

auto cmd_daemon(const DaemonOptions& opts) -> int {
  auto paths = DaemonPaths::for_config_dir(opts.config_dir);

  std::error_code ec;
  if (!std::filesystem::is_directory(paths.config_dir, ec)) {
    std::println(stderr, "Error: config directory not found: {}",
                 paths.config_dir.string());
    return 1;
  }

  if (ipc::is_daemon_running(paths.socket_file)) {
    std::println(stderr, "Error: a daemon is already running on {}",
                 paths.socket_file.string());
    return 1;
  }

  auto config = DaemonConfigLoader::load_from_file(paths.daemon_config());
  if (!config) {
    std::println(stderr, "Error: {}: {}", paths.daemon_config().string(),
                 config.error().message());
    return 1;
  }

  if (opts.daemonize) {
    if (auto r = detach(paths.log_file); !r) {
      std::println(stderr, "Error: failed to daemonize: {}",
                   r.error().message());
      return 1;
    }
  }

  // Signals must be blocked before the first thread (the log writer) exists.
  // Replies are sent with MSG_NOSIGNAL already; this covers the log stream
  // when stderr is a pipe whose reader has gone.
  std::signal(SIGPIPE, SIG_IGN);
  ExitSignal exit_signal;
  SignalListener signals(exit_signal);
  if (auto r = signals.setup(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  log::set_level(opts.log_level.value_or(config->log_level));
  log::start();
  log::info("paneld starting (pid {}, config {})", ::getpid(),
            paths.config_dir.string());

  if (::chdir(paths.config_dir.c_str()) < 0) {
    log::error("Failed to enter {}: {}", paths.config_dir.string(),
               strerror(errno));
    log::stop();
    return 1;
  }

  App app(paths);
  if (auto r = app.load_initial(); !r) {
    log::error("Initial configuration failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  Runtime worker(config->worker_threads, "paneld-worker");
  Runtime ui(1, "paneld-ui");

  FileWatcher watcher(worker, paths.config_dir);
  CommandServer server(worker, paths.socket_file);
  if (auto r = server.listen(); !r) {
    log::error("Command server failed: {}", r.error().message());
    log::stop();
    return 1;
  }

  auto [sink, receiver] = make_channel<Command>();
  UiLoop ui_loop(ui, std::move(receiver), app);

  Supervisor supervisor(worker);
  {
    auto producers = std::move(sink);
    supervisor.add("file-watcher", watcher.run(producers));
    supervisor.add("command-server", server.run(producers));
    supervisor.add("exit-forwarder", forward_exit(exit_signal, producers));
  }

  std::atomic<bool> supervisor_failed{false};

  worker.start();
  ui.start();
  worker.spawn(listen_for_signals(signals));
  worker.spawn(supervise(supervisor, exit_signal, supervisor_failed));
  ui_loop.start();

  ui_loop.wait();
  log::info("UI loop finished after {} commands, stopping",
            ui_loop.commands_applied());

  exit_signal.signal();
  ui.stop();
  worker.stop();

  bool failed = supervisor_failed.load(std::memory_order_acquire);
  log::info("paneld stopped{}", failed ? " after a task failure" : "");
  log::stop();
  return failed ? 1 : 0;
}

}  // namespace paneld::cli
