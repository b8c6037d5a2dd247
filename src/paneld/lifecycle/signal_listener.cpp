#include "paneld/lifecycle/signal_listener.hpp"

#include "paneld/core/runtime.hpp"
#include "paneld/util/log.hpp"

#include <poll.h>
#include <pthread.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace paneld {

SignalListener::SignalListener(ExitSignal& exit_signal, std::vector<int> signals)
    : exit_signal_(exit_signal), signals_(std::move(signals)) {
}

auto SignalListener::setup() -> Result<void> {
  sigset_t mask;
  sigemptyset(&mask);
  for (int sig : signals_) {
    sigaddset(&mask, sig);
  }

  if (int rc = pthread_sigmask(SIG_BLOCK, &mask, nullptr); rc != 0) {
    log::error("Failed to block signals: {}", strerror(rc));
    return fail(Error::SignalSetupFailed);
  }

  fd_.reset(signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC));
  if (!fd_) {
    log::error("Failed to create signalfd: {}", strerror(errno));
    return fail(Error::SignalSetupFailed);
  }
  return ok();
}

auto SignalListener::run() -> task<Result<void>> {
  if (!fd_) {
    co_return fail(Error::SignalSetupFailed);
  }

  while (true) {
    auto polled = co_await async_poll(fd_.get(), POLLIN);
    if (!polled) {
      log::error("Polling signal source failed: {}",
                 std::make_error_code(polled.error()).message());
      co_return fail(std::make_error_code(polled.error()));
    }

    signalfd_siginfo info{};
    auto n = ::read(fd_.get(), &info, sizeof(info));
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR)
        continue;
      int err = errno;
      log::error("Reading signal source failed: {}", strerror(err));
      co_return fail_errno(err);
    }
    if (static_cast<std::size_t>(n) != sizeof(info)) {
      log::error("Short read from signal source ({} bytes)", n);
      co_return fail(Error::SignalSetupFailed);
    }

    ++received_;
    auto signo = static_cast<int>(info.ssi_signo);
    if (exit_signal_.signal()) {
      log::info("Received {}, shutting down", strsignal(signo));
    } else {
      log::info("Received {} while already shutting down", strsignal(signo));
    }
  }
}

}  // namespace paneld
