#include "paneld/util/daemon.hpp"

#include "paneld/util/unique_fd.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>

namespace paneld {

auto redirect_terminal_streams(int log_fd, std::span<const int> fds,
                               const TtyCheck& is_terminal) -> Result<void> {
  for (int fd : fds) {
    if (!is_terminal(fd)) {
      continue;
    }
    while (::dup2(log_fd, fd) < 0) {
      if (errno != EINTR) {
        return fail(Error::RedirectFailed);
      }
    }
  }
  return ok();
}

auto redirect_terminal_streams(int log_fd, std::span<const int> fds)
    -> Result<void> {
  return redirect_terminal_streams(log_fd, fds,
                                   [](int fd) { return ::isatty(fd) == 1; });
}

auto detach(const std::filesystem::path& log_file) -> Result<void> {
  std::error_code ec;
  if (log_file.has_parent_path()) {
    std::filesystem::create_directories(log_file.parent_path(), ec);
  }

  UniqueFd log_fd{::open(log_file.c_str(),
                         O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644)};
  if (!log_fd) {
    std::println(stderr, "Error: cannot open log file {}: {}",
                 log_file.string(), std::strerror(errno));
    return fail(Error::LogFileOpenFailed);
  }

  std::fflush(nullptr);
  pid_t pid = ::fork();
  if (pid < 0) {
    return fail(Error::ForkFailed);
  }
  if (pid > 0) {
    ::_exit(0);
  }

  if (::setsid() < 0) {
    return fail(Error::SessionFailed);
  }

  constexpr std::array streams{STDOUT_FILENO, STDERR_FILENO};
  return redirect_terminal_streams(log_fd.get(), streams);
}

}  // namespace paneld
