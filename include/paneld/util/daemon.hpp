#pragma once

#include "paneld/core/error.hpp"

#include <filesystem>
#include <functional>
#include <span>

namespace paneld {

using TtyCheck = std::function<bool(int fd)>;

// Points every descriptor in `fds` that is a terminal at `log_fd`; others are
// left alone.
[[nodiscard]] auto redirect_terminal_streams(int log_fd, std::span<const int> fds,
                                             const TtyCheck& is_terminal)
    -> Result<void>;

[[nodiscard]] auto redirect_terminal_streams(int log_fd,
                                             std::span<const int> fds)
    -> Result<void>;

// Detaches from the controlling terminal. Opens the log file first, forks
// once (the parent exits 0), starts a new session in the child and sends
// terminal-bound stdout/stderr to the log. Must run before any thread exists.
[[nodiscard]] auto detach(const std::filesystem::path& log_file) -> Result<void>;

}  // namespace paneld
