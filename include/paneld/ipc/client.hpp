#pragma once

#include "paneld/app/command.hpp"
#include "paneld/core/constants.hpp"
#include "paneld/core/error.hpp"
#include "paneld/ipc/protocol.hpp"

#include <chrono>
#include <filesystem>

namespace paneld::ipc {

// Blocking request/reply round trip used by the client subcommands.
[[nodiscard]] auto send_request(
    const std::filesystem::path& socket_path, const Request& request,
    std::chrono::milliseconds timeout = timing::kClientTimeout)
    -> Result<DaemonResponse>;

// True when something accepts connections on the socket.
[[nodiscard]] auto is_daemon_running(const std::filesystem::path& socket_path)
    -> bool;

}  // namespace paneld::ipc
