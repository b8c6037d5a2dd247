#pragma once

#include "paneld/app/command.hpp"
#include "paneld/core/coroutine.hpp"
#include "paneld/core/error.hpp"
#include "paneld/ipc/protocol.hpp"
#include "paneld/util/unique_fd.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>

namespace paneld {

class Runtime;

// Accepts client connections on a Unix stream socket and turns each valid
// request into exactly one Command on the queue.
class CommandServer {
public:
  CommandServer(Runtime& runtime, std::filesystem::path socket_path);
  ~CommandServer();

  CommandServer(const CommandServer&) = delete;
  CommandServer& operator=(const CommandServer&) = delete;

  // Binds the socket, replacing a stale socket file. run() calls this itself
  // when it has not been done yet.
  [[nodiscard]] auto listen() -> Result<void>;

  // Accept loop; runs on a shard of `runtime` until the runtime stops.
  auto run(CommandSender sink) -> task<Result<void>>;

  [[nodiscard]] auto socket_path() const noexcept
      -> const std::filesystem::path& {
    return socket_path_;
  }
  [[nodiscard]] auto requests_handled() const noexcept -> std::size_t {
    return requests_handled_.load(std::memory_order_relaxed);
  }

private:
  auto handle_client(UniqueFd client, CommandSender sink) -> spawn_task;
  auto dispatch(const ipc::Request& request, CommandSender& sink)
      -> task<DaemonResponse>;

  Runtime& runtime_;
  std::filesystem::path socket_path_;
  UniqueFd listen_fd_;
  std::atomic<std::size_t> requests_handled_{0};
};

}  // namespace paneld
