#include "paneld/ipc/command_server.hpp"

#include "paneld/core/constants.hpp"
#include "paneld/core/runtime.hpp"
#include "paneld/util/log.hpp"

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

namespace paneld {

namespace {

// A client that hung up makes this fail with EPIPE; it never raises SIGPIPE.
auto write_all(int fd, std::string data) -> task<bool> {
  std::size_t written = 0;
  while (written < data.size()) {
    auto n = co_await async_send(
        fd, data.data() + written,
        static_cast<std::uint32_t>(data.size() - written));
    if (!n || *n == 0) {
      co_return false;
    }
    written += *n;
  }
  co_return true;
}

// Reads until the first newline or EOF, whichever comes first.
auto read_line(int fd) -> task<Result<std::string>> {
  std::string line;
  std::array<char, io::kReadBufferSize> buf{};

  while (line.find('\n') == std::string::npos) {
    auto n = co_await async_read(fd, buf.data(),
                                 static_cast<std::uint32_t>(buf.size()));
    if (!n) {
      co_return fail(std::make_error_code(n.error()));
    }
    if (*n == 0) {
      break;
    }
    line.append(buf.data(), *n);
    if (line.size() > io::kMaxRequestSize) {
      co_return fail(Error::ProtocolError);
    }
  }
  co_return line;
}

}  // namespace

CommandServer::CommandServer(Runtime& runtime, std::filesystem::path socket_path)
    : runtime_(runtime), socket_path_(std::move(socket_path)) {
}

CommandServer::~CommandServer() {
  if (listen_fd_) {
    listen_fd_.reset();
    std::error_code ec;
    std::filesystem::remove(socket_path_, ec);
  }
}

auto CommandServer::listen() -> Result<void> {
  if (listen_fd_) {
    return ok();
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  const auto& native = socket_path_.native();
  if (native.empty() || native.size() >= sizeof(addr.sun_path)) {
    log::error("Socket path '{}' is empty or too long", native);
    return fail(Error::SocketSetupFailed);
  }
  std::memcpy(addr.sun_path, native.c_str(), native.size() + 1);

  std::error_code ec;
  if (std::filesystem::remove(socket_path_, ec)) {
    log::debug("Removed stale socket {}", native);
  }

  UniqueFd fd{::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0)};
  if (!fd) {
    log::error("Failed to create socket: {}", strerror(errno));
    return fail(Error::SocketSetupFailed);
  }

  if (::bind(fd.get(), reinterpret_cast<const sockaddr*>(&addr),
             sizeof(addr)) < 0) {
    log::error("Failed to bind {}: {}", native, strerror(errno));
    return fail(Error::SocketSetupFailed);
  }
  if (::chmod(native.c_str(), S_IRUSR | S_IWUSR) < 0) {
    log::warn("Failed to restrict permissions on {}: {}", native,
              strerror(errno));
  }

  if (::listen(fd.get(), io::kListenBacklog) < 0) {
    log::error("Failed to listen on {}: {}", native, strerror(errno));
    std::filesystem::remove(socket_path_, ec);
    return fail(Error::SocketSetupFailed);
  }

  listen_fd_ = std::move(fd);
  return ok();
}

auto CommandServer::run(CommandSender sink) -> task<Result<void>> {
  if (auto r = listen(); !r) {
    co_return r;
  }
  log::info("Command server listening on {}", socket_path_.string());

  while (true) {
    auto client = co_await async_accept(listen_fd_.get());
    if (!client) {
      auto err = client.error();
      if (err == std::errc::interrupted ||
          err == std::errc::connection_aborted) {
        continue;
      }
      if (err == std::errc::too_many_files_open ||
          err == std::errc::too_many_files_open_in_system) {
        log::warn("Accept failed: {}, backing off",
                  std::make_error_code(err).message());
        (void)co_await async_sleep(std::chrono::milliseconds(100));
        continue;
      }
      log::error("Accept failed: {}", std::make_error_code(err).message());
      co_return fail(Error::SocketSetupFailed);
    }

    runtime_.spawn(handle_client(UniqueFd{*client}, sink));
  }
}

auto CommandServer::handle_client(UniqueFd client, CommandSender sink)
    -> spawn_task {
  auto line = co_await read_line(client.get());
  if (!line) {
    log::warn("Failed to read request: {}", line.error().message());
    (void)co_await write_all(
        client.get(),
        ipc::serialize_response(DaemonResponse::failure("unreadable request")));
    co_return;
  }

  auto request = ipc::parse_request(*line);
  DaemonResponse response;
  if (!request) {
    log::warn("Rejected malformed request");
    response = DaemonResponse::failure("malformed request");
  } else {
    log::debug("Received '{}' request", ipc::action_name(request->action));
    response = co_await dispatch(*request, sink);
    requests_handled_.fetch_add(1, std::memory_order_relaxed);
  }

  if (!co_await write_all(client.get(), ipc::serialize_response(response))) {
    log::debug("Client went away before the reply was written");
  }
}

auto CommandServer::dispatch(const ipc::Request& request, CommandSender& sink)
    -> task<DaemonResponse> {
  constexpr auto kShuttingDown = "daemon is shutting down";

  switch (request.action) {
  case ipc::Action::Kill:
    if (!sink.send(command::KillServer{})) {
      co_return DaemonResponse::failure(kShuttingDown);
    }
    co_return DaemonResponse::success();

  case ipc::Action::Update:
    if (!sink.send(command::UpdateVars{request.vars})) {
      co_return DaemonResponse::failure(kShuttingDown);
    }
    co_return DaemonResponse::success();

  case ipc::Action::Reload:
  case ipc::Action::State: {
    auto [tx, rx] = make_oneshot<DaemonResponse>();
    Command cmd = request.action == ipc::Action::Reload
                      ? Command{command::ReloadConfigAndCss{std::move(tx)}}
                      : Command{command::PrintState{std::move(tx)}};
    if (!sink.send(std::move(cmd))) {
      co_return DaemonResponse::failure(kShuttingDown);
    }
    auto reply = co_await rx;
    if (!reply) {
      co_return DaemonResponse::failure("no response from the UI loop");
    }
    co_return std::move(*reply);
  }
  }
  co_return DaemonResponse::failure("unsupported action");
}

}  // namespace paneld
