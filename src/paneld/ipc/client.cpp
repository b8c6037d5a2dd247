#include "paneld/ipc/client.hpp"

#include "paneld/util/log.hpp"
#include "paneld/util/unique_fd.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

namespace paneld::ipc {

namespace {

auto connect_to(const std::filesystem::path& socket_path,
                std::chrono::milliseconds timeout) -> Result<UniqueFd> {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  const auto& native = socket_path.native();
  if (native.empty() || native.size() >= sizeof(addr.sun_path)) {
    return fail(Error::InvalidArgument);
  }
  std::memcpy(addr.sun_path, native.c_str(), native.size() + 1);

  UniqueFd fd{::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0)};
  if (!fd) {
    return fail_errno(errno);
  }

  auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  auto usecs =
      std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs);
  timeval tv{.tv_sec = secs.count(), .tv_usec = usecs.count()};
  if (::setsockopt(fd.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
      ::setsockopt(fd.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    return fail_errno(errno);
  }

  if (::connect(fd.get(), reinterpret_cast<const sockaddr*>(&addr),
                sizeof(addr)) < 0) {
    log::debug("connect({}) failed: {}", native, strerror(errno));
    return fail(Error::ConnectFailed);
  }
  return fd;
}

}  // namespace

auto send_request(const std::filesystem::path& socket_path,
                  const Request& request, std::chrono::milliseconds timeout)
    -> Result<DaemonResponse> {
  auto fd = connect_to(socket_path, timeout);
  if (!fd) {
    return fail(fd.error());
  }

  auto payload = serialize_request(request);
  std::size_t written = 0;
  while (written < payload.size()) {
    auto n = ::send(fd->get(), payload.data() + written,
                    payload.size() - written, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return fail_errno(errno);
    }
    written += static_cast<std::size_t>(n);
  }

  std::string line;
  std::array<char, io::kReadBufferSize> buf{};
  while (line.find('\n') == std::string::npos) {
    auto n = ::read(fd->get(), buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR)
        continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK)
        return fail(Error::NoResponse);
      return fail_errno(errno);
    }
    if (n == 0) {
      break;
    }
    line.append(buf.data(), static_cast<std::size_t>(n));
  }

  if (line.empty()) {
    return fail(Error::NoResponse);
  }
  return parse_response(line);
}

auto is_daemon_running(const std::filesystem::path& socket_path) -> bool {
  return connect_to(socket_path, std::chrono::milliseconds(500)).has_value();
}

}  // namespace paneld::ipc
