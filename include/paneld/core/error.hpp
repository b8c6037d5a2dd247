#pragma once

#include <concepts>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace paneld {

enum class Error : int {
  Success,
  ForkFailed,
  SessionFailed,
  LogFileOpenFailed,
  RedirectFailed,
  ChdirFailed,
  ConfigNotFound,
  ConfigReadFailed,
  ConfigParseError,
  WatchSetupFailed,
  SignalSetupFailed,
  SocketSetupFailed,
  ConnectFailed,
  ProtocolError,
  ChannelClosed,
  NoResponse,
  AlreadyRunning,
  InvalidArgument,
  Cancelled,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "failed to fork daemon process",
      "failed to create new session",
      "failed to open log file",
      "failed to redirect standard stream",
      "failed to change working directory",
      "configuration file not found",
      "failed to read configuration file",
      "configuration parse error",
      "failed to set up file watch",
      "failed to set up signal handling",
      "failed to set up command socket",
      "failed to connect to daemon",
      "malformed protocol message",
      "channel closed",
      "no response received",
      "daemon already running",
      "invalid argument",
      "cancelled",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "paneld";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

// errno captured at the failure site, for OS-level failures
[[nodiscard]] inline auto fail_errno(int err)
    -> std::unexpected<std::error_code> {
  return std::unexpected{std::error_code{err, std::system_category()}};
}

}  // namespace paneld

template <>
struct std::is_error_code_enum<paneld::Error> : std::true_type {};
