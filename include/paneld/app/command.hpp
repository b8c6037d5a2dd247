#pragma once

#include "paneld/core/channel.hpp"
#include "paneld/core/oneshot.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace paneld {

// Outcome of a command that reports back to its issuer.
struct DaemonResponse {
  enum class Kind : std::uint8_t {
    Success,
    Failure
  };

  Kind kind{Kind::Success};
  std::string text;

  [[nodiscard]] static auto success(std::string payload = {})
      -> DaemonResponse {
    return {Kind::Success, std::move(payload)};
  }
  [[nodiscard]] static auto failure(std::string message) -> DaemonResponse {
    return {Kind::Failure, std::move(message)};
  }

  [[nodiscard]] auto is_success() const noexcept -> bool {
    return kind == Kind::Success;
  }

  auto operator==(const DaemonResponse&) const -> bool = default;
};

using ResponseSender = OneshotSender<DaemonResponse>;
using ResponseReceiver = OneshotReceiver<DaemonResponse>;

namespace command {

struct ReloadConfigAndCss {
  ResponseSender response;
};

struct KillServer {};

struct UpdateVars {
  std::vector<std::pair<std::string, std::string>> vars;
};

struct PrintState {
  ResponseSender response;
};

}  // namespace command

// One unit of work for the UI loop.
using Command = std::variant<command::ReloadConfigAndCss, command::KillServer,
                             command::UpdateVars, command::PrintState>;

using CommandSender = Sender<Command>;
using CommandReceiver = Receiver<Command>;

[[nodiscard]] inline auto command_name(const Command& cmd) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"ReloadConfigAndCss", "KillServer",
                                        "UpdateVars", "PrintState"};
  return names[cmd.index()];
}

}  // namespace paneld
