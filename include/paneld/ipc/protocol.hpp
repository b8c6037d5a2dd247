#pragma once

#include "paneld/app/command.hpp"
#include "paneld/core/error.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace paneld::ipc {

// Wire format: one JSON object terminated by '\n' in each direction, one
// request per connection.
//   {"action":"reload"} {"action":"kill"} {"action":"state"}
//   {"action":"update","vars":{"name":"value",...}}
// Replies are {"ok":true,"payload":"..."} or {"ok":false,"error":"..."}.

enum class Action : std::uint8_t {
  Reload,
  Kill,
  Update,
  State
};

[[nodiscard]] auto action_name(Action action) noexcept -> std::string_view;

struct Request {
  Action action{Action::Reload};
  std::vector<std::pair<std::string, std::string>> vars;
};

[[nodiscard]] auto parse_request(std::string_view line) -> Result<Request>;
[[nodiscard]] auto serialize_request(const Request& request) -> std::string;

[[nodiscard]] auto parse_response(std::string_view line)
    -> Result<DaemonResponse>;
[[nodiscard]] auto serialize_response(const DaemonResponse& response)
    -> std::string;

}  // namespace paneld::ipc
