#include "paneld/ipc/protocol.hpp"

#include "paneld/util/log.hpp"

#include <nlohmann/json.hpp>

namespace paneld::ipc {

using json = nlohmann::json;

namespace {

// A message ends at its first newline; anything after it is not part of it.
auto first_line(std::string_view data) -> std::string_view {
  auto line = data.substr(0, data.find('\n'));
  if (line.ends_with('\r')) {
    line.remove_suffix(1);
  }
  return line;
}

auto parse_action(std::string_view name) -> Result<Action> {
  if (name == "reload")
    return Action::Reload;
  if (name == "kill")
    return Action::Kill;
  if (name == "update")
    return Action::Update;
  if (name == "state")
    return Action::State;
  return fail(Error::ProtocolError);
}

}  // namespace

auto action_name(Action action) noexcept -> std::string_view {
  constexpr std::string_view names[] = {"reload", "kill", "update", "state"};
  return names[static_cast<std::uint8_t>(action)];
}

auto parse_request(std::string_view line) -> Result<Request> {
  auto parsed = json::parse(first_line(line), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    log::debug("Request is not a JSON object");
    return fail(Error::ProtocolError);
  }

  auto action_it = parsed.find("action");
  if (action_it == parsed.end() || !action_it->is_string()) {
    log::debug("Request has no action");
    return fail(Error::ProtocolError);
  }

  auto action = parse_action(action_it->get_ref<const std::string&>());
  if (!action) {
    log::debug("Unknown action '{}'", action_it->get<std::string>());
    return fail(action.error());
  }

  Request request{.action = *action};
  if (request.action != Action::Update) {
    return request;
  }

  auto vars_it = parsed.find("vars");
  if (vars_it == parsed.end() || !vars_it->is_object() || vars_it->empty()) {
    log::debug("Update request without variables");
    return fail(Error::ProtocolError);
  }
  for (const auto& [name, value] : vars_it->items()) {
    if (name.empty() || !value.is_string()) {
      log::debug("Variable '{}' has no string value", name);
      return fail(Error::ProtocolError);
    }
    request.vars.emplace_back(name, value.get<std::string>());
  }
  return request;
}

auto serialize_request(const Request& request) -> std::string {
  json j = {{"action", action_name(request.action)}};
  if (request.action == Action::Update) {
    auto vars = json::object();
    for (const auto& [name, value] : request.vars) {
      vars[name] = value;
    }
    j["vars"] = std::move(vars);
  }
  return j.dump() + "\n";
}

auto parse_response(std::string_view line) -> Result<DaemonResponse> {
  auto parsed = json::parse(first_line(line), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return fail(Error::ProtocolError);
  }

  auto ok_it = parsed.find("ok");
  if (ok_it == parsed.end() || !ok_it->is_boolean()) {
    return fail(Error::ProtocolError);
  }

  if (ok_it->get<bool>()) {
    return DaemonResponse::success(parsed.value("payload", std::string{}));
  }
  return DaemonResponse::failure(parsed.value("error", std::string{}));
}

auto serialize_response(const DaemonResponse& response) -> std::string {
  json j;
  if (response.is_success()) {
    j = {{"ok", true}, {"payload", response.text}};
  } else {
    j = {{"ok", false}, {"error", response.text}};
  }
  return j.dump() + "\n";
}

}  // namespace paneld::ipc
