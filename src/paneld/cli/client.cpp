#include "paneld/cli/commands.hpp"
#include "paneld/config/paths.hpp"
#include "paneld/ipc/client.hpp"

#include <print>

namespace paneld::cli {

namespace {

auto round_trip(const std::filesystem::path& config_dir,
                const ipc::Request& request) -> Result<DaemonResponse> {
  auto paths = DaemonPaths::for_config_dir(config_dir);
  return ipc::send_request(paths.socket_file, request);
}

auto report(const Result<DaemonResponse>& result) -> int {
  if (!result) {
    if (result.error() == Error::ConnectFailed) {
      std::println(stderr, "Error: no daemon is running for this config");
    } else {
      std::println(stderr, "Error: {}", result.error().message());
    }
    return 1;
  }
  if (!result->is_success()) {
    std::println(stderr, "Error: {}", result->text);
    return 1;
  }
  if (!result->text.empty()) {
    std::print("{}", result->text);
  }
  return 0;
}

}  // namespace

auto cmd_reload(const ClientOptions& opts) -> int {
  return report(round_trip(opts.config_dir, {.action = ipc::Action::Reload}));
}

auto cmd_kill(const ClientOptions& opts) -> int {
  auto result = round_trip(opts.config_dir, {.action = ipc::Action::Kill});
  // The daemon may close the connection while shutting down.
  if (!result && result.error() == Error::NoResponse) {
    return 0;
  }
  return report(result);
}

auto cmd_update(const UpdateOptions& opts) -> int {
  if (opts.vars.empty()) {
    std::println(stderr, "Error: update requires at least one NAME=VALUE");
    return 1;
  }
  return report(round_trip(opts.config_dir,
                           {.action = ipc::Action::Update, .vars = opts.vars}));
}

auto cmd_state(const ClientOptions& opts) -> int {
  return report(round_trip(opts.config_dir, {.action = ipc::Action::State}));
}

}  // namespace paneld::cli
