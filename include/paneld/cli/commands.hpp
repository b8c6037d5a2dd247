#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace paneld::cli {

struct DaemonOptions {
  std::filesystem::path config_dir;
  bool daemonize{true};
  std::optional<std::string> log_level;
};

struct ClientOptions {
  std::filesystem::path config_dir;
};

struct UpdateOptions {
  std::filesystem::path config_dir;
  std::vector<std::pair<std::string, std::string>> vars;
};

[[nodiscard]] auto cmd_daemon(const DaemonOptions& opts) -> int;
[[nodiscard]] auto cmd_reload(const ClientOptions& opts) -> int;
[[nodiscard]] auto cmd_kill(const ClientOptions& opts) -> int;
[[nodiscard]] auto cmd_update(const UpdateOptions& opts) -> int;
[[nodiscard]] auto cmd_state(const ClientOptions& opts) -> int;

}  // namespace paneld::cli
