#pragma once

#include "paneld/core/constants.hpp"

#include <filesystem>
#include <string>

namespace paneld {

// Every location the daemon and its clients agree on. Log file and socket
// names carry a hash of the config directory so each config directory gets
// its own daemon.
struct DaemonPaths {
  std::filesystem::path config_dir;
  std::filesystem::path log_file;
  std::filesystem::path socket_file;

  [[nodiscard]] static auto for_config_dir(const std::filesystem::path& dir)
      -> DaemonPaths;

  [[nodiscard]] auto widget_config() const -> std::filesystem::path {
    return config_dir / files::kWidgetConfig;
  }
  [[nodiscard]] auto stylesheet() const -> std::filesystem::path {
    return config_dir / files::kStylesheet;
  }
  [[nodiscard]] auto daemon_config() const -> std::filesystem::path {
    return config_dir / files::kDaemonConfig;
  }
};

// $XDG_CONFIG_HOME/paneld, or ~/.config/paneld.
[[nodiscard]] auto default_config_dir() -> std::filesystem::path;

[[nodiscard]] auto config_dir_hash(const std::filesystem::path& dir)
    -> std::string;

}  // namespace paneld
