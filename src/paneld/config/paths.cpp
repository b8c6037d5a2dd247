#include "paneld/config/paths.hpp"

#include <cstdlib>
#include <format>
#include <functional>
#include <system_error>

namespace paneld {

namespace {

auto env_dir(const char* name) -> std::filesystem::path {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return {};
  }
  return value;
}

auto home_dir() -> std::filesystem::path {
  auto home = env_dir("HOME");
  return home.empty() ? std::filesystem::path{"/tmp"} : home;
}

}  // namespace

auto default_config_dir() -> std::filesystem::path {
  auto base = env_dir("XDG_CONFIG_HOME");
  if (base.empty()) {
    base = home_dir() / ".config";
  }
  return base / "paneld";
}

auto config_dir_hash(const std::filesystem::path& dir) -> std::string {
  return std::format("{:016x}", std::hash<std::string>{}(dir.string()));
}

auto DaemonPaths::for_config_dir(const std::filesystem::path& dir)
    -> DaemonPaths {
  std::error_code ec;
  auto normalized = std::filesystem::weakly_canonical(dir, ec);
  if (ec) {
    normalized = std::filesystem::absolute(dir, ec).lexically_normal();
  }
  auto hash = config_dir_hash(normalized);

  auto cache = env_dir("XDG_CACHE_HOME");
  if (cache.empty()) {
    cache = home_dir() / ".cache";
  }

  auto runtime = env_dir("XDG_RUNTIME_DIR");
  if (runtime.empty()) {
    runtime = "/tmp";
  }

  return DaemonPaths{
      .config_dir = normalized,
      .log_file = cache / std::format("paneld_{}.log", hash),
      .socket_file = runtime / std::format("paneld-server_{}", hash),
  };
}

}  // namespace paneld
