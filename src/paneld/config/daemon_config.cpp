#include "paneld/config/daemon_config.hpp"

#include "paneld/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace paneld {

namespace {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) {
  { n.as<T>() };
};

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || !field.IsScalar()) {
    return default_val;
  }
  return field.as<T>();
}

}  // namespace

}  // namespace paneld

namespace YAML {

template <>
struct convert<paneld::DaemonConfig> {
  static bool decode(const Node& node, paneld::DaemonConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    c.log_level = paneld::yaml_get_or<std::string>(node, "log_level", "info");
    c.worker_threads = paneld::yaml_get_or(node, "worker_threads", 2u);
    return true;
  }
};

}  // namespace YAML

namespace paneld {

auto DaemonConfigLoader::load_from_file(const std::filesystem::path& path)
    -> Result<DaemonConfig> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    log::debug("No {} found, using defaults", path.string());
    return DaemonConfig{};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path.string());
    return fail(Error::ConfigReadFailed);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto DaemonConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<DaemonConfig> {
  DaemonConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      return config;
    }
    config = root.as<DaemonConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ConfigParseError);
  }

  if (!log::parse_level(config.log_level)) {
    log::error("Unknown log_level '{}'", config.log_level);
    return fail(Error::ConfigParseError);
  }
  if (config.worker_threads == 0) {
    log::error("worker_threads must be at least 1");
    return fail(Error::ConfigParseError);
  }
  return ok(std::move(config));
}

}  // namespace paneld
