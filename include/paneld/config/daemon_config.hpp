#pragma once

#include "paneld/core/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace paneld {

struct DaemonConfig {
  std::string log_level{"info"};
  unsigned worker_threads{2};
};

class DaemonConfigLoader {
public:
  // A missing file yields the defaults; an unreadable or invalid one fails.
  [[nodiscard]] static auto load_from_file(const std::filesystem::path& path)
      -> Result<DaemonConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<DaemonConfig>;
};

}  // namespace paneld
