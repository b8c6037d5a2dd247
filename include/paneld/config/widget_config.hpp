#pragma once

#include "paneld/core/error.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace paneld {

struct WidgetConfig {
  std::filesystem::path path;
  std::string source;
  std::size_t top_level_forms{0};
};

struct Stylesheet {
  std::filesystem::path path;
  std::string text;
};

// Structural check of a widget definition: brackets balance outside string
// literals and ';' comments. Returns a description of the first problem.
[[nodiscard]] auto check_widget_source(std::string_view source)
    -> std::optional<std::string>;

[[nodiscard]] auto count_top_level_forms(std::string_view source)
    -> std::size_t;

class WidgetConfigLoader {
public:
  // The widget file is required.
  [[nodiscard]] static auto load_widgets(const std::filesystem::path& path)
      -> Result<WidgetConfig>;
  // A missing stylesheet is an empty one.
  [[nodiscard]] static auto load_stylesheet(const std::filesystem::path& path)
      -> Result<Stylesheet>;
};

}  // namespace paneld
