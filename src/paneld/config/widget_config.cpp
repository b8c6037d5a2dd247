#include "paneld/config/widget_config.hpp"

#include "paneld/util/log.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <vector>

namespace paneld {

namespace {

auto read_file(const std::filesystem::path& path) -> Result<std::string> {
  std::ifstream file(path);
  if (!file.is_open()) {
    return fail(Error::ConfigReadFailed);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return fail(Error::ConfigReadFailed);
  }
  return buffer.str();
}

[[nodiscard]] constexpr auto closing_for(char open) noexcept -> char {
  switch (open) {
  case '(':
    return ')';
  case '[':
    return ']';
  default:
    return '}';
  }
}

// Walks the source once, calling on_top_level for each bracket opened
// at nesting depth zero. Returns the first structural problem.
template <typename OnTopLevel>
auto scan(std::string_view source, OnTopLevel on_top_level)
    -> std::optional<std::string> {
  std::vector<std::pair<char, std::size_t>> stack;
  std::size_t line = 1;
  bool in_string = false;
  std::size_t string_line = 0;

  for (std::size_t i = 0; i < source.size(); ++i) {
    char c = source[i];
    if (c == '\n') {
      ++line;
    }

    if (in_string) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }

    switch (c) {
    case '"':
      in_string = true;
      string_line = line;
      break;
    case ';':
      while (i + 1 < source.size() && source[i + 1] != '\n') {
        ++i;
      }
      break;
    case '(':
    case '[':
    case '{':
      if (stack.empty()) {
        on_top_level();
      }
      stack.emplace_back(c, line);
      break;
    case ')':
    case ']':
    case '}':
      if (stack.empty()) {
        return std::format("line {}: unexpected '{}'", line, c);
      }
      if (closing_for(stack.back().first) != c) {
        return std::format("line {}: expected '{}' to close line {}, found '{}'",
                           line, closing_for(stack.back().first),
                           stack.back().second, c);
      }
      stack.pop_back();
      break;
    default:
      break;
    }
  }

  if (in_string) {
    return std::format("line {}: unterminated string", string_line);
  }
  if (!stack.empty()) {
    return std::format("line {}: unclosed '{}'", stack.back().second,
                       stack.back().first);
  }
  return std::nullopt;
}

}  // namespace

auto check_widget_source(std::string_view source)
    -> std::optional<std::string> {
  return scan(source, [] {});
}

auto count_top_level_forms(std::string_view source) -> std::size_t {
  std::size_t count = 0;
  if (scan(source, [&count] { ++count; })) {
    return 0;
  }
  return count;
}

auto WidgetConfigLoader::load_widgets(const std::filesystem::path& path)
    -> Result<WidgetConfig> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    log::error("Widget configuration {} not found", path.string());
    return fail(Error::ConfigNotFound);
  }

  auto source = read_file(path);
  if (!source) {
    log::error("Failed to read {}", path.string());
    return fail(source.error());
  }

  if (auto problem = check_widget_source(*source)) {
    log::error("{}: {}", path.string(), *problem);
    return fail(Error::ConfigParseError);
  }

  WidgetConfig config{.path = path,
                      .source = std::move(*source),
                      .top_level_forms = 0};
  config.top_level_forms = count_top_level_forms(config.source);
  return ok(std::move(config));
}

auto WidgetConfigLoader::load_stylesheet(const std::filesystem::path& path)
    -> Result<Stylesheet> {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Stylesheet{.path = path, .text = {}};
  }

  auto text = read_file(path);
  if (!text) {
    log::error("Failed to read {}", path.string());
    return fail(text.error());
  }
  return Stylesheet{.path = path, .text = std::move(*text)};
}

}  // namespace paneld
