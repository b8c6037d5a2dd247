#pragma once

#include "paneld/app/command.hpp"
#include "paneld/config/paths.hpp"
#include "paneld/config/widget_config.hpp"
#include "paneld/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace paneld {

enum class LoopControl : std::uint8_t {
  Continue,
  Stop
};

// Applies one command to application state. Called only from the UI loop, so
// implementations need no locking.
class ICommandHandler {
public:
  virtual ~ICommandHandler() = default;
  virtual auto handle(Command cmd) -> LoopControl = 0;
};

// The state the UI thread owns: the active widget configuration, the active
// stylesheet and the variable store.
class App : public ICommandHandler {
public:
  explicit App(DaemonPaths paths);

  // Startup load; the daemon does not start without a valid configuration.
  [[nodiscard]] auto load_initial() -> Result<void>;

  auto handle(Command cmd) -> LoopControl override;

  // Loads both files and swaps them in only if both loaded. On failure the
  // active configuration is kept and the message describes what went wrong.
  [[nodiscard]] auto reload() -> std::optional<std::string>;

  auto set_variable(std::string name, std::string value) -> void;

  // One "name: value" line per variable, sorted by name.
  [[nodiscard]] auto render_state() const -> std::string;

  [[nodiscard]] auto widgets() const noexcept -> const WidgetConfig& {
    return widgets_;
  }
  [[nodiscard]] auto stylesheet() const noexcept -> const Stylesheet& {
    return stylesheet_;
  }
  [[nodiscard]] auto variables() const noexcept
      -> const std::map<std::string, std::string>& {
    return variables_;
  }
  [[nodiscard]] auto reload_count() const noexcept -> std::size_t {
    return reload_count_;
  }
  [[nodiscard]] auto paths() const noexcept -> const DaemonPaths& {
    return paths_;
  }

private:
  auto handle_command(command::ReloadConfigAndCss& cmd) -> LoopControl;
  auto handle_command(command::KillServer& cmd) -> LoopControl;
  auto handle_command(command::UpdateVars& cmd) -> LoopControl;
  auto handle_command(command::PrintState& cmd) -> LoopControl;

  DaemonPaths paths_;
  WidgetConfig widgets_;
  Stylesheet stylesheet_;
  std::map<std::string, std::string> variables_;
  std::size_t reload_count_{0};
};

}  // namespace paneld
