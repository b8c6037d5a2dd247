#include "paneld/app/app.hpp"

#include "paneld/util/log.hpp"

#include <format>
#include <variant>

namespace paneld {

App::App(DaemonPaths paths) : paths_(std::move(paths)) {
}

auto App::load_initial() -> Result<void> {
  auto widgets = WidgetConfigLoader::load_widgets(paths_.widget_config());
  if (!widgets) {
    return fail(widgets.error());
  }
  auto stylesheet = WidgetConfigLoader::load_stylesheet(paths_.stylesheet());
  if (!stylesheet) {
    return fail(stylesheet.error());
  }

  widgets_ = std::move(*widgets);
  stylesheet_ = std::move(*stylesheet);
  log::info("Loaded {} ({} top-level forms), stylesheet {} bytes",
            widgets_.path.string(), widgets_.top_level_forms,
            stylesheet_.text.size());
  return ok();
}

auto App::reload() -> std::optional<std::string> {
  auto widgets = WidgetConfigLoader::load_widgets(paths_.widget_config());
  if (!widgets) {
    return std::format("failed to load {}: {}",
                       paths_.widget_config().filename().string(),
                       widgets.error().message());
  }
  auto stylesheet = WidgetConfigLoader::load_stylesheet(paths_.stylesheet());
  if (!stylesheet) {
    return std::format("failed to load {}: {}",
                       paths_.stylesheet().filename().string(),
                       stylesheet.error().message());
  }

  widgets_ = std::move(*widgets);
  stylesheet_ = std::move(*stylesheet);
  ++reload_count_;
  return std::nullopt;
}

auto App::set_variable(std::string name, std::string value) -> void {
  log::debug("Variable {} = {}", name, value);
  variables_.insert_or_assign(std::move(name), std::move(value));
}

auto App::render_state() const -> std::string {
  std::string out;
  for (const auto& [name, value] : variables_) {
    std::format_to(std::back_inserter(out), "{}: {}\n", name, value);
  }
  return out;
}

auto App::handle(Command cmd) -> LoopControl {
  log::trace("Handling {}", command_name(cmd));
  return std::visit([this](auto& c) { return handle_command(c); }, cmd);
}

auto App::handle_command(command::ReloadConfigAndCss& cmd) -> LoopControl {
  auto response = DaemonResponse::success();
  if (auto problem = reload()) {
    log::error("Reload failed, keeping previous configuration: {}", *problem);
    response = DaemonResponse::failure(std::move(*problem));
  }
  if (!cmd.response.send(std::move(response))) {
    log::debug("Reload requester went away before the response");
  }
  return LoopControl::Continue;
}

auto App::handle_command(command::KillServer&) -> LoopControl {
  log::info("Shutdown requested");
  return LoopControl::Stop;
}

auto App::handle_command(command::UpdateVars& cmd) -> LoopControl {
  for (auto& [name, value] : cmd.vars) {
    set_variable(std::move(name), std::move(value));
  }
  return LoopControl::Continue;
}

auto App::handle_command(command::PrintState& cmd) -> LoopControl {
  if (!cmd.response.send(DaemonResponse::success(render_state()))) {
    log::debug("State requester went away before the response");
  }
  return LoopControl::Continue;
}

}  // namespace paneld
