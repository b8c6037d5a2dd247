#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace paneld {

namespace io {
inline constexpr std::size_t kEventBufferSize = 4096;
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kMaxRequestSize = 64 * 1024;
inline constexpr int kListenBacklog = 16;
}  // namespace io

namespace timing {
// At most one reload is queued per window, however many files change.
inline constexpr auto kDebounceCooldown = std::chrono::milliseconds(500);
inline constexpr auto kShardIdleWait = std::chrono::milliseconds(1000);
inline constexpr auto kClientTimeout = std::chrono::seconds(5);
}  // namespace timing

namespace files {
inline constexpr std::string_view kWidgetConfig = "panel.yuck";
inline constexpr std::string_view kStylesheet = "panel.scss";
inline constexpr std::string_view kDaemonConfig = "daemon.yaml";
inline constexpr std::string_view kWidgetExtension = ".yuck";
inline constexpr std::string_view kStylesheetExtension = ".scss";
}  // namespace files

}  // namespace paneld
