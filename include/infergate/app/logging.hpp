#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string_view>

namespace infergate::app {

/// trace|debug|info|warn|error|off (also "warning", "critical"); nullopt otherwise.
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

/// Install a colour stderr logger as the spdlog default and set its level.
/// Returns false (leaving the level at info) for an unknown level name.
bool init_logging(std::string_view level);

}  // namespace infergate::app
