#include <infergate/app/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>

namespace infergate::app {

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;
  return std::nullopt;
}

bool init_logging(std::string_view level) {
  auto logger = spdlog::get("infergate");
  if (!logger) logger = spdlog::stderr_color_mt("infergate");
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(logger);

  const auto parsed = parse_log_level(level);
  spdlog::set_level(parsed.value_or(spdlog::level::info));
  if (!parsed) {
    spdlog::warn("Unknown log level '{}', using info", level);
  }
  return parsed.has_value();
}

}  // namespace infergate::app
