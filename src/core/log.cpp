#include "iris/core/log.hpp"

#include <algorithm>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace iris::core {

namespace {

auto make_logger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
  // Another translation unit (or the host application) may have registered it.
  if (auto existing = spdlog::get(name)) return existing;
  auto lg = spdlog::stderr_color_mt(name);
  lg->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%l%$ %n %v");
  return lg;
}

std::once_flag g_init;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<spdlog::logger> g_alert;

void init_loggers() {
  std::call_once(g_init, [] {
    g_logger = make_logger("iris");
    g_alert = make_logger("iris.alert");
    g_alert->set_level(spdlog::level::warn);
  });
}

} // namespace

auto logger() -> std::shared_ptr<spdlog::logger> {
  init_loggers();
  return g_logger;
}

auto alert() -> std::shared_ptr<spdlog::logger> {
  init_loggers();
  return g_alert;
}

auto set_log_level(std::string_view level) -> std::expected<void, error> {
  const auto lvl = spdlog::level::from_str(std::string(level));
  // from_str maps unknown names to "off"; only accept that when asked for.
  if (lvl == spdlog::level::off && level != "off") {
    return make_unexpected(error_code::config_invalid,
                           "unknown log level '" + std::string(level) + "'", "core.log");
  }
  logger()->set_level(lvl);
  // Alerts stay visible unless logging is switched off entirely.
  alert()->set_level(lvl == spdlog::level::off ? lvl : std::min(lvl, spdlog::level::warn));
  return {};
}

} // namespace iris::core
