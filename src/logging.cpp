#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> lg = [] {
    auto l = spdlog::get("guardrag");
    if (!l) l = spdlog::stderr_color_mt("guardrag");
    l->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    return l;
  }();
  return lg;
}

void set_log_level(const std::string& level) {
  auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
  logger()->set_level(lvl);
}
