#include <segeval/core/logger.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace segeval::core {

spdlog::logger& logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get("segeval");
    if (existing) return existing;
    auto created = spdlog::stderr_color_mt("segeval");
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
  }();
  return *instance;
}

bool set_log_level(std::string_view level_name) {
  const std::string name(level_name);
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off; only accept "off" when asked for.
  if (level == spdlog::level::off && name != "off") return false;
  logger().set_level(level);
  return true;
}

}  // namespace segeval::core
