#include <vieweval/core/logger.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace vieweval {

spdlog::logger& logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get("vieweval");
    if (existing) return existing;
    auto created = spdlog::stderr_color_mt("vieweval");
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(spdlog::level::info);
    return created;
  }();
  return *instance;
}

bool set_log_level(std::string_view level) {
  const std::string name(level);
  const auto parsed = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"; only accept "off" when asked for it.
  if (parsed == spdlog::level::off && name != "off") return false;
  logger().set_level(parsed);
  return true;
}

}  // namespace vieweval
