#pragma once

#include <spdlog/spdlog.h>
#include <string_view>

namespace vieweval {

/// Library-wide logger ("vieweval", stderr). Created on first use.
spdlog::logger& logger();

/// Accepts spdlog level names (trace, debug, info, warn, error, critical, off).
/// Returns false and leaves the level unchanged for anything else.
bool set_log_level(std::string_view level);

}  // namespace vieweval
