#pragma once

#include <spdlog/logger.h>
#include <string_view>

namespace segeval::core {

/// Library-wide logger ("segeval", stderr). Created on first use.
spdlog::logger& logger();

/// Sets the logger level from a name (trace, debug, info, warn, error,
/// critical, off). Returns false and leaves the level unchanged for unknown names.
bool set_log_level(std::string_view level_name);

}  // namespace segeval::core
