#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace libtune {

// Library-wide logger named "libtune", writing to stderr. Created on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Accepts trace, debug, info, warn, error, critical and off.
void set_log_level(const std::string& level);

[[nodiscard]] spdlog::level::level_enum parse_log_level(const std::string& level);

}  // namespace libtune
