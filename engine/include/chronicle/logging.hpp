#pragma once

#include <memory>
#include <string_view>
#include <spdlog/logger.h>

namespace chronicle {

// Shared "chronicle" logger writing to stderr; created on first use.
std::shared_ptr<spdlog::logger> default_logger();

// Returns `logger` when set, the shared logger otherwise.
std::shared_ptr<spdlog::logger> logger_or_default(std::shared_ptr<spdlog::logger> logger);

// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "critical", "off").
bool set_log_level(std::string_view level);

} // namespace chronicle
