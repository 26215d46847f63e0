#include "chronicle/logging.hpp"
#include <mutex>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace chronicle {

std::shared_ptr<spdlog::logger> default_logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] {
        logger = spdlog::get("chronicle");
        if (!logger) {
            logger = spdlog::stderr_color_mt("chronicle");
            logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
            logger->set_level(spdlog::level::info);
        }
    });
    return logger;
}

std::shared_ptr<spdlog::logger> logger_or_default(std::shared_ptr<spdlog::logger> logger) {
    return logger ? std::move(logger) : default_logger();
}

bool set_log_level(std::string_view level) {
    const auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") return false;
    default_logger()->set_level(parsed);
    return true;
}

} // namespace chronicle
