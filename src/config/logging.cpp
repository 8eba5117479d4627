#include "cairn/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cairn {

std::shared_ptr<spdlog::logger> create_logger(const LoggingConfig& config) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(config.name, sink);

    auto level = spdlog::level::from_str(config.level);
    // from_str maps unknown names to "off"; treat them as info instead
    if (level == spdlog::level::off && config.level != "off") {
        level = spdlog::level::info;
    }
    logger->set_level(level);

    if (!config.pattern.empty()) {
        logger->set_pattern(config.pattern);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> logger_or_default(std::shared_ptr<spdlog::logger> logger) {
    if (logger) return logger;
    return spdlog::default_logger();
}

} // namespace cairn
