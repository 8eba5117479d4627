#pragma once

#include "cairn/config.hpp"

#include <memory>

#include <spdlog/spdlog.h>

namespace cairn {

// Logger writing to stderr with color, configured from LoggingConfig.
// The logger is not registered globally; callers hand it to the components.
std::shared_ptr<spdlog::logger> create_logger(const LoggingConfig& config);

// Returns logger, or spdlog's default logger when logger is null
std::shared_ptr<spdlog::logger> logger_or_default(std::shared_ptr<spdlog::logger> logger);

} // namespace cairn
