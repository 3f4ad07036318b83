#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "config.hpp"

namespace mirrord {

// Console-only logger used until the configuration is known.
std::shared_ptr<spdlog::logger> make_console_logger();

// Console plus file logger at the configured level. The log file is
// truncated. Throws ConfigurationError if it cannot be opened.
std::shared_ptr<spdlog::logger> setup_logging(const Config& config);

spdlog::level::level_enum parse_log_level(const std::string& level);

}
