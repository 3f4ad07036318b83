#include "logging.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "errors.hpp"

namespace fs = std::filesystem;

namespace mirrord {

namespace {
    const char* kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
}

std::shared_ptr<spdlog::logger> make_console_logger() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    return std::make_shared<spdlog::logger>("mirrord", console_sink);
}

spdlog::level::level_enum parse_log_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> setup_logging(const Config& config) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);

    std::vector<spdlog::sink_ptr> sinks {console_sink};

    try {
        auto log_path = fs::path(config.log_file);
        if (log_path.has_parent_path()) {
            fs::create_directories(log_path.parent_path());
        }

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, true);
        file_sink->set_pattern(kFilePattern);
        sinks.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& e) {
        throw ConfigurationError("Cannot open log file " + config.log_file + ": " + e.what());
    } catch (const fs::filesystem_error& e) {
        throw ConfigurationError("Cannot create log directory for " + config.log_file + ": " + e.what());
    }

    auto logger = std::make_shared<spdlog::logger>("mirrord", sinks.begin(), sinks.end());
    logger->set_level(parse_log_level(config.log_level));
    logger->flush_on(spdlog::level::info);
    return logger;
}

}
