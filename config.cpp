#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <system_error>

#include <cxxopts.hpp>
#include <yaml-cpp/yaml.h>

#include "errors.hpp"

namespace fs = std::filesystem;

namespace mirrord {

namespace {
    const std::vector<std::string> kLogLevels = {"trace", "debug", "info", "warn", "error"};

    bool is_nested(const fs::path& inner, const fs::path& outer) {
        auto o = outer.begin();
        auto i = inner.begin();
        for (; o != outer.end() && i != inner.end(); ++o, ++i) {
            if (*o != *i) return false;
        }
        return o == outer.end();
    }

    fs::path normalized(const std::string& path) {
        std::error_code ec;
        auto canonical = fs::weakly_canonical(fs::absolute(path, ec), ec);
        if (ec) {
            canonical = fs::path(path).lexically_normal();
        }
        // "/a/b/" and "/a/b" are the same root
        if (!canonical.has_filename() && canonical.has_relative_path()) {
            canonical = canonical.parent_path();
        }
        return canonical;
    }

    std::chrono::seconds read_seconds(const YAML::Node& node) {
        return std::chrono::seconds(node.as<int>());
    }
}

std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;

    const char* home = std::getenv("HOME");
    if (!home) return path;

    return std::string(home) + path.substr(1);
}

std::string resolve_path(const std::string& path, const std::string& config_path) {
    std::string expanded = expand_path(path);

    if (fs::path(expanded).is_absolute()) {
        return expanded;
    }

    // Relative to the configuration file's directory
    fs::path config_dir = fs::path(config_path).parent_path();
    return (config_dir / expanded).string();
}

void load_config_file(Config& config, const std::string& config_path) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        config.config_path = config_path;

        if (yaml["source"]) {
            config.source = resolve_path(yaml["source"].as<std::string>(), config_path);
        }
        if (yaml["destination"]) {
            config.destination = resolve_path(yaml["destination"].as<std::string>(), config_path);
        }
        if (yaml["interval"]) {
            config.interval = read_seconds(yaml["interval"]);
        }
        if (yaml["log_file"]) {
            config.log_file = resolve_path(yaml["log_file"].as<std::string>(), config_path);
        }
        if (yaml["log_level"]) {
            config.log_level = yaml["log_level"].as<std::string>();
        }
        if (yaml["noop"]) {
            config.noop = yaml["noop"].as<bool>();
        }
        if (yaml["exclude"]) {
            if (!yaml["exclude"].IsSequence()) {
                throw ConfigurationError("'exclude' must be a list of patterns");
            }
            for (const auto& pattern : yaml["exclude"]) {
                config.exclude_patterns.push_back(pattern.as<std::string>());
            }
        }
        if (yaml["consistency_check_interval"]) {
            config.consistency_check_interval = read_seconds(yaml["consistency_check_interval"]);
        }
        if (yaml["daemon"]) {
            config.daemon = yaml["daemon"].as<bool>();
        }
        if (yaml["pid_file"]) {
            config.pid_file = resolve_path(yaml["pid_file"].as<std::string>(), config_path);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Error parsing configuration file " + config_path + ": " + e.what());
    }
}

Config parse_arguments(int argc, char* argv[]) {
    Config config;

    try {
        cxxopts::Options options("mirrord", "One-way synchronization of a destination directory to a source directory");
        options.positional_help("<source> <destination>").show_positional_help();

        options.add_options()
            ("source", "Source directory", cxxopts::value<std::string>())
            ("destination", "Destination directory", cxxopts::value<std::string>())
            ("i,interval", "Sync interval in seconds (default: 10)", cxxopts::value<int>())
            ("l,log-file", "Log file path (default: ./mirrord.log)", cxxopts::value<std::string>())
            ("d,debug", "Enable debug logging", cxxopts::value<bool>()->default_value("false"))
            ("log-level", "Log level (trace, debug, info, warn, error)", cxxopts::value<std::string>())
            ("c,config", "Path to configuration file", cxxopts::value<std::string>())
            ("n,noop", "Dry-run mode", cxxopts::value<bool>()->default_value("false"))
            ("e,exclude", "Exclude pattern, may be repeated", cxxopts::value<std::vector<std::string>>())
            ("consistency-check", "Seconds between content audits, 0 disables", cxxopts::value<int>())
            ("daemon", "Run as daemon", cxxopts::value<bool>()->default_value("false"))
            ("p,pid-file", "PID file path", cxxopts::value<std::string>())
            ("check-config", "Check configuration for errors", cxxopts::value<bool>()->default_value("false"))
            ("h,help", "Print usage");

        options.parse_positional({"source", "destination"});
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            config.help = true;
            config.help_text = options.help();
            return config;
        }

        if (!result.unmatched().empty()) {
            throw ConfigurationError("Unexpected argument: " + result.unmatched().front());
        }

        // The file first, so that command line values override it
        if (result.count("config")) {
            load_config_file(config, result["config"].as<std::string>());
        }

        if (result.count("source")) {
            config.source = result["source"].as<std::string>();
        }
        if (result.count("destination")) {
            config.destination = result["destination"].as<std::string>();
        }
        if (result.count("interval")) {
            config.interval = std::chrono::seconds(result["interval"].as<int>());
        }
        if (result.count("log-file")) {
            config.log_file = result["log-file"].as<std::string>();
        }
        if (result.count("log-level")) {
            config.log_level = result["log-level"].as<std::string>();
        }
        if (result["debug"].as<bool>()) {
            config.log_level = "debug";
        }
        if (result["noop"].as<bool>()) {
            config.noop = true;
        }
        if (result.count("exclude")) {
            const auto& patterns = result["exclude"].as<std::vector<std::string>>();
            config.exclude_patterns.insert(config.exclude_patterns.end(), patterns.begin(), patterns.end());
        }
        if (result.count("consistency-check")) {
            config.consistency_check_interval = std::chrono::seconds(result["consistency-check"].as<int>());
        }
        if (result["daemon"].as<bool>()) {
            config.daemon = true;
        }
        if (result.count("pid-file")) {
            config.pid_file = result["pid-file"].as<std::string>();
        }
        config.check_config = result["check-config"].as<bool>();

        config.source = expand_path(config.source);
        config.destination = expand_path(config.destination);
        if (config.log_file.empty()) {
            config.log_file = (fs::current_path() / "mirrord.log").string();
        } else {
            config.log_file = expand_path(config.log_file);
        }

        return config;

    } catch (const cxxopts::exceptions::exception& e) {
        throw ConfigurationError("Error parsing command line options: " + std::string(e.what()));
    }
}

void validate_config(const Config& config) {
    if (config.source.empty()) {
        throw ConfigurationError("Source directory is required");
    }
    if (config.destination.empty()) {
        throw ConfigurationError("Destination directory is required");
    }
    if (config.interval.count() <= 0) {
        throw ConfigurationError("Sync interval must be a positive number of seconds");
    }
    if (config.consistency_check_interval.count() < 0) {
        throw ConfigurationError("Consistency check interval cannot be negative");
    }
    if (std::find(kLogLevels.begin(), kLogLevels.end(), config.log_level) == kLogLevels.end()) {
        throw ConfigurationError("Unknown log level: " + config.log_level);
    }

    std::error_code ec;
    if (!fs::is_directory(config.source, ec)) {
        throw ConfigurationError("Source directory does not exist: " + config.source);
    }

    const auto source = normalized(config.source);
    const auto destination = normalized(config.destination);
    if (source == destination) {
        throw ConfigurationError("Source and destination are the same directory: " + source.string());
    }
    if (is_nested(destination, source) || is_nested(source, destination)) {
        throw ConfigurationError("Source and destination must not contain one another: " +
                                 source.string() + ", " + destination.string());
    }
}

}
