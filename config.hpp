#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace mirrord {

struct Config {
    std::string config_path;
    std::string source;
    std::string destination;
    std::chrono::seconds interval{10};
    std::string log_file;
    std::string log_level{"info"};
    bool noop{false};
    std::vector<std::string> exclude_patterns;
    std::chrono::seconds consistency_check_interval{0};  // 0 disables
    bool daemon{false};
    std::string pid_file;

    bool check_config{false};
    bool help{false};
    std::string help_text;
};

// Parses the command line, merging in the YAML file named by --config.
// Command line values win. Throws ConfigurationError.
Config parse_arguments(int argc, char* argv[]);

// Overlays the settings found in a YAML file onto `config`. Relative paths
// resolve against the file's directory. Throws ConfigurationError.
void load_config_file(Config& config, const std::string& config_path);

// Rejects configurations the daemon cannot start with, including a source
// root that does not exist and roots nested inside one another.
void validate_config(const Config& config);

std::string expand_path(const std::string& path);
std::string resolve_path(const std::string& path, const std::string& config_path);

}
