#pragma once

#include <stdexcept>
#include <string>

namespace mirrord {

// Source or destination root cannot be listed when a pass starts.
class RootUnreadable : public std::runtime_error {
public:
    RootUnreadable(const std::string& root, const std::string& reason)
        : std::runtime_error("Cannot read root directory " + root + ": " + reason),
          root_(root) {}

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

// Invalid command line, configuration file or log destination.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
