#include "exclude_filter.hpp"

#include <fnmatch.h>
#include <utility>

namespace fs = std::filesystem;

namespace mirrord {

ExcludeFilter::ExcludeFilter(std::vector<std::string> patterns)
    : patterns_(std::move(patterns)) {}

bool ExcludeFilter::excluded(const fs::path& relative_path) const {
    if (patterns_.empty() || relative_path.empty()) {
        return false;
    }

    const std::string full = relative_path.generic_string();
    const std::string name = relative_path.filename().string();

    for (const auto& pattern : patterns_) {
        if (fnmatch(pattern.c_str(), full.c_str(), FNM_PATHNAME) == 0) return true;
        if (fnmatch(pattern.c_str(), name.c_str(), 0) == 0) return true;
    }
    return false;
}

}
