#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace mirrord {

// Shell glob patterns (fnmatch) matched against a path relative to a tree
// root. A path is excluded when a pattern matches either the whole relative
// path or its last component, so "*.tmp", ".git" and "build/*" all work.
class ExcludeFilter {
public:
    ExcludeFilter() = default;
    explicit ExcludeFilter(std::vector<std::string> patterns);

    bool excluded(const std::filesystem::path& relative_path) const;

    bool empty() const { return patterns_.empty(); }
    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
};

}
