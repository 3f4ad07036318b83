#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "exclude_filter.hpp"

namespace mirrord {

// One directory as seen by a walk: its path relative to the walk root
// (empty for the root itself) and its immediate children, sorted by name.
struct DirectoryNode {
    std::filesystem::path relative_path;
    std::vector<std::string> directories;
    std::vector<std::string> files;
    std::string error;  // set when the directory could not be listed
};

/**
 * Lazy top-down walk of a directory tree. Parents are yielded before their
 * children; siblings in name order. Symbolic links and special files are
 * never reported and never followed, so the walk cannot cycle.
 *
 * The root is listed by the constructor, which throws RootUnreadable if it
 * is missing, not a directory or not listable. Directories below the root
 * that fail to list are yielded with `error` set and no children.
 */
class TreeEnumerator {
public:
    explicit TreeEnumerator(std::filesystem::path root, const ExcludeFilter* filter = nullptr);

    bool next(DirectoryNode& node);

    // Drains the rest of the walk.
    std::vector<DirectoryNode> snapshot();

    const std::filesystem::path& root() const { return root_; }

private:
    DirectoryNode list(const std::filesystem::path& relative_path, std::error_code& ec) const;
    void schedule_children(const DirectoryNode& node);

    std::filesystem::path root_;
    const ExcludeFilter* filter_;
    std::vector<std::filesystem::path> pending_;
    DirectoryNode root_node_;
    bool root_yielded_{false};
};

}
