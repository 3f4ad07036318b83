#include "tree_enumerator.hpp"

#include <algorithm>
#include <utility>

#include "errors.hpp"

namespace fs = std::filesystem;

namespace mirrord {

TreeEnumerator::TreeEnumerator(fs::path root, const ExcludeFilter* filter)
    : root_(std::move(root)), filter_(filter) {
    std::error_code ec;
    auto status = fs::status(root_, ec);
    if (status.type() == fs::file_type::not_found) {
        throw RootUnreadable(root_.string(), "no such directory");
    }
    if (ec) {
        throw RootUnreadable(root_.string(), ec.message());
    }
    if (!fs::is_directory(status)) {
        throw RootUnreadable(root_.string(), "not a directory");
    }

    root_node_ = list(fs::path(), ec);
    if (ec) {
        throw RootUnreadable(root_.string(), ec.message());
    }
}

bool TreeEnumerator::next(DirectoryNode& node) {
    if (!root_yielded_) {
        root_yielded_ = true;
        schedule_children(root_node_);
        node = std::move(root_node_);
        return true;
    }

    if (pending_.empty()) {
        return false;
    }

    fs::path relative_path = std::move(pending_.back());
    pending_.pop_back();

    std::error_code ec;
    node = list(relative_path, ec);
    if (ec) {
        node.relative_path = relative_path;
        node.directories.clear();
        node.files.clear();
        node.error = ec.message();
        return true;
    }

    schedule_children(node);
    return true;
}

std::vector<DirectoryNode> TreeEnumerator::snapshot() {
    std::vector<DirectoryNode> nodes;
    DirectoryNode node;
    while (next(node)) {
        nodes.push_back(std::move(node));
    }
    return nodes;
}

DirectoryNode TreeEnumerator::list(const fs::path& relative_path, std::error_code& ec) const {
    DirectoryNode node;
    node.relative_path = relative_path;

    fs::directory_iterator it(root_ / relative_path, ec);
    if (ec) {
        return node;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto name = it->path().filename();
        if (filter_ && filter_->excluded(relative_path / name)) {
            continue;
        }

        // symlink_status: links are neither files nor directories here
        std::error_code entry_ec;
        auto type = it->symlink_status(entry_ec).type();
        if (entry_ec) {
            // vanished between readdir and lstat
            continue;
        }

        if (type == fs::file_type::directory) {
            node.directories.push_back(name.string());
        } else if (type == fs::file_type::regular) {
            node.files.push_back(name.string());
        }
    }
    if (ec) {
        return node;
    }

    std::sort(node.directories.begin(), node.directories.end());
    std::sort(node.files.begin(), node.files.end());
    return node;
}

void TreeEnumerator::schedule_children(const DirectoryNode& node) {
    // Reverse so the stack pops siblings in name order.
    for (auto it = node.directories.rbegin(); it != node.directories.rend(); ++it) {
        pending_.push_back(node.relative_path / *it);
    }
}

}
