#include "sync_executor.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

#include "errors.hpp"
#include "tree_enumerator.hpp"

namespace fs = std::filesystem;

namespace mirrord {

namespace {
    // True when `path` is `root` or lies beneath it.
    bool is_within(const fs::path& path, const std::vector<fs::path>& roots) {
        for (const auto& root : roots) {
            if (root.empty()) continue;
            auto r = root.begin();
            auto p = path.begin();
            while (r != root.end() && p != path.end() && *r == *p) {
                ++r;
                ++p;
            }
            if (r == root.end()) return true;
        }
        return false;
    }

    // Type of whatever sits at `path` without following links. A missing
    // path is not an error.
    fs::file_type entry_type_at(const fs::path& path, std::error_code& ec) {
        auto type = fs::symlink_status(path, ec).type();
        if (type == fs::file_type::not_found) {
            ec.clear();
        }
        return type;
    }

    // A sibling name no entry currently holds. The leading dot and the pid
    // plus counter suffix keep it clear of names a source tree would carry.
    fs::path staging_path_for(const fs::path& target) {
        static std::atomic<unsigned> counter{0};
        for (;;) {
            fs::path staging = target.parent_path() /
                ("." + target.filename().string() + ".mirrord-" +
                 std::to_string(::getpid()) + "-" + std::to_string(++counter));
            std::error_code ec;
            if (!fs::exists(fs::symlink_status(staging, ec))) {
                return staging;
            }
        }
    }

    // Copies through a sibling staging file renamed over the target, so a
    // read-only destination file can still be replaced. Content, permission
    // bits and modification time all come from the source.
    bool copy_with_metadata(const fs::path& from, const fs::path& to,
                            fs::file_time_type mtime, std::error_code& ec) {
        const fs::path staging = staging_path_for(to);

        // copy_options::none fails rather than overwrite anything that
        // appeared under the staging name since it was picked
        fs::copy_file(from, staging, fs::copy_options::none, ec);
        if (ec) return false;

        auto perms = fs::status(from, ec).permissions();
        if (!ec) fs::permissions(staging, perms, fs::perm_options::replace, ec);
        if (!ec) fs::last_write_time(staging, mtime, ec);
        if (!ec) fs::rename(staging, to, ec);

        if (ec) {
            // A staging file left behind has no source counterpart and is
            // pruned by the next pass.
            std::error_code cleanup_ec;
            fs::remove(staging, cleanup_ec);
            return false;
        }
        return true;
    }

    class PassRunner {
    public:
        PassRunner(EventSink& sink, const SyncOptions& options,
                   const fs::path& source_root, const fs::path& destination_root,
                   PassResult& result)
            : sink_(sink), options_(options),
              source_root_(source_root), destination_root_(destination_root),
              result_(result) {}

        void run() {
            TreeEnumerator source(source_root_, &options_.exclude);
            const bool destination_exists = prepare_destination_root();

            create_and_update(source);

            if (destination_exists) {
                prune();
            }
        }

    private:
        // Returns whether the destination root exists on disk afterwards.
        bool prepare_destination_root() {
            std::error_code ec;
            auto status = fs::status(destination_root_, ec);

            if (status.type() == fs::file_type::not_found) {
                if (!options_.dry_run) {
                    fs::create_directories(destination_root_, ec);
                    if (ec) {
                        throw RootUnreadable(destination_root_.string(), ec.message());
                    }
                }
                record(ChangeKind::CREATED, EntryType::DIRECTORY, fs::path());
                return !options_.dry_run;
            }
            if (ec) {
                throw RootUnreadable(destination_root_.string(), ec.message());
            }
            if (!fs::is_directory(status)) {
                throw RootUnreadable(destination_root_.string(), "not a directory");
            }

            fs::directory_iterator probe(destination_root_, ec);
            if (ec) {
                throw RootUnreadable(destination_root_.string(), ec.message());
            }
            return true;
        }

        // Phase A: source-driven, top-down.
        void create_and_update(TreeEnumerator& source) {
            std::vector<fs::path> failed_directories;
            DirectoryNode node;

            while (source.next(node)) {
                if (is_within(node.relative_path, failed_directories)) {
                    continue;
                }
                if (!node.error.empty()) {
                    fail("list", node.relative_path, node.error);
                    continue;
                }

                for (const auto& name : node.directories) {
                    auto relative_path = node.relative_path / name;
                    if (!ensure_directory(relative_path)) {
                        failed_directories.push_back(relative_path);
                    }
                }

                for (const auto& name : node.files) {
                    sync_file(node.relative_path / name);
                }
            }
        }

        // Phase B: destination-driven over a snapshot taken now. Entries
        // Phase A replaced were rebuilt from the source; in a dry run the
        // snapshot still shows the old kind, so they are skipped either way.
        void prune() {
            TreeEnumerator destination(destination_root_, &options_.exclude);
            const auto nodes = destination.snapshot();
            std::vector<fs::path> pruned;

            for (const auto& node : nodes) {
                if (is_within(node.relative_path, pruned) || is_within(node.relative_path, replaced_)) {
                    continue;
                }
                if (!node.error.empty()) {
                    fail("list", node.relative_path, node.error);
                    continue;
                }

                for (const auto& name : node.files) {
                    auto relative_path = node.relative_path / name;
                    if (is_within(relative_path, replaced_)) {
                        continue;
                    }
                    std::error_code ec;
                    auto type = entry_type_at(source_root_ / relative_path, ec);
                    if (ec) {
                        fail("stat", relative_path, ec.message());
                        continue;
                    }
                    if (type != fs::file_type::regular) {
                        remove_file(relative_path);
                    }
                }

                for (const auto& name : node.directories) {
                    auto relative_path = node.relative_path / name;
                    if (is_within(relative_path, replaced_)) {
                        continue;
                    }
                    std::error_code ec;
                    auto type = entry_type_at(source_root_ / relative_path, ec);
                    if (ec) {
                        fail("stat", relative_path, ec.message());
                        continue;
                    }
                    if (type != fs::file_type::directory && remove_directory(relative_path)) {
                        pruned.push_back(relative_path);
                    }
                }
            }
        }

        bool ensure_directory(const fs::path& relative_path) {
            std::error_code ec;
            auto type = entry_type_at(destination_root_ / relative_path, ec);
            if (ec) {
                fail("stat", relative_path, ec.message());
                return false;
            }
            if (type == fs::file_type::directory) {
                return true;
            }
            if (type != fs::file_type::not_found && !remove_existing(relative_path, type)) {
                return false;
            }

            if (!options_.dry_run) {
                fs::create_directories(destination_root_ / relative_path, ec);
                if (ec) {
                    fail("mkdir", relative_path, ec.message());
                    return false;
                }
            }
            record(ChangeKind::CREATED, EntryType::DIRECTORY, relative_path);
            return true;
        }

        void sync_file(const fs::path& relative_path) {
            std::error_code ec;
            const auto source_time = fs::last_write_time(source_root_ / relative_path, ec);
            if (ec) {
                fail("stat", relative_path, ec.message());
                return;
            }

            const auto target = destination_root_ / relative_path;
            auto type = entry_type_at(target, ec);
            if (ec) {
                fail("stat", relative_path, ec.message());
                return;
            }

            if (type == fs::file_type::regular) {
                const auto target_time = fs::last_write_time(target, ec);
                if (ec) {
                    fail("stat", relative_path, ec.message());
                    return;
                }
                // Equal or newer destination counts as in sync.
                if (source_time > target_time) {
                    copy_file(relative_path, source_time, ChangeKind::MODIFIED);
                }
                return;
            }

            if (type != fs::file_type::not_found && !remove_existing(relative_path, type)) {
                return;
            }
            copy_file(relative_path, source_time, ChangeKind::CREATED);
        }

        void copy_file(const fs::path& relative_path, fs::file_time_type source_time, ChangeKind kind) {
            if (!options_.dry_run) {
                std::error_code ec;
                if (!copy_with_metadata(source_root_ / relative_path,
                                        destination_root_ / relative_path, source_time, ec)) {
                    fail("copy", relative_path, ec.message());
                    return;
                }
            }
            record(kind, EntryType::FILE, relative_path);
        }

        // Clears an entry of the wrong kind out of the way.
        bool remove_existing(const fs::path& relative_path, fs::file_type type) {
            const bool removed = type == fs::file_type::directory
                ? remove_directory(relative_path)
                : remove_file(relative_path);
            if (removed) {
                replaced_.push_back(relative_path);
            }
            return removed;
        }

        // Both removals return true when the entry is gone afterwards,
        // including when it had already vanished.
        bool remove_file(const fs::path& relative_path) {
            bool removed = true;
            if (!options_.dry_run) {
                std::error_code ec;
                removed = fs::remove(destination_root_ / relative_path, ec);
                if (ec) {
                    fail("remove", relative_path, ec.message());
                    return false;
                }
            }
            if (removed) {
                record(ChangeKind::REMOVED, EntryType::FILE, relative_path);
            }
            return true;
        }

        bool remove_directory(const fs::path& relative_path) {
            std::uintmax_t removed = 1;
            if (!options_.dry_run) {
                std::error_code ec;
                removed = fs::remove_all(destination_root_ / relative_path, ec);
                if (ec) {
                    fail("remove", relative_path, ec.message());
                    return false;
                }
            }
            if (removed > 0) {
                record(ChangeKind::REMOVED, EntryType::DIRECTORY, relative_path);
            }
            return true;
        }

        void record(ChangeKind kind, EntryType type, const fs::path& relative_path) {
            ChangeEvent event{kind, type, relative_path.generic_string()};
            switch (kind) {
                case ChangeKind::CREATED: ++result_.created; break;
                case ChangeKind::MODIFIED: ++result_.modified; break;
                case ChangeKind::REMOVED: ++result_.removed; break;
            }
            result_.events.push_back(event);
            sink_.change(event);
        }

        void fail(const char* operation, const fs::path& relative_path, const std::string& message) {
            EntryError error{operation, relative_path.generic_string(), message};
            result_.errors.push_back(error);
            sink_.entry_failed(error);
        }

        EventSink& sink_;
        const SyncOptions& options_;
        const fs::path& source_root_;
        const fs::path& destination_root_;
        PassResult& result_;
        std::vector<fs::path> replaced_;
    };
}

PassSummary PassResult::summary() const {
    PassSummary summary;
    summary.duration_seconds = duration_seconds;
    summary.created = created;
    summary.modified = modified;
    summary.removed = removed;
    summary.errors = errors.size();
    return summary;
}

SyncExecutor::SyncExecutor(EventSink& sink, SyncOptions options)
    : sink_(sink), options_(std::move(options)) {}

PassResult SyncExecutor::run_pass(const fs::path& source_root, const fs::path& destination_root) {
    PassResult result;
    const auto started = std::chrono::steady_clock::now();
    sink_.pass_started();

    try {
        PassRunner(sink_, options_, source_root, destination_root, result).run();
    } catch (const RootUnreadable& e) {
        result.abort_reason = e.what();
    }

    result.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();

    if (result.aborted()) {
        sink_.pass_aborted(*result.abort_reason);
    } else {
        sink_.pass_completed(result.summary());
    }
    return result;
}

}
