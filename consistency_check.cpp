#include "consistency_check.hpp"

#include <array>
#include <chrono>
#include <fstream>
#include <memory>
#include <system_error>
#include <utility>

#include <xxhash.h>

#include "errors.hpp"
#include "tree_enumerator.hpp"

namespace fs = std::filesystem;

namespace mirrord {

namespace {
    using HashState = std::unique_ptr<XXH64_state_t, decltype(&XXH64_freeState)>;

    std::optional<XXH64_hash_t> hash_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return std::nullopt;
        }

        HashState state(XXH64_createState(), &XXH64_freeState);
        if (!state || XXH64_reset(state.get(), 0) == XXH_ERROR) {
            return std::nullopt;
        }

        std::array<char, 64 * 1024> buffer;
        while (in.read(buffer.data(), buffer.size()) || in.gcount() > 0) {
            if (XXH64_update(state.get(), buffer.data(), static_cast<size_t>(in.gcount())) == XXH_ERROR) {
                return std::nullopt;
            }
        }
        if (in.bad()) {
            return std::nullopt;
        }
        return XXH64_digest(state.get());
    }
}

ConsistencySummary ConsistencyReport::summary() const {
    ConsistencySummary summary;
    summary.duration_seconds = duration_seconds;
    summary.files_compared = files_compared;
    summary.inconsistencies = inconsistencies.size();
    summary.errors = errors.size();
    return summary;
}

ConsistencyChecker::ConsistencyChecker(EventSink& sink, ExcludeFilter exclude)
    : sink_(sink), exclude_(std::move(exclude)) {}

ConsistencyReport ConsistencyChecker::run(const fs::path& source_root, const fs::path& destination_root) {
    ConsistencyReport report;
    const auto started = std::chrono::steady_clock::now();

    auto fail = [&](const char* operation, const fs::path& relative_path, const std::string& message) {
        EntryError error{operation, relative_path.generic_string(), message};
        report.errors.push_back(error);
        sink_.entry_failed(error);
    };
    auto diverged = [&](const fs::path& relative_path, const char* reason) {
        Inconsistency inconsistency{relative_path.generic_string(), reason};
        report.inconsistencies.push_back(inconsistency);
        sink_.inconsistency_detected(inconsistency);
    };

    try {
        TreeEnumerator source(source_root, &exclude_);
        // Only validates the destination root.
        TreeEnumerator destination(destination_root, &exclude_);

        DirectoryNode node;
        while (source.next(node)) {
            if (!node.error.empty()) {
                fail("list", node.relative_path, node.error);
                continue;
            }

            for (const auto& name : node.files) {
                const auto relative_path = node.relative_path / name;
                const auto source_file = source_root / relative_path;
                const auto destination_file = destination_root / relative_path;

                std::error_code ec;
                if (!fs::is_regular_file(fs::symlink_status(destination_file, ec))) {
                    // Missing copies are the sync pass's business.
                    continue;
                }

                const auto source_size = fs::file_size(source_file, ec);
                if (ec) {
                    fail("stat", relative_path, ec.message());
                    continue;
                }
                const auto destination_size = fs::file_size(destination_file, ec);
                if (ec) {
                    fail("stat", relative_path, ec.message());
                    continue;
                }

                ++report.files_compared;
                if (source_size != destination_size) {
                    diverged(relative_path, "size differs");
                    continue;
                }

                auto source_hash = hash_file(source_file);
                auto destination_hash = hash_file(destination_file);
                if (!source_hash || !destination_hash) {
                    fail("hash", relative_path, "could not read file contents");
                    continue;
                }
                if (*source_hash != *destination_hash) {
                    diverged(relative_path, "content differs");
                }
            }
        }
    } catch (const RootUnreadable& e) {
        report.abort_reason = e.what();
    }

    report.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();

    if (report.abort_reason) {
        sink_.consistency_aborted(*report.abort_reason);
    } else {
        sink_.consistency_checked(report.summary());
    }
    return report;
}

}
