#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "event_sink.hpp"
#include "exclude_filter.hpp"

namespace mirrord {

struct SyncOptions {
    bool dry_run{false};
    ExcludeFilter exclude;
};

struct PassResult {
    std::size_t created{0};
    std::size_t modified{0};
    std::size_t removed{0};
    std::vector<ChangeEvent> events;
    std::vector<EntryError> errors;
    double duration_seconds{0.0};
    std::optional<std::string> abort_reason;

    bool aborted() const { return abort_reason.has_value(); }
    PassSummary summary() const;
};

/**
 * One-way mirror of a source tree onto a destination tree.
 *
 * A pass runs two phases. Phase A walks the source top-down, creating
 * missing destination directories and copying files that are missing or
 * older in the destination. Phase B walks a snapshot of the destination and
 * prunes every file and directory the source no longer has; a pruned
 * directory goes in one recursive removal reported once.
 *
 * Staleness is judged by modification time alone: a destination file whose
 * mtime is equal to or newer than the source's is left untouched even if
 * the contents differ.
 *
 * Per-entry failures are recorded in the result and reported to the sink;
 * they never stop the pass. An unreadable root aborts the pass.
 */
class SyncExecutor {
public:
    explicit SyncExecutor(EventSink& sink, SyncOptions options = {});

    PassResult run_pass(const std::filesystem::path& source_root,
                        const std::filesystem::path& destination_root);

    const SyncOptions& options() const { return options_; }

private:
    EventSink& sink_;
    SyncOptions options_;
};

}
