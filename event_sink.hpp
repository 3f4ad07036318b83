#pragma once

#include <cstddef>
#include <string>

namespace mirrord {

enum class ChangeKind {
    CREATED,
    MODIFIED,
    REMOVED
};

enum class EntryType {
    FILE,
    DIRECTORY
};

struct ChangeEvent {
    ChangeKind kind;
    EntryType entry_type;
    std::string relative_path;  // generic form, empty for a tree root

    bool operator==(const ChangeEvent& other) const {
        return kind == other.kind &&
               entry_type == other.entry_type &&
               relative_path == other.relative_path;
    }
    bool operator!=(const ChangeEvent& other) const { return !(*this == other); }
};

// A failure confined to one entry; the pass carries on without it.
struct EntryError {
    std::string operation;  // "copy", "remove", "mkdir", "stat", "list", "hash"
    std::string relative_path;
    std::string message;
};

struct PassSummary {
    double duration_seconds{0.0};
    std::size_t created{0};
    std::size_t modified{0};
    std::size_t removed{0};
    std::size_t errors{0};
};

struct Inconsistency {
    std::string relative_path;
    std::string reason;
};

struct ConsistencySummary {
    double duration_seconds{0.0};
    std::size_t files_compared{0};
    std::size_t inconsistencies{0};
    std::size_t errors{0};
};

/**
 * Receives what the sync core does. The core reports structured events
 * only; turning them into log lines is up to the implementation.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void pass_started() {}
    virtual void change(const ChangeEvent& event) = 0;
    virtual void entry_failed(const EntryError& error) = 0;
    virtual void pass_completed(const PassSummary& summary) = 0;
    virtual void pass_aborted(const std::string& reason) = 0;

    virtual void inconsistency_detected(const Inconsistency&) {}
    virtual void consistency_checked(const ConsistencySummary&) {}
    virtual void consistency_aborted(const std::string&) {}

    virtual void scheduler_stopped(std::size_t) {}
};

const char* to_string(ChangeKind kind);
const char* to_string(EntryType type);

}
