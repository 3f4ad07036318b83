#include "log_event_sink.hpp"

#include <utility>

namespace mirrord {

namespace {
    std::string display_path(const std::string& relative_path) {
        return relative_path.empty() ? "." : relative_path;
    }

    const char* verb(ChangeKind kind) {
        switch (kind) {
            case ChangeKind::CREATED: return "create";
            case ChangeKind::MODIFIED: return "modify";
            case ChangeKind::REMOVED: return "remove";
        }
        return "touch";
    }

    const char* past_tense(ChangeKind kind) {
        switch (kind) {
            case ChangeKind::CREATED: return "Created";
            case ChangeKind::MODIFIED: return "Modified";
            case ChangeKind::REMOVED: return "Removed";
        }
        return "Touched";
    }
}

LogEventSink::LogEventSink(std::shared_ptr<spdlog::logger> logger, bool noop)
    : logger_(std::move(logger)), noop_(noop) {}

void LogEventSink::pass_started() {
    logger_->debug("Syncing...");
}

void LogEventSink::change(const ChangeEvent& event) {
    if (noop_) {
        logger_->info("[NOOP] Would {} {} {}", verb(event.kind),
                      to_string(event.entry_type), display_path(event.relative_path));
        return;
    }
    logger_->info("{} {} {}", past_tense(event.kind),
                  to_string(event.entry_type), display_path(event.relative_path));
}

void LogEventSink::entry_failed(const EntryError& error) {
    logger_->error("Failed to {} {}: {}", error.operation,
                   display_path(error.relative_path), error.message);
}

void LogEventSink::pass_completed(const PassSummary& summary) {
    const bool changed = summary.created || summary.modified || summary.removed || summary.errors;
    logger_->log(changed ? spdlog::level::info : spdlog::level::debug,
                 "Pass finished: {} created, {} modified, {} removed, {} errors",
                 summary.created, summary.modified, summary.removed, summary.errors);
    logger_->debug("Syncing completed successfully! Duration: {:.4f} seconds.",
                   summary.duration_seconds);
}

void LogEventSink::pass_aborted(const std::string& reason) {
    logger_->warn("Pass aborted, retrying next interval: {}", reason);
}

void LogEventSink::inconsistency_detected(const Inconsistency& inconsistency) {
    logger_->warn("Inconsistency detected at {}: {}",
                  display_path(inconsistency.relative_path), inconsistency.reason);
}

void LogEventSink::consistency_checked(const ConsistencySummary& summary) {
    logger_->info("Consistency check completed: {} files compared, {} inconsistent, {} errors ({:.4f} seconds)",
                  summary.files_compared, summary.inconsistencies, summary.errors,
                  summary.duration_seconds);
}

void LogEventSink::consistency_aborted(const std::string& reason) {
    logger_->warn("Consistency check skipped: {}", reason);
}

void LogEventSink::scheduler_stopped(std::size_t passes) {
    logger_->info("Sync loop stopped after {} passes", passes);
}

}
