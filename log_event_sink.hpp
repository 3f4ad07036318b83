#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "event_sink.hpp"

namespace mirrord {

// Renders sync events through an spdlog logger. Changes go out at info,
// per-entry failures at error, pass bookkeeping at debug.
class LogEventSink : public EventSink {
public:
    explicit LogEventSink(std::shared_ptr<spdlog::logger> logger, bool noop = false);

    void pass_started() override;
    void change(const ChangeEvent& event) override;
    void entry_failed(const EntryError& error) override;
    void pass_completed(const PassSummary& summary) override;
    void pass_aborted(const std::string& reason) override;

    void inconsistency_detected(const Inconsistency& inconsistency) override;
    void consistency_checked(const ConsistencySummary& summary) override;
    void consistency_aborted(const std::string& reason) override;

    void scheduler_stopped(std::size_t passes) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    bool noop_;
};

}
