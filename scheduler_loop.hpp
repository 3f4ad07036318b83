#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

#include "consistency_check.hpp"
#include "event_sink.hpp"
#include "stop_signal.hpp"
#include "sync_executor.hpp"

namespace mirrord {

/**
 * Runs sync passes back to back on the calling thread, waiting `interval`
 * after the end of each pass. The stop signal is checked before every pass
 * and interrupts the wait; a pass already running is always finished.
 *
 * With a consistency checker attached, an audit follows the first pass and
 * then any pass that ends at least `consistency_interval` after the last
 * audit.
 */
class SchedulerLoop {
public:
    SchedulerLoop(SyncExecutor& executor, EventSink& sink,
                  ConsistencyChecker* checker = nullptr,
                  std::chrono::steady_clock::duration consistency_interval = std::chrono::steady_clock::duration::zero());

    // Returns the number of passes run once the stop signal fires.
    std::size_t run(const std::filesystem::path& source_root,
                    const std::filesystem::path& destination_root,
                    std::chrono::steady_clock::duration interval,
                    StopSignal& stop);

private:
    void run_consistency_check_if_due(const std::filesystem::path& source_root,
                                      const std::filesystem::path& destination_root);

    SyncExecutor& executor_;
    EventSink& sink_;
    ConsistencyChecker* checker_;
    std::chrono::steady_clock::duration consistency_interval_;
    std::chrono::steady_clock::time_point last_check_;
    bool checked_{false};
};

}
