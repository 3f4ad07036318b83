#include "scheduler_loop.hpp"

#include <exception>
#include <string>

namespace fs = std::filesystem;

namespace mirrord {

SchedulerLoop::SchedulerLoop(SyncExecutor& executor, EventSink& sink,
                             ConsistencyChecker* checker,
                             std::chrono::steady_clock::duration consistency_interval)
    : executor_(executor), sink_(sink), checker_(checker),
      consistency_interval_(consistency_interval) {}

std::size_t SchedulerLoop::run(const fs::path& source_root, const fs::path& destination_root,
                               std::chrono::steady_clock::duration interval, StopSignal& stop) {
    std::size_t passes = 0;

    while (!stop.stop_requested()) {
        ++passes;
        try {
            executor_.run_pass(source_root, destination_root);
            run_consistency_check_if_due(source_root, destination_root);
        } catch (const std::exception& e) {
            // Keep the daemon alive; the next pass starts from scratch.
            sink_.pass_aborted(std::string("unexpected error: ") + e.what());
        }

        if (stop.wait_for(interval)) {
            break;
        }
    }

    sink_.scheduler_stopped(passes);
    return passes;
}

void SchedulerLoop::run_consistency_check_if_due(const fs::path& source_root,
                                                 const fs::path& destination_root) {
    if (!checker_ || consistency_interval_ <= std::chrono::steady_clock::duration::zero()) {
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    if (checked_ && now - last_check_ < consistency_interval_) {
        return;
    }

    checker_->run(source_root, destination_root);
    checked_ = true;
    last_check_ = std::chrono::steady_clock::now();
}

}
