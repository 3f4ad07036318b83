#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace mirrord {

// One-shot stop request with an interruptible wait.
class StopSignal {
public:
    void request_stop();
    bool stop_requested() const;

    // Returns true if a stop was requested before the timeout ran out.
    bool wait_for(std::chrono::steady_clock::duration timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_{false};
};

}
