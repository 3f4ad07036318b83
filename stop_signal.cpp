#include "stop_signal.hpp"

namespace mirrord {

void StopSignal::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

bool StopSignal::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

bool StopSignal::wait_for(std::chrono::steady_clock::duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return stopped_; });
}

}
