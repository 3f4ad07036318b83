#pragma once

#include <atomic>
#include <thread>

#include "config.hpp"
#include "stop_signal.hpp"

namespace mirrord {

// Forks into the background and detaches from the terminal. The parent
// writes the child's PID to config.pid_file (when set) and exits.
// Must be called before any thread is started.
void daemonize(const Config& config);

/**
 * Turns SIGINT, SIGTERM and SIGHUP into a StopSignal request. The signals
 * are blocked in the constructing thread (and so in every thread created
 * afterwards) and collected with sigwait on a dedicated thread, so nothing
 * runs in signal handler context.
 */
class SignalWatcher {
public:
    explicit SignalWatcher(StopSignal& stop);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void watch();

    StopSignal& stop_;
    std::atomic<bool> done_{false};
    std::atomic<bool> closing_{false};
    std::thread thread_;
};

}
