#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace mirrord {

namespace {
    sigset_t shutdown_signals() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGHUP);
        return set;
    }

    std::string signal_name(int signum) {
        switch (signum) {
            case SIGTERM: return "SIGTERM";
            case SIGINT: return "SIGINT";
            case SIGHUP: return "SIGHUP";
            default: return std::to_string(signum);
        }
    }
}

void daemonize(const Config& config) {
    spdlog::info("Daemonizing process");

    // Create PID file directory if it doesn't exist
    if (!config.pid_file.empty()) {
        fs::path pid_dir = fs::path(config.pid_file).parent_path();
        if (!pid_dir.empty() && !fs::exists(pid_dir)) {
            try {
                fs::create_directories(pid_dir);
            } catch (const std::exception& e) {
                throw std::runtime_error("Failed to create PID file directory: " + std::string(e.what()));
            }
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error("Failed to fork process: " + std::string(std::strerror(errno)));
    }
    if (pid > 0) {
        // Write the child's PID before the parent exits
        if (!config.pid_file.empty()) {
            std::ofstream pid_file(config.pid_file);
            if (!pid_file) {
                throw std::runtime_error("Failed to write PID file: " + config.pid_file);
            }
            pid_file << pid << '\n';
        }
        std::exit(0);
    }

    if (setsid() < 0) {
        throw std::runtime_error("Failed to create new session");
    }

    // Redirect standard file descriptors to /dev/null
    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        dup2(null_fd, STDOUT_FILENO);
        dup2(null_fd, STDERR_FILENO);
        if (null_fd > 2) {
            close(null_fd);
        }
    }
}

SignalWatcher::SignalWatcher(StopSignal& stop) : stop_(stop) {
    sigset_t set = shutdown_signals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw std::runtime_error("Failed to block shutdown signals: " + std::string(std::strerror(rc)));
    }
    thread_ = std::thread([this] { watch(); });
}

SignalWatcher::~SignalWatcher() {
    // closing_ goes first: a real signal arriving after this point is
    // swallowed instead of logged as a shutdown request. If it lands between
    // the check and pthread_kill, the extra SIGTERM stays pending and
    // blocked, and the thread is still joinable, so both outcomes are safe.
    closing_ = true;
    if (!done_) {
        // Wake sigwait so the thread can be joined
        pthread_kill(thread_.native_handle(), SIGTERM);
    }
    thread_.join();
}

void SignalWatcher::watch() {
    sigset_t set = shutdown_signals();
    int signum = 0;
    int rc = sigwait(&set, &signum);
    done_ = true;

    if (closing_) {
        return;
    }
    if (rc != 0) {
        spdlog::error("Waiting for shutdown signals failed: {}", std::strerror(rc));
    } else {
        spdlog::info("Received signal {}, initiating shutdown...", signal_name(signum));
    }
    stop_.request_stop();
}

}
