// mirrord.cpp

/*
Usage:
    mirrord <source> <destination> [-i SECONDS] [-l LOG_FILE] [-d] [-c CONFIG]
            [-n] [-e PATTERN]... [--consistency-check SECONDS]
            [--daemon] [-p PID_FILE] [--check-config]

Sample Configuration (mirrord.yaml), passed with -c:

'''yaml
source: /srv/data             # Required unless given on the command line
destination: /mnt/replica     # Required unless given on the command line
interval: 10                  # Seconds between the end of a pass and the next (default: 10)
log_file: ~/.local/state/mirrord.log   # Truncated at startup (default: ./mirrord.log)
log_level: info               # trace, debug, info, warn, error (default: info)
noop: false                   # Dry-run mode (default: false)
exclude:                      # Neither copied nor pruned
  - "*.tmp"
  - ".git"
consistency_check_interval: 0 # Seconds between content audits, 0 disables (default: 0)
daemon: false                 # Run as daemon (default: false)
pid_file: /run/user/1000/mirrord.pid
'''

Notes:
1. The source is authoritative. Anything in the destination that the source
   does not have is deleted, including changes made directly in the
   destination.

2. A destination file is overwritten only when the source file's
   modification time is strictly newer. Same-age or newer destination files
   are left alone even if their contents differ; enable
   consistency_check_interval to have such files reported.

3. Relative paths in the configuration file resolve against the directory
   holding the file. Command line options override the file.
*/

#include <iostream>
#include <memory>

#include <spdlog/spdlog.h>

#include "config.hpp"
#include "consistency_check.hpp"
#include "errors.hpp"
#include "exclude_filter.hpp"
#include "log_event_sink.hpp"
#include "logging.hpp"
#include "process.hpp"
#include "scheduler_loop.hpp"
#include "stop_signal.hpp"
#include "sync_executor.hpp"

int main(int argc, char* argv[]) {
    try {
        // Console-only logging until the configuration is known
        spdlog::set_default_logger(mirrord::make_console_logger());

        mirrord::Config config = mirrord::parse_arguments(argc, argv);
        if (config.help) {
            std::cout << config.help_text << std::endl;
            return 0;
        }

        mirrord::validate_config(config);
        if (config.check_config) {
            std::cout << "Configuration OK" << std::endl;
            return 0;
        }

        auto logger = mirrord::setup_logging(config);
        spdlog::set_default_logger(logger);

        spdlog::info("Starting mirrord in {} mode{}: {} -> {} every {}s",
                     config.daemon ? "daemon" : "foreground",
                     config.noop ? " (dry run)" : "",
                     config.source, config.destination, config.interval.count());
        spdlog::info("Log file: {}", config.log_file);
        if (!config.exclude_patterns.empty()) {
            spdlog::info("Excluding {} pattern(s)", config.exclude_patterns.size());
        }

        if (config.daemon) {
            mirrord::daemonize(config);
        }

        mirrord::StopSignal stop;
        mirrord::SignalWatcher signal_watcher(stop);

        mirrord::LogEventSink sink(logger, config.noop);
        mirrord::ExcludeFilter exclude(config.exclude_patterns);

        mirrord::SyncOptions options;
        options.dry_run = config.noop;
        options.exclude = exclude;
        mirrord::SyncExecutor executor(sink, options);

        std::unique_ptr<mirrord::ConsistencyChecker> checker;
        if (config.consistency_check_interval.count() > 0) {
            checker = std::make_unique<mirrord::ConsistencyChecker>(sink, exclude);
            spdlog::info("Consistency check every {}s", config.consistency_check_interval.count());
        }

        mirrord::SchedulerLoop loop(executor, sink, checker.get(), config.consistency_check_interval);
        loop.run(config.source, config.destination, config.interval, stop);

        spdlog::info("Shutdown complete");
        return 0;
    } catch (const mirrord::ConfigurationError& e) {
        spdlog::critical("Configuration error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
