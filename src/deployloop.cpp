/**
 * @file deployloop.cpp
 * @brief CLI entry point of the worker supervisor.
 *
 * Keeps a worker process (by default `python ./bot_main.py`) running forever,
 * hard-resetting the working tree to the remote branch before each start
 * whenever it has no local changes.
 */

#include <iostream>
#include <stdexcept>

#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "supervisor.hpp"
#include "version.hpp"

static void setup_logging(const LoggingOptions& log) {
    if (!log.log_file.empty()) {
        set_json_logging(log.json_log);
        set_log_compression(log.compress_logs);
        if (!init_logger(log.log_file, log.log_level, log.max_log_size, log.max_log_files))
            throw std::runtime_error("Cannot open log file " + log.log_file);
    }
    if (log.use_syslog) {
        set_log_level(log.log_level);
        init_syslog(log.syslog_facility);
    }
}

int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << DEPLOYLOOP_VERSION << "\n";
            return 0;
        }
        setup_logging(opts.logging);
        install_signal_handlers();
        int rc = run_supervisor(opts);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
