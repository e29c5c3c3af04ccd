#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file; ///< Empty disables file logging
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool compress_logs = false;
    bool json_log = false;
    bool use_syslog = false;
    int syslog_facility = 8; // LOG_USER
};

struct Options {
    std::filesystem::path repo = ".";
    std::string remote_name = "origin";
    std::string branch = "main";
    std::vector<std::string> worker_command{"python", "./bot_main.py"};
    std::chrono::milliseconds restart_delay{0};
    bool use_credentials = false;
    std::filesystem::path credential_file;
    std::filesystem::path ssh_public_key;
    std::filesystem::path ssh_private_key;
    LoggingOptions logging;
    std::filesystem::path config_file;
    bool show_help = false;
    bool print_version = false;
};

/**
 * Parse command-line arguments and an optional configuration file into an
 * Options instance.
 *
 * Configuration files are named with `--config-yaml` or `--config-json`;
 * command-line values take precedence over file values. Everything after a
 * bare `--` is the worker command.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Populated Options. With no arguments this is the default
 *         configuration: repository `.`, `origin main`, worker
 *         `python ./bot_main.py`.
 * @throws std::runtime_error on unknown options, bad values or an
 *         unreadable configuration file.
 */
Options parse_options(int argc, char* argv[]);

/**
 * Split a worker command line on whitespace.
 *
 * No quoting rules apply; used for the `worker` configuration key.
 */
std::vector<std::string> split_command(const std::string& line);

#endif // OPTIONS_HPP
