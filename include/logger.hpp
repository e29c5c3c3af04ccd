#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

using LogFields = std::map<std::string, std::string>;

/**
 * @brief Open the log file and start the background writer.
 *
 * Until this is called every log call is a no-op, so a supervisor started
 * without `--log-file` writes nothing anywhere.
 *
 * @param path      Log file, opened for append.
 * @param level     Minimum @ref LogLevel recorded.
 * @param max_size  Rotate once the file grows beyond this many bytes. `0`
 *                  disables rotation.
 * @param max_files Number of rotated files (`path.1`, `path.2`, ...) kept.
 * @return `false` if the file could not be opened.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/** @brief Mirror every entry to syslog under @p facility. */
void init_syslog(int facility);

void set_log_level(LogLevel level);

/** @brief Emit entries as JSON objects instead of plain text lines. */
void set_json_logging(bool enable);

/** @brief gzip rotated files (`path.1.gz`, ...). */
void set_log_compression(bool enable);


/**
 * @brief Parse a level name (DEBUG, INFO, WARNING/WARN, ERROR/ERR).
 *
 * @return `false` for an unrecognized name, leaving @p out untouched.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

void log_event(LogLevel level, const std::string& message, const LogFields& fields = {});

void log_debug(const std::string& msg, const LogFields& fields = {});
void log_info(const std::string& msg, const LogFields& fields = {});
void log_warning(const std::string& msg, const LogFields& fields = {});
void log_error(const std::string& msg, const LogFields& fields = {});

/** @brief Block until every queued entry has been written. */
void flush_logger();

/** @brief Drain the queue, stop the writer and close file and syslog. */
void shutdown_logger();

#endif // LOGGER_HPP
