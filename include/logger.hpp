#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

using LogFields = std::map<std::string, std::string>;

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path and configures log rotation parameters. Until
 * this (or @ref set_console_logging) is called, messages are discarded.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Mirror log lines to standard error.
 *
 * Starts the background writer if it is not running yet.
 */
void set_console_logging(bool enable);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/** @brief Current minimum log level. */
LogLevel log_level();

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit logs as JSON objects instead of plain
 *               text.
 */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files. */
void set_log_compression(bool enable);

/** @brief Configure how many rotated log files are retained. */
void set_log_rotation(size_t max_files);

/**
 * @brief Check whether the file logger has been initialized.
 */
bool logger_initialized();

/**
 * @brief Parse a level name (`DEBUG`, `INFO`, `WARNING`/`WARN`, `ERROR`),
 *        case-insensitively.
 *
 * @return `false` when @p name is not a known level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Log a message with the specified severity.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Structured key/value context appended to the entry.
 */
void log_event(LogLevel level, const std::string& message, const LogFields& fields = {});

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const LogFields& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const LogFields& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const LogFields& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const LogFields& fields);

/**
 * @brief Initialize system logging using the specified facility.
 *
 * No-op outside Linux.
 */
void init_syslog(int facility = 0);

/** @brief Block until every queued message has been written. */
void flush_logger();

/** @brief Shut down the logging subsystem and release resources. */
void shutdown_logger();

#endif // LOGGER_HPP
