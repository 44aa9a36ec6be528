#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for append. When the file cannot be opened
 * the logger falls back to a discard sink: every later call is accepted and
 * dropped, so callers never have to care whether logging works.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 * @return `true` if the file sink is active, `false` if logs are discarded.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Enable or disable JSON formatted logging.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated files instead of keeping them as plain text.
 */
void set_log_compression(bool enable);

/**
 * @brief Check whether a file sink is open.
 *
 * @return `true` if entries reach a file; `false` while discarding.
 */
bool logger_initialized();

/** @return Path of the active log file, empty while discarding. */
std::string log_file_path();

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields = {});

/**
 * @brief Mirror log entries to syslog using the specified facility.
 */
void init_syslog(int facility = 0);

/**
 * @brief Flush buffered entries to the file sink.
 */
void flush_logger();

/**
 * @brief Close the file sink and syslog connection.
 */
void shutdown_logger();

#endif // LOGGER_HPP
