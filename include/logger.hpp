#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and starts the background
 * writer thread. Console output is configured separately with
 * set_console_logging().
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
 * @brief Set the global minimum log level for every sink.
 */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted lines in the log file.
 */
void set_json_logging(bool enable);

/**
 * @brief Compress rotated log files with gzip.
 */
void set_log_compression(bool enable);

/**
 * @brief Mirror log lines to the console.
 *
 * DEBUG and INFO lines go to stdout, WARNING and ERR lines to stderr. The
 * console sink is synchronous so it interleaves correctly with other
 * program output.
 */
void set_console_logging(bool enable);

/**
 * @brief Emit GitHub Actions workflow commands on the console.
 *
 * Warnings and errors are prefixed with `::warning::` / `::error::` and
 * groups are rendered as `::group::` / `::endgroup::` markers.
 */
void set_github_annotations(bool enable);

/**
 * @brief Check whether the file logger has been initialized.
 */
bool logger_initialized();

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::string& data);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::string& data);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::string& data);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::string& data);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Open a collapsible console group.
 *
 * Renders a `::group::` marker in annotation mode and a plain title line
 * otherwise. The title is also written to the log file.
 */
void log_group_begin(const std::string& title);

/**
 * @brief Close the group opened by log_group_begin().
 */
void log_group_end();

/**
 * @brief RAII helper pairing log_group_begin() with log_group_end().
 */
struct LogGroup {
    explicit LogGroup(const std::string& title) { log_group_begin(title); }
    ~LogGroup() { log_group_end(); }
    LogGroup(const LogGroup&) = delete;
    LogGroup& operator=(const LogGroup&) = delete;
};

/**
 * @brief Initialize system logging using the specified facility.
 *
 * @param facility Syslog facility identifier to tag messages with.
 */
void init_syslog(int facility = 0);

/**
 * @brief Block until the writer thread has drained queued file entries.
 */
void flush_logger();

/**
 * @brief Shut down the logging subsystem and release resources.
 */
void shutdown_logger();

#endif // LOGGER_HPP
