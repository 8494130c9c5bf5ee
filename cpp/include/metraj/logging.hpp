#pragma once

#include <ostream>
#include <string>

namespace metraj {

/**
 * @brief Log severity levels, lowest first
 */
enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/**
 * @brief Set the minimum level that is written
 *
 * Default is LogLevel::Warn so that plain calculations stay silent.
 */
void set_log_level(LogLevel level);

/**
 * @brief Get the current minimum log level
 */
LogLevel get_log_level();

/**
 * @brief Redirect all log output to the given stream
 *
 * Passing nullptr restores the defaults (stdout for debug/info,
 * stderr for warn/error). The stream must outlive its use as sink.
 */
void set_log_stream(std::ostream* stream);

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

/**
 * @brief Convert log level to its tag string ("DEBUG", "INFO", ...)
 */
std::string log_level_to_string(LogLevel level);

} // namespace metraj
