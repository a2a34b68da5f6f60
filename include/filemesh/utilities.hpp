/**
 * @file utilities.hpp
 * @brief Common utility functions for FileMesh
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout FileMesh:
 * - Logging and error reporting
 * - Time helpers
 * - String manipulation
 * - Environment lookup
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace filemesh {
namespace utilities {

/**
 * @brief Log levels for FileMesh logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case insensitive
 * @return LogLevel or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Current wall-clock time in milliseconds since the Unix epoch
 */
uint64_t current_time_ms();

/**
 * @brief Format file size in human-readable format
 * @param size Size in bytes
 * @return Formatted string (e.g., "1.5 MB", "3.2 GB")
 */
std::string format_file_size(uint64_t size);

/**
 * @brief Split string by delimiter
 * @param str String to split
 * @param delimiter Delimiter character
 * @return Vector of split strings
 */
std::vector<std::string> split_string(const std::string& str, char delimiter);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Check if string starts with prefix
 */
bool starts_with(const std::string& str, const std::string& prefix);

/**
 * @brief Decode %XX escapes (URL path segments)
 * @param str Encoded string
 * @return Decoded string or std::nullopt on a broken escape
 */
std::optional<std::string> url_decode(const std::string& str);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

} // namespace utilities
} // namespace filemesh
