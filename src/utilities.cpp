/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for FileMesh
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "filemesh/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace filemesh {
namespace utilities {

namespace {
    // Global logger instance
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_logger_mutex;

    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> logger() {
        {
            std::lock_guard<std::mutex> lock(g_logger_mutex);
            if (g_logger) {
                return g_logger;
            }
        }
        initialize_logging();
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        return g_logger;
    }
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // File sink (rotating, 10MB per file, 3 files max)
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        auto created = std::make_shared<spdlog::logger>("filemesh", sinks.begin(), sinks.end());
        created->set_level(to_spdlog_level(level));
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        spdlog::set_default_logger(created);

        std::lock_guard<std::mutex> lock(g_logger_mutex);
        g_logger = created;

    } catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = to_lowercase(name);
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    auto active = logger();
    if (!active) {
        std::fprintf(stderr, "%s\n", message.c_str());
        return;
    }

    switch (level) {
        case LogLevel::DEBUG:    active->debug(message); break;
        case LogLevel::INFO:     active->info(message); break;
        case LogLevel::WARN:     active->warn(message); break;
        case LogLevel::ERROR:    active->error(message); break;
        case LogLevel::CRITICAL: active->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

// ============================================================================
// TIME FUNCTIONS
// ============================================================================

uint64_t current_time_ms() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::string format_file_size(uint64_t size) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size_d = static_cast<double>(size);

    while (size_d >= 1024.0 && unit_index < 4) {
        size_d /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size_d << " " << units[unit_index];
    return oss.str();
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }

    return result;
}

std::string trim_string(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });

    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lowercase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.length() > str.length()) {
        return false;
    }
    return str.compare(0, prefix.length(), prefix) == 0;
}

std::optional<std::string> url_decode(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] != '%') {
            result += str[i];
            continue;
        }

        if (i + 2 >= str.size() ||
            !std::isxdigit(static_cast<unsigned char>(str[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
            return std::nullopt;
        }

        result += static_cast<char>(std::stoi(str.substr(i + 1, 2), nullptr, 16));
        i += 2;
    }

    return result;
}

// ============================================================================
// ENVIRONMENT FUNCTIONS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

} // namespace utilities
} // namespace filemesh
