/**
 * @file config.cpp
 * @brief Implementation of configuration loading and input validation
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/config.hpp"
#include "filemesh/utilities.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace filemesh {
namespace config {

namespace {

    std::filesystem::path ensure_directory(const std::filesystem::path& dir) {
        if (!std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }
        return dir;
    }

    bool parse_port(const std::string& value, uint16_t& port) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        try {
            size_t consumed = 0;
            unsigned long parsed = std::stoul(value, &consumed);
            if (consumed != value.size() || parsed == 0 || parsed > 65535) {
                return false;
            }
            port = static_cast<uint16_t>(parsed);
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
}

// ============================================================================
// NodeConfig
// ============================================================================

NodeConfig NodeConfig::from_environment() {
    NodeConfig config;

    uint16_t port = 0;
    std::string port_env = utilities::get_env("PORT");
    if (!port_env.empty() && parse_port(port_env, port)) {
        config.http_port = port;
    }

    std::string data_env = utilities::get_env("FILEMESH_DATA_DIR");
    if (!data_env.empty()) {
        config.data_dir = data_env;
    }

    config.log_level = utilities::get_env("FILEMESH_LOG_LEVEL", config.log_level);
    config.log_file = utilities::get_env("FILEMESH_LOG_FILE");

    for (const auto& entry : utilities::split_string(utilities::get_env("FILEMESH_BOOTSTRAP"), ',')) {
        std::string address = utilities::trim_string(entry);
        if (!address.empty()) {
            config.bootstrap_addresses.push_back(address);
        }
    }

    return config;
}

bool NodeConfig::apply_arguments(const std::vector<std::string>& args, std::string& error) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];

        if (i + 1 >= args.size()) {
            error = "Missing value for " + flag;
            return false;
        }
        const std::string& value = args[++i];

        if (flag == "--port") {
            if (!parse_port(value, http_port)) {
                error = "Invalid port: " + value;
                return false;
            }
        } else if (flag == "--beacon-port") {
            if (!parse_port(value, beacon_port)) {
                error = "Invalid beacon port: " + value;
                return false;
            }
        } else if (flag == "--data-dir") {
            data_dir = value;
        } else if (flag == "--log-level") {
            log_level = utilities::to_lowercase(value);
        } else if (flag == "--log-file") {
            log_file = value;
        } else if (flag == "--bootstrap") {
            bootstrap_addresses.push_back(value);
        } else if (flag == "--max-dial-retries") {
            // std::stoul accepts a sign and wraps "-1" to the maximum
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
                error = "Invalid retry count: " + value;
                return false;
            }
            size_t retries = 0;
            try {
                retries = std::stoul(value);
            } catch (const std::exception&) {
                error = "Invalid retry count: " + value;
                return false;
            }
            if (retries == 0) {
                error = "Retry count must be at least 1";
                return false;
            }
            max_dial_retries = retries;
        } else {
            error = "Unknown option: " + flag;
            return false;
        }
    }

    return true;
}

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    // Check for environment variable FILEMESH_DATA_DIR
    const char* env_data_dir = std::getenv("FILEMESH_DATA_DIR");

    if (env_data_dir != nullptr && std::strlen(env_data_dir) > 0) {
        return ensure_directory(std::filesystem::path(env_data_dir));
    }

    return ensure_directory(std::filesystem::current_path() / "filemesh-data");
}

std::filesystem::path get_shared_directory(const std::filesystem::path& data_dir) {
    return ensure_directory(data_dir / "shared");
}

std::filesystem::path get_keys_directory(const std::filesystem::path& data_dir) {
    return ensure_directory(data_dir / "keys");
}

// ============================================================================
// Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }

    return true;
}

std::string sanitize_filename(const std::string& filename) {
    std::string sanitized = filename;

    // Keep only the last path component
    auto separator = sanitized.find_last_of("/\\");
    if (separator != std::string::npos) {
        sanitized = sanitized.substr(separator + 1);
    }

    sanitized.erase(
        std::remove(sanitized.begin(), sanitized.end(), '\0'),
        sanitized.end()
    );

    sanitized = utilities::trim_string(sanitized);

    const std::string dangerous_chars = "<>:\"|?*";
    for (char& c : sanitized) {
        if (dangerous_chars.find(c) != std::string::npos ||
            std::iscntrl(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }

    if (sanitized == "." || sanitized == "..") {
        return "";
    }

    if (sanitized.length() > MAX_FILENAME_LENGTH) {
        sanitized = sanitized.substr(0, MAX_FILENAME_LENGTH);
    }

    return sanitized;
}

bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir) {
    try {
        std::filesystem::path canonical_path = std::filesystem::weakly_canonical(path);
        std::filesystem::path canonical_base = std::filesystem::weakly_canonical(base_dir);

        std::string path_str = canonical_path.string();
        std::string base_str = canonical_base.string();

        if (!base_str.empty() && base_str.back() != std::filesystem::path::preferred_separator) {
            base_str += std::filesystem::path::preferred_separator;
        }

        if (path_str.find(base_str) != 0) {
            return false;
        }

        auto relative = std::filesystem::relative(canonical_path, canonical_base);
        if (!relative.empty() && relative.string().find("..") == 0) {
            return false;
        }

        return true;

    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

} // namespace config
} // namespace filemesh
