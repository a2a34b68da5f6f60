/**
 * @file config.hpp
 * @brief Limits, defaults and input validation for FileMesh nodes
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <vector>
#include <filesystem>

namespace filemesh {
namespace config {

// ============================================================================
// Size Limits
// ============================================================================

/// Maximum upload accepted by POST /share (50MB)
constexpr size_t MAX_UPLOAD_SIZE = 50 * 1024 * 1024;

/// Maximum HTTP request header block
constexpr size_t MAX_HTTP_HEADER_SIZE = 16 * 1024;

/// Maximum announcement payload (64KB); anything larger is malformed
constexpr size_t MAX_ANNOUNCEMENT_SIZE = 64 * 1024;

/// Maximum identifier length (node ID)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// Maximum filename length
constexpr size_t MAX_FILENAME_LENGTH = 255;

/// Maximum addresses remembered per node
constexpr size_t MAX_ADDRESSES_PER_NODE = 16;

// ============================================================================
// Dialing
// ============================================================================

/// Backoff base delay (round 0)
constexpr auto DIAL_BACKOFF_BASE = std::chrono::milliseconds(1000);

/// Upper bound for any single backoff delay
constexpr auto DIAL_BACKOFF_CAP = std::chrono::milliseconds(30000);

/// Maximum random jitter added to a backoff delay
constexpr auto DIAL_BACKOFF_MAX_JITTER = std::chrono::milliseconds(1000);

/// Timeout of one connect attempt to one address
constexpr auto DIAL_ATTEMPT_TIMEOUT = std::chrono::seconds(10);

/// Retry rounds per dial
constexpr size_t MAX_DIAL_RETRIES = 5;

/// Concurrent dials across all peers
constexpr size_t MAX_CONCURRENT_DIALS = 8;

/// Failed attempts after which a peer enters the suppression window
constexpr size_t DIAL_SUPPRESSION_THRESHOLD = 10;

/// How long dials to a peer stay suppressed once the threshold is hit
constexpr auto DIAL_SUPPRESSION_WINDOW = std::chrono::minutes(5);

// ============================================================================
// Overlay and Liveness
// ============================================================================

/// UDP port for LAN presence beacons and pubsub envelopes
constexpr uint16_t BEACON_PORT = 10001;

/// Presence beacon interval
constexpr auto ANNOUNCE_INTERVAL = std::chrono::seconds(10);

/// Connected peers silent for longer than this are reported disconnected
constexpr auto PEER_LIVENESS_TIMEOUT = std::chrono::seconds(60);

/// Maintenance loop interval
constexpr auto MAINTENANCE_INTERVAL = std::chrono::seconds(30);

/// Maximum UDP datagram (to avoid fragmentation)
constexpr size_t MAX_UDP_PACKET_SIZE = 65000;

/// Pubsub topic carrying file announcements
constexpr const char* FILE_SHARE_TOPIC = "file-share";

/// Pubsub topic used for peer discovery
constexpr const char* PEER_DISCOVERY_TOPIC = "browser-peer-discovery";

// ============================================================================
// Inbound Announcement Throttle
// ============================================================================

/// Announcements per second per peer (sustained rate)
constexpr double ANNOUNCE_RATE_PER_SECOND = 20.0;

/// Burst capacity per peer
constexpr double ANNOUNCE_RATE_BURST = 50.0;

/// Idle buckets older than this are pruned
constexpr auto RATE_LIMITER_IDLE = std::chrono::minutes(5);

// ============================================================================
// HTTP Boundary
// ============================================================================

/// Default HTTP port (overridden by PORT env var or --port)
constexpr uint16_t DEFAULT_HTTP_PORT = 3000;

/// Socket read timeout for one HTTP request
constexpr auto HTTP_READ_TIMEOUT = std::chrono::seconds(30);

// ============================================================================
// Runtime Configuration
// ============================================================================

/**
 * @brief Runtime settings assembled from defaults, environment and CLI
 */
struct NodeConfig {
    uint16_t http_port = DEFAULT_HTTP_PORT;          ///< HTTP listen port
    uint16_t beacon_port = BEACON_PORT;              ///< LAN overlay UDP port
    std::filesystem::path data_dir;                  ///< Root data directory
    std::string log_level = "info";                  ///< Log level name
    std::string log_file;                            ///< Optional log file
    std::vector<std::string> bootstrap_addresses;    ///< Bootstrap multiaddrs
    size_t max_dial_retries = MAX_DIAL_RETRIES;      ///< Retry rounds per dial

    /**
     * @brief Build configuration from environment variables
     *
     * Reads PORT, FILEMESH_DATA_DIR, FILEMESH_LOG_LEVEL, FILEMESH_LOG_FILE and
     * FILEMESH_BOOTSTRAP (comma separated).
     */
    static NodeConfig from_environment();

    /**
     * @brief Apply command line flags on top of this configuration
     * @param args Arguments without the program name
     * @param error Set to a description when parsing fails
     * @return true if all flags were understood
     */
    bool apply_arguments(const std::vector<std::string>& args, std::string& error);
};

// ============================================================================
// Directories
// ============================================================================

/**
 * @brief Get FileMesh data directory from environment or use default
 * @return Filesystem path to data directory (created if missing)
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get shared files directory under a data directory
 * @param data_dir Root data directory
 * @return Path to shared/ (created if missing)
 */
std::filesystem::path get_shared_directory(const std::filesystem::path& data_dir);

/**
 * @brief Get key directory under a data directory
 * @param data_dir Root data directory
 * @return Path to keys/ (created if missing)
 */
std::filesystem::path get_keys_directory(const std::filesystem::path& data_dir);

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric + underscore/hyphen only)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Sanitize filename to prevent path traversal
 *
 * Strips directory separators and NUL bytes, trims whitespace, replaces
 * characters that are unsafe on common filesystems and refuses the "." and
 * ".." names.
 *
 * @param filename User-provided filename
 * @return Sanitized filename, or empty string if nothing usable remains
 */
std::string sanitize_filename(const std::string& filename);

/**
 * @brief Check if path is safe (no traversal, within allowed directory)
 * @param path Path to validate
 * @param base_dir Base directory that path must be within
 * @return true if safe, false if path traversal detected
 */
bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);

} // namespace config
} // namespace filemesh
