/**
 * @file file_catalog.hpp
 * @brief Network-wide catalog of filename -> hosting peers
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Merges file-available announcements from any peer in any order:
 * - First writer sets size and origin node
 * - Hosting peers keyed by peer id, later timestamp kept per peer
 * - Idempotent and commutative
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <cstdint>

namespace filemesh {

/**
 * @brief One catalog entry, keyed by filename
 */
struct FileEntry {
    std::string filename;
    uint64_t size = 0;
    std::string origin_node_id;
    uint64_t first_announced_at = 0;
    std::map<std::string, uint64_t> hosting_peers;   ///< peer id -> announced_at (ms)
};

/**
 * @brief FileCatalog - thread-safe filename -> FileEntry map
 */
class FileCatalog {
public:
    FileCatalog() = default;
    ~FileCatalog() = default;

    // Disable copy and move
    FileCatalog(const FileCatalog&) = delete;
    FileCatalog& operator=(const FileCatalog&) = delete;
    FileCatalog(FileCatalog&&) = delete;
    FileCatalog& operator=(FileCatalog&&) = delete;

    /**
     * @brief Merge a hosting record into the catalog
     * @param filename File name (catalog key)
     * @param peer_id Peer hosting the file
     * @param size Size in bytes (used only when the entry is created)
     * @param origin_node_id Node that originally announced the file
     * @param timestamp Announcement time (ms since epoch)
     * @return true if a new entry or a new hosting peer was added
     */
    bool add_hosting_record(const std::string& filename,
                            const std::string& peer_id,
                            uint64_t size,
                            const std::string& origin_node_id,
                            uint64_t timestamp);

    /**
     * @brief Copy of all entries ordered by filename
     */
    std::vector<FileEntry> list_files() const;

    /**
     * @brief Peer ids hosting a file (empty if unknown)
     */
    std::vector<std::string> hosts_of(const std::string& filename) const;

    /**
     * @brief Check whether a peer is a known host of a file
     */
    bool is_hosted_by(const std::string& filename, const std::string& peer_id) const;

    /**
     * @brief Copy of one entry
     */
    std::optional<FileEntry> get(const std::string& filename) const;

    /**
     * @brief Number of distinct filenames
     */
    size_t size() const;

private:
    std::map<std::string, FileEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace filemesh
