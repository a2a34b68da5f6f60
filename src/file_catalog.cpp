/**
 * @file file_catalog.cpp
 * @brief Implementation of the file catalog merge rules
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/file_catalog.hpp"
#include "filemesh/utilities.hpp"

namespace filemesh {

using namespace filemesh::utilities;

bool FileCatalog::add_hosting_record(const std::string& filename,
                                     const std::string& peer_id,
                                     uint64_t size,
                                     const std::string& origin_node_id,
                                     uint64_t timestamp) {
    if (filename.empty() || peer_id.empty()) {
        log_warn("FileCatalog: Ignoring hosting record with empty filename or peer id");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto [it, created] = entries_.try_emplace(filename);
    FileEntry& entry = it->second;

    if (created) {
        entry.filename = filename;
        entry.size = size;
        entry.origin_node_id = origin_node_id;
        entry.first_announced_at = timestamp;
        log_info("FileCatalog: New file " + filename + " (" + format_file_size(size) +
                 ") from " + origin_node_id);
    } else if (entry.size != size || entry.origin_node_id != origin_node_id) {
        log_debug("FileCatalog: " + filename + " re-announced with different metadata by " +
                  peer_id + ", keeping first");
    }

    auto peer_it = entry.hosting_peers.find(peer_id);
    if (peer_it == entry.hosting_peers.end()) {
        entry.hosting_peers.emplace(peer_id, timestamp);
        return true;
    }

    // Later timestamp wins, so arrival order does not matter
    if (timestamp > peer_it->second) {
        peer_it->second = timestamp;
    }

    return created;
}

std::vector<FileEntry> FileCatalog::list_files() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<FileEntry> result;
    result.reserve(entries_.size());

    for (const auto& [name, entry] : entries_) {
        result.push_back(entry);
    }

    return result;
}

std::vector<std::string> FileCatalog::hosts_of(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;

    auto it = entries_.find(filename);
    if (it == entries_.end()) {
        return result;
    }

    for (const auto& [peer_id, announced_at] : it->second.hosting_peers) {
        result.push_back(peer_id);
    }

    return result;
}

bool FileCatalog::is_hosted_by(const std::string& filename, const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(filename);
    if (it == entries_.end()) {
        return false;
    }

    return it->second.hosting_peers.count(peer_id) > 0;
}

std::optional<FileEntry> FileCatalog::get(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(filename);
    if (it != entries_.end()) {
        return it->second;
    }

    return std::nullopt;
}

size_t FileCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace filemesh
