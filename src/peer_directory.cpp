/**
 * @file peer_directory.cpp
 * @brief Implementation of the peer directory and its state machine
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/peer_directory.hpp"
#include "filemesh/utilities.hpp"
#include <algorithm>
#include <stdexcept>

namespace filemesh {

using namespace filemesh::utilities;

std::string node_status_to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::DISCOVERED: return "discovered";
        case NodeStatus::DIALING: return "dialing";
        case NodeStatus::CONNECTED: return "connected";
        case NodeStatus::DISCONNECTED: return "disconnected";
        default: return "unknown";
    }
}

// ============================================================================
// Constructor
// ============================================================================

PeerDirectory::PeerDirectory(
    const std::string& local_id,
    const std::vector<std::string>& local_addresses,
    Clock clock,
    size_t suppression_threshold,
    std::chrono::milliseconds suppression_window
)
    : local_id_(local_id)
    , clock_(clock ? std::move(clock) : Clock(&current_time_ms))
    , suppression_threshold_(suppression_threshold)
    , suppression_window_(suppression_window)
{
    if (local_id_.empty()) {
        throw std::invalid_argument("PeerDirectory: local node id cannot be empty");
    }

    NodeRecord local;
    local.id = local_id_;
    local.addresses = local_addresses;
    local.status = NodeStatus::CONNECTED;
    local.last_seen = clock_();
    local.is_local = true;

    nodes_.emplace(local_id_, std::move(local));
}

// ============================================================================
// State Transitions
// ============================================================================

bool PeerDirectory::upsert_discovered(const std::string& peer_id, const std::vector<std::string>& addresses) {
    if (peer_id.empty()) {
        log_warn("PeerDirectory: Ignoring discovery with empty peer id");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (peer_id == local_id_) {
        return false;
    }

    auto it = nodes_.find(peer_id);
    if (it != nodes_.end()) {
        merge_addresses(it->second, addresses);
        it->second.last_seen = clock_();
        return false;
    }

    NodeRecord record;
    record.id = peer_id;
    record.status = NodeStatus::DISCOVERED;
    record.last_seen = clock_();
    merge_addresses(record, addresses);

    nodes_.emplace(peer_id, std::move(record));
    log_info("PeerDirectory: Discovered peer " + peer_id);
    return true;
}

bool PeerDirectory::mark_dialing(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    NodeRecord* record = find_remote(peer_id, "mark_dialing");
    if (!record) {
        return false;
    }

    if (record->status == NodeStatus::DIALING || record->status == NodeStatus::CONNECTED) {
        log_debug("PeerDirectory: " + peer_id + " is " + node_status_to_string(record->status) +
                  ", not dialing");
        return false;
    }

    // Suppression window elapsed: start counting afresh
    if (record->connection_attempts >= suppression_threshold_ && !suppressed_locked(*record, clock_())) {
        record->connection_attempts = 0;
    }

    record->status = NodeStatus::DIALING;
    return true;
}

bool PeerDirectory::mark_connected(const std::string& peer_id, const std::vector<std::string>& addresses) {
    std::lock_guard<std::mutex> lock(mutex_);

    NodeRecord* record = find_remote(peer_id, "mark_connected");
    if (!record) {
        return false;
    }

    merge_addresses(*record, addresses);
    record->status = NodeStatus::CONNECTED;
    record->last_seen = clock_();
    record->connection_attempts = 0;
    record->last_connection_attempt = 0;
    record->last_error.clear();

    log_info("PeerDirectory: Connected to peer " + peer_id);
    return true;
}

bool PeerDirectory::mark_disconnected(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    NodeRecord* record = find_remote(peer_id, "mark_disconnected");
    if (!record) {
        return false;
    }

    if (record->status != NodeStatus::CONNECTED) {
        log_debug("PeerDirectory: Disconnect for " + peer_id + " while " +
                  node_status_to_string(record->status) + ", ignored");
        return false;
    }

    record->status = NodeStatus::DISCOVERED;
    log_info("PeerDirectory: Peer disconnected: " + peer_id);
    return true;
}

bool PeerDirectory::record_dial_failure(const std::string& peer_id, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    NodeRecord* record = find_remote(peer_id, "record_dial_failure");
    if (!record) {
        return false;
    }

    record->connection_attempts++;
    record->last_connection_attempt = clock_();
    record->last_error = error;

    if (record->status == NodeStatus::DIALING) {
        record->status = NodeStatus::DISCOVERED;
    }

    log_warn("PeerDirectory: Dial to " + peer_id + " failed (attempt " +
             std::to_string(record->connection_attempts) + "): " + error);
    return true;
}

bool PeerDirectory::add_file_to_node(const std::string& peer_id, const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = nodes_.find(peer_id);
    if (it == nodes_.end()) {
        log_debug("PeerDirectory: add_file_to_node for unknown peer " + peer_id);
        return false;
    }

    it->second.files.insert(filename);
    return true;
}

bool PeerDirectory::touch(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = nodes_.find(peer_id);
    if (it == nodes_.end()) {
        return false;
    }

    it->second.last_seen = clock_();
    return true;
}

bool PeerDirectory::apply(const PeerEvent& event) {
    switch (event.type) {
        case PeerEventType::DISCOVERED:
            upsert_discovered(event.peer_id, event.addresses);
            return contains(event.peer_id);
        case PeerEventType::DIAL_STARTED:
            return mark_dialing(event.peer_id);
        case PeerEventType::CONNECTED:
            return mark_connected(event.peer_id, event.addresses);
        case PeerEventType::DIAL_FAILED:
            return record_dial_failure(event.peer_id, event.error);
        case PeerEventType::DISCONNECTED:
            return mark_disconnected(event.peer_id);
        default:
            log_warn("PeerDirectory: Unknown event type");
            return false;
    }
}

// ============================================================================
// Queries
// ============================================================================

bool PeerDirectory::is_dial_suppressed(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = nodes_.find(peer_id);
    if (it == nodes_.end() || it->second.is_local) {
        return true;
    }

    const NodeRecord& record = it->second;
    if (record.status == NodeStatus::DIALING || record.status == NodeStatus::CONNECTED) {
        return true;
    }

    return suppressed_locked(record, clock_());
}

std::optional<NodeRecord> PeerDirectory::get(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = nodes_.find(peer_id);
    if (it != nodes_.end()) {
        return it->second;
    }

    return std::nullopt;
}

std::vector<NodeRecord> PeerDirectory::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<NodeRecord> result;
    result.reserve(nodes_.size());

    for (const auto& [id, record] : nodes_) {
        result.push_back(record);
    }

    return result;
}

std::vector<std::string> PeerDirectory::connected_peer_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> result;
    for (const auto& [id, record] : nodes_) {
        if (!record.is_local && record.status == NodeStatus::CONNECTED) {
            result.push_back(id);
        }
    }

    return result;
}

std::vector<std::string> PeerDirectory::stale_connected_peers(std::chrono::milliseconds timeout) const {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_();
    uint64_t limit = static_cast<uint64_t>(timeout.count());

    std::vector<std::string> result;
    for (const auto& [id, record] : nodes_) {
        if (record.is_local || record.status != NodeStatus::CONNECTED) {
            continue;
        }
        if (now > record.last_seen && now - record.last_seen > limit) {
            result.push_back(id);
        }
    }

    return result;
}

std::vector<NodeRecord> PeerDirectory::dial_candidates() const {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_();

    std::vector<NodeRecord> result;
    for (const auto& [id, record] : nodes_) {
        if (record.is_local || record.status != NodeStatus::DISCOVERED || record.addresses.empty()) {
            continue;
        }
        if (!suppressed_locked(record, now)) {
            result.push_back(record);
        }
    }

    return result;
}

bool PeerDirectory::contains(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.find(peer_id) != nodes_.end();
}

size_t PeerDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}

const std::string& PeerDirectory::local_node_id() const {
    return local_id_;
}

void PeerDirectory::set_local_addresses(const std::vector<std::string>& addresses) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& local = nodes_.at(local_id_);
    local.addresses = addresses;
    local.last_seen = clock_();
}

// ============================================================================
// Private Methods
// ============================================================================

NodeRecord* PeerDirectory::find_remote(const std::string& peer_id, const char* operation) {
    auto it = nodes_.find(peer_id);
    if (it == nodes_.end()) {
        log_warn(std::string("PeerDirectory: ") + operation + " for unknown peer " + peer_id);
        return nullptr;
    }

    if (it->second.is_local) {
        log_warn(std::string("PeerDirectory: ") + operation + " ignored for local node");
        return nullptr;
    }

    return &it->second;
}

void PeerDirectory::merge_addresses(NodeRecord& record, const std::vector<std::string>& addresses) {
    if (addresses.empty()) {
        return;
    }

    std::vector<std::string> merged;
    merged.reserve(addresses.size() + record.addresses.size());

    for (const auto& address : addresses) {
        if (!address.empty() && std::find(merged.begin(), merged.end(), address) == merged.end()) {
            merged.push_back(address);
        }
    }

    for (const auto& address : record.addresses) {
        if (std::find(merged.begin(), merged.end(), address) == merged.end()) {
            merged.push_back(address);
        }
    }

    if (merged.size() > config::MAX_ADDRESSES_PER_NODE) {
        merged.resize(config::MAX_ADDRESSES_PER_NODE);
    }

    record.addresses = std::move(merged);
}

bool PeerDirectory::suppressed_locked(const NodeRecord& record, uint64_t now) const {
    if (record.connection_attempts < suppression_threshold_) {
        return false;
    }

    uint64_t window = static_cast<uint64_t>(suppression_window_.count());
    return now < record.last_connection_attempt + window;
}

} // namespace filemesh
