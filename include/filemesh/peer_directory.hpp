/**
 * @file peer_directory.hpp
 * @brief Authoritative view of known nodes, their reachability and files
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * PeerDirectory is the single source of truth for "who is in the network":
 * - One NodeRecord per node id, never removed
 * - Exactly one local record, created at construction
 * - Per-node dial state machine with retry bookkeeping
 * - Point-in-time snapshots for readers
 * - Thread-safe operations
 */

#pragma once

#include "filemesh/config.hpp"
#include <string>
#include <vector>
#include <set>
#include <map>
#include <mutex>
#include <chrono>
#include <optional>
#include <functional>

namespace filemesh {

/**
 * @brief Connection status of a node
 */
enum class NodeStatus {
    DISCOVERED,     ///< Known, not connected, eligible for dialing
    DIALING,        ///< Dial round in progress
    CONNECTED,      ///< Connection established (local node is always CONNECTED)
    DISCONNECTED    ///< Reserved; disconnect events return nodes to DISCOVERED
};

/**
 * @brief Convert NodeStatus to its lower-case name
 */
std::string node_status_to_string(NodeStatus status);

/**
 * @brief Everything known about one node
 */
struct NodeRecord {
    std::string id;                          ///< Stable node identifier (map key)
    std::vector<std::string> addresses;      ///< Transport addresses, most recent first
    std::set<std::string> files;             ///< Filenames this node is believed to host
    NodeStatus status = NodeStatus::DISCOVERED;
    uint64_t last_seen = 0;                  ///< Last liveness evidence (ms since epoch)
    size_t connection_attempts = 0;          ///< Failed dial rounds since last success
    uint64_t last_connection_attempt = 0;    ///< Time of last failed round (0 = never)
    std::string last_error;                  ///< Error of last failed round
    bool is_local = false;                   ///< True only for this process
};

/**
 * @brief Peer lifecycle event types consumed by PeerDirectory::apply()
 */
enum class PeerEventType {
    DISCOVERED,
    DIAL_STARTED,
    CONNECTED,
    DIAL_FAILED,
    DISCONNECTED
};

/**
 * @brief Peer lifecycle event
 */
struct PeerEvent {
    PeerEventType type;
    std::string peer_id;
    std::vector<std::string> addresses;      ///< DISCOVERED / CONNECTED only
    std::string error;                       ///< DIAL_FAILED only
};

/**
 * @brief PeerDirectory - node id -> NodeRecord
 *
 * State machine for remote nodes:
 *   DISCOVERED --dial starts--> DIALING
 *   DIALING --dial succeeds--> CONNECTED
 *   DIALING --dial fails--> DISCOVERED (suppressed for a window once the
 *                                       attempt threshold is reached)
 *   CONNECTED --disconnect--> DISCOVERED
 *
 * Unknown peer ids are logged no-ops. All accessors copy under the lock.
 */
class PeerDirectory {
public:
    /// Source of "now" in milliseconds since epoch
    using Clock = std::function<uint64_t()>;

    /**
     * @brief Construct directory holding the local node record
     * @param local_id Identifier of this process
     * @param local_addresses Addresses this process listens on
     * @param clock Time source (defaults to the system clock)
     * @param suppression_threshold Failed attempts before dials are suppressed
     * @param suppression_window How long suppression lasts
     */
    explicit PeerDirectory(
        const std::string& local_id,
        const std::vector<std::string>& local_addresses = {},
        Clock clock = nullptr,
        size_t suppression_threshold = config::DIAL_SUPPRESSION_THRESHOLD,
        std::chrono::milliseconds suppression_window = config::DIAL_SUPPRESSION_WINDOW
    );

    // Disable copy and move
    PeerDirectory(const PeerDirectory&) = delete;
    PeerDirectory& operator=(const PeerDirectory&) = delete;
    PeerDirectory(PeerDirectory&&) = delete;
    PeerDirectory& operator=(PeerDirectory&&) = delete;

    // ========================================================================
    // State Transitions
    // ========================================================================

    /**
     * @brief Record a discovery event for a peer
     *
     * Creates a DISCOVERED record if absent, otherwise merges addresses
     * (dedup, newest first) and refreshes last_seen. Idempotent.
     *
     * @param peer_id Peer identifier
     * @param addresses Addresses seen in this discovery event
     * @return true if a new record was created
     */
    bool upsert_discovered(const std::string& peer_id, const std::vector<std::string>& addresses);

    /**
     * @brief Transition DISCOVERED -> DIALING
     * @return false if unknown, local, connected or already dialing
     */
    bool mark_dialing(const std::string& peer_id);

    /**
     * @brief Transition to CONNECTED, resetting retry bookkeeping
     * @param peer_id Peer identifier
     * @param addresses Addresses of the established connection (merged first)
     * @return false if unknown or local
     */
    bool mark_connected(const std::string& peer_id, const std::vector<std::string>& addresses = {});

    /**
     * @brief Transition CONNECTED -> DISCOVERED
     * @return false if unknown, local or not connected
     */
    bool mark_disconnected(const std::string& peer_id);

    /**
     * @brief Record a failed dial round (DIALING -> DISCOVERED)
     * @param peer_id Peer identifier
     * @param error Last observed error
     * @return false if unknown or local
     */
    bool record_dial_failure(const std::string& peer_id, const std::string& error);

    /**
     * @brief Add filename to a node's file set
     * @return false if the node is unknown
     */
    bool add_file_to_node(const std::string& peer_id, const std::string& filename);

    /**
     * @brief Refresh last_seen for a known node
     * @return false if unknown
     */
    bool touch(const std::string& peer_id);

    /**
     * @brief Apply a lifecycle event (explicit transition function)
     * @param event Event to apply
     * @return Result of the underlying transition
     */
    bool apply(const PeerEvent& event);

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Check whether a new dial to the peer should be skipped
     *
     * Suppressed when the peer is unknown, local, connected, already dialing,
     * or has reached the attempt threshold within the suppression window.
     */
    bool is_dial_suppressed(const std::string& peer_id) const;

    /**
     * @brief Get a copy of one record
     */
    std::optional<NodeRecord> get(const std::string& peer_id) const;

    /**
     * @brief Copy of every record, ordered by id
     */
    std::vector<NodeRecord> snapshot() const;

    /**
     * @brief Ids of remote nodes currently CONNECTED
     */
    std::vector<std::string> connected_peer_ids() const;

    /**
     * @brief Connected remote nodes not seen within the timeout
     */
    std::vector<std::string> stale_connected_peers(std::chrono::milliseconds timeout) const;

    /**
     * @brief DISCOVERED remote nodes with addresses that may be dialled now
     */
    std::vector<NodeRecord> dial_candidates() const;

    /**
     * @brief Whether a record exists for the id
     */
    bool contains(const std::string& peer_id) const;

    /**
     * @brief Number of records (including local)
     */
    size_t size() const;

    /**
     * @brief Identifier of the local node
     */
    const std::string& local_node_id() const;

    /**
     * @brief Replace the local node's addresses (e.g., after binding)
     */
    void set_local_addresses(const std::vector<std::string>& addresses);

private:
    /// Local node id (immutable)
    const std::string local_id_;

    /// Time source
    Clock clock_;

    /// Suppression policy
    size_t suppression_threshold_;
    std::chrono::milliseconds suppression_window_;

    /// Records keyed by node id
    std::map<std::string, NodeRecord> nodes_;

    /// Mutex for thread-safe access
    mutable std::mutex mutex_;

    /**
     * @brief Find remote record or log why not (caller holds lock)
     */
    NodeRecord* find_remote(const std::string& peer_id, const char* operation);

    /**
     * @brief Merge addresses, newest first, dedup, bounded (caller holds lock)
     */
    static void merge_addresses(NodeRecord& record, const std::vector<std::string>& addresses);

    /**
     * @brief Suppression check (caller holds lock)
     */
    bool suppressed_locked(const NodeRecord& record, uint64_t now) const;
};

} // namespace filemesh
