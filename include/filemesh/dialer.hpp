/**
 * @file dialer.hpp
 * @brief Peer dialing with transport preference and bounded retry/backoff
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Dial policy:
 * - Addresses classified by transport hint (direct, relayed, browser)
 * - Attempted in preference order direct -> relayed -> browser
 * - Exponential backoff with jitter between rounds, capped
 * - One dial per peer at a time, bounded worker pool across peers
 * - Per-attempt timeout and cooperative cancellation
 */

#pragma once

#include "filemesh/config.hpp"
#include "filemesh/peer_directory.hpp"

#include <asio.hpp>

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <random>
#include <optional>
#include <functional>
#include <condition_variable>

namespace filemesh {

// ============================================================================
// Transport Classification
// ============================================================================

/**
 * @brief Transport class derived from an address hint
 */
enum class TransportKind {
    DIRECT,     ///< Plain stream (/tcp/)
    RELAYED,    ///< Relay or websocket (/p2p-circuit, /ws, /wss)
    BROWSER,    ///< Browser-peer stream (/webrtc, /webrtc-direct, /webtransport)
    UNKNOWN     ///< No recognised hint, never dialled
};

/**
 * @brief Convert TransportKind to string
 */
std::string transport_kind_to_string(TransportKind kind);

/**
 * @brief Classify a multiaddr-style address by its transport hint
 * @param address Address such as "/ip4/10.0.0.2/tcp/4001"
 * @return Transport class (UNKNOWN if no hint matches)
 */
TransportKind classify_address(const std::string& address);

/**
 * @brief Order addresses for dialing, dropping unrecognised ones
 *
 * Stable within a class: direct first, relayed second, browser last.
 */
std::vector<std::pair<std::string, TransportKind>> order_by_preference(
    const std::vector<std::string>& addresses);

// ============================================================================
// Transport Seam
// ============================================================================

/**
 * @brief Result of one connect attempt
 */
struct DialAttemptResult {
    bool success = false;
    std::string error;
};

/**
 * @brief DialTransport - performs one connect attempt to one address
 *
 * Implementations must return within the given timeout.
 */
class DialTransport {
public:
    virtual ~DialTransport() = default;

    virtual DialAttemptResult dial(const std::string& peer_id,
                                   const std::string& address,
                                   TransportKind kind,
                                   std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief TcpDialTransport - direct-stream dials as TCP connects
 *
 * Handles /ip4|ip6|dns4|dns6|dns/<host>/tcp/<port>. Relayed and browser
 * classes need an external stack and are reported as unsupported.
 */
class TcpDialTransport : public DialTransport {
public:
    DialAttemptResult dial(const std::string& peer_id,
                           const std::string& address,
                           TransportKind kind,
                           std::chrono::milliseconds timeout) override;

    /**
     * @brief Extract host and port from a TCP multiaddr
     * @return (host, port) or nullopt if the address is not host/tcp/port
     */
    static std::optional<std::pair<std::string, uint16_t>> parse_tcp_address(const std::string& address);
};

// ============================================================================
// Dial Policy
// ============================================================================

/**
 * @brief Backoff and timeout parameters
 */
struct DialPolicy {
    std::chrono::milliseconds backoff_base = config::DIAL_BACKOFF_BASE;
    std::chrono::milliseconds backoff_cap = config::DIAL_BACKOFF_CAP;
    std::chrono::milliseconds max_jitter = config::DIAL_BACKOFF_MAX_JITTER;
    std::chrono::milliseconds attempt_timeout = config::DIAL_ATTEMPT_TIMEOUT;
};

/**
 * @brief Delay before the round after a failed one
 * @param round Zero-based index of the round that failed
 * @param jitter Random component (already drawn)
 * @param policy Backoff parameters
 * @return min(base * 2^round + jitter, cap)
 */
std::chrono::milliseconds compute_backoff_delay(size_t round,
                                                std::chrono::milliseconds jitter,
                                                const DialPolicy& policy);

/**
 * @brief Final outcome of a dial call
 */
enum class DialOutcome {
    CONNECTED,
    FAILED,
    SUPPRESSED,     ///< Already dialing, connected, unknown or in backoff window
    CANCELLED       ///< Dialer shut down
};

/**
 * @brief Convert DialOutcome to string
 */
std::string dial_outcome_to_string(DialOutcome outcome);

/**
 * @brief Report of a dial call
 */
struct DialReport {
    DialOutcome outcome = DialOutcome::FAILED;
    std::string peer_id;
    std::string address;     ///< Address that connected
    std::string error;       ///< Last observed error
    size_t rounds = 0;       ///< Rounds actually performed
};

// ============================================================================
// Dialer
// ============================================================================

/**
 * @brief Dialer - connects to discovered peers and reports to PeerDirectory
 */
class Dialer {
public:
    using CompletionCallback = std::function<void(const DialReport&)>;

    /**
     * @brief Construct dialer
     * @param directory Directory receiving state transitions
     * @param transport Transport used for each attempt
     * @param policy Backoff and timeout parameters
     * @param max_concurrent Worker threads for dial_async()
     */
    Dialer(PeerDirectory& directory,
           std::shared_ptr<DialTransport> transport,
           DialPolicy policy = DialPolicy(),
           size_t max_concurrent = config::MAX_CONCURRENT_DIALS);

    ~Dialer();

    // Disable copy and move
    Dialer(const Dialer&) = delete;
    Dialer& operator=(const Dialer&) = delete;
    Dialer(Dialer&&) = delete;
    Dialer& operator=(Dialer&&) = delete;

    /**
     * @brief Dial a peer, blocking until connected, exhausted or cancelled
     *
     * Each round tries every dialable address once. A failed round is
     * recorded on the node and followed by a backoff wait unless it was
     * the last round.
     *
     * @param peer_id Peer to dial (must already be in the directory)
     * @param candidate_addresses Addresses to try
     * @param max_retries Number of rounds (0 is treated as 1)
     * @return Dial report
     */
    DialReport attempt_connect(const std::string& peer_id,
                               const std::vector<std::string>& candidate_addresses,
                               size_t max_retries = config::MAX_DIAL_RETRIES);

    /**
     * @brief Queue attempt_connect() on the worker pool
     * @param on_complete Invoked on a worker thread with the report
     * @return false if the dialer is shut down or the peer is already queued
     */
    bool dial_async(const std::string& peer_id,
                    const std::vector<std::string>& candidate_addresses,
                    size_t max_retries = config::MAX_DIAL_RETRIES,
                    CompletionCallback on_complete = nullptr);

    /**
     * @brief Cancel pending dials and join workers (idempotent)
     */
    void shutdown();

    /**
     * @brief Check whether shutdown() was called
     */
    bool is_shut_down() const;

    /**
     * @brief Number of peers with a dial queued or running
     */
    size_t in_flight_count() const;

private:
    PeerDirectory& directory_;
    std::shared_ptr<DialTransport> transport_;
    DialPolicy policy_;

    /// Worker pool for dial_async()
    asio::thread_pool pool_;

    /// Peers with a dial queued or running
    std::set<std::string> in_flight_;
    mutable std::mutex in_flight_mutex_;

    /// Backoff waits wake on shutdown
    std::atomic<bool> shutdown_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    /// Jitter source
    std::mt19937_64 rng_;
    std::mutex rng_mutex_;

    /**
     * @brief Claim the in-flight slot for a peer
     */
    bool try_claim(const std::string& peer_id);

    /**
     * @brief Release the in-flight slot for a peer
     */
    void release(const std::string& peer_id);

    /**
     * @brief Run the dial rounds (caller holds the in-flight slot)
     */
    DialReport run_rounds(const std::string& peer_id,
                          const std::vector<std::string>& candidate_addresses,
                          size_t max_retries);

    /**
     * @brief Draw jitter uniformly from [0, max_jitter]
     */
    std::chrono::milliseconds draw_jitter();

    /**
     * @brief Sleep for delay unless shutdown() is called
     * @return false if woken by shutdown
     */
    bool wait_backoff(std::chrono::milliseconds delay);
};

} // namespace filemesh
