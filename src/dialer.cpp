/**
 * @file dialer.cpp
 * @brief Implementation of peer dialing with retry and backoff
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/dialer.hpp"
#include "filemesh/utilities.hpp"

#include <algorithm>
#include <stdexcept>

namespace filemesh {

using namespace filemesh::utilities;

// ============================================================================
// Transport Classification
// ============================================================================

std::string transport_kind_to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::DIRECT: return "direct";
        case TransportKind::RELAYED: return "relayed";
        case TransportKind::BROWSER: return "browser";
        default: return "unknown";
    }
}

TransportKind classify_address(const std::string& address) {
    std::vector<std::string> parts = split_string(address, '/');

    bool has_tcp = false;
    bool has_relay = false;
    bool has_browser = false;

    for (const auto& part : parts) {
        if (part == "p2p-circuit" || part == "ws" || part == "wss") {
            has_relay = true;
        } else if (part == "webrtc" || part == "webrtc-direct" || part == "webtransport") {
            has_browser = true;
        } else if (part == "tcp") {
            has_tcp = true;
        }
    }

    if (has_relay) {
        return TransportKind::RELAYED;
    }
    if (has_browser) {
        return TransportKind::BROWSER;
    }
    if (has_tcp) {
        return TransportKind::DIRECT;
    }
    return TransportKind::UNKNOWN;
}

std::vector<std::pair<std::string, TransportKind>> order_by_preference(
    const std::vector<std::string>& addresses) {

    std::vector<std::pair<std::string, TransportKind>> ordered;

    for (TransportKind wanted : {TransportKind::DIRECT, TransportKind::RELAYED, TransportKind::BROWSER}) {
        for (const auto& address : addresses) {
            if (classify_address(address) == wanted) {
                ordered.emplace_back(address, wanted);
            }
        }
    }

    return ordered;
}

// ============================================================================
// TcpDialTransport
// ============================================================================

std::optional<std::pair<std::string, uint16_t>> TcpDialTransport::parse_tcp_address(
    const std::string& address) {

    // "/ip4/1.2.3.4/tcp/4001[/p2p/<id>]" -> ["", "ip4", "1.2.3.4", "tcp", "4001", ...]
    std::vector<std::string> parts = split_string(address, '/');
    if (parts.size() < 5 || !parts[0].empty()) {
        return std::nullopt;
    }

    const std::string& protocol = parts[1];
    if (protocol != "ip4" && protocol != "ip6" && protocol != "dns4" &&
        protocol != "dns6" && protocol != "dns") {
        return std::nullopt;
    }

    if (parts[2].empty() || parts[3] != "tcp" ||
        parts[4].empty() || parts[4].find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    try {
        size_t consumed = 0;
        unsigned long port = std::stoul(parts[4], &consumed);
        if (consumed != parts[4].size() || port == 0 || port > 65535) {
            return std::nullopt;
        }
        return std::make_pair(parts[2], static_cast<uint16_t>(port));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

DialAttemptResult TcpDialTransport::dial(const std::string& peer_id,
                                         const std::string& address,
                                         TransportKind kind,
                                         std::chrono::milliseconds timeout) {
    DialAttemptResult result;

    if (kind != TransportKind::DIRECT) {
        result.error = transport_kind_to_string(kind) + " transport not supported";
        return result;
    }

    auto target = parse_tcp_address(address);
    if (!target) {
        result.error = "unparseable address " + address;
        return result;
    }

    const auto& [host, port] = *target;

    try {
        asio::io_context io;
        asio::ip::tcp::resolver resolver(io);
        asio::ip::tcp::socket socket(io);
        asio::error_code outcome = asio::error::would_block;

        resolver.async_resolve(host, std::to_string(port),
            [&](const asio::error_code& error, asio::ip::tcp::resolver::results_type endpoints) {
                if (error) {
                    outcome = error;
                    return;
                }
                asio::async_connect(socket, endpoints,
                    [&](const asio::error_code& connect_error, const asio::ip::tcp::endpoint&) {
                        outcome = connect_error;
                    });
            });

        io.run_for(timeout);

        if (outcome == asio::error::would_block) {
            // Timed out: abort outstanding operations and drain their handlers
            resolver.cancel();
            asio::error_code ignored;
            socket.close(ignored);
            io.restart();
            io.run();
            result.error = "timed out after " + std::to_string(timeout.count()) + "ms";
            return result;
        }

        if (outcome) {
            result.error = outcome.message();
            return result;
        }

        log_debug("TcpDialTransport: Reached " + peer_id + " at " + host + ":" + std::to_string(port));

        asio::error_code ignored;
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);

        result.success = true;
        return result;

    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }
}

// ============================================================================
// Dial Policy
// ============================================================================

std::chrono::milliseconds compute_backoff_delay(size_t round,
                                                std::chrono::milliseconds jitter,
                                                const DialPolicy& policy) {
    const int64_t cap = policy.backoff_cap.count();
    const int64_t base = policy.backoff_base.count();

    // Past 2^20 every realistic base is over the cap
    int64_t exponential = cap;
    if (round < 20) {
        exponential = base * (int64_t{1} << round);
    }

    int64_t delay = exponential + std::max<int64_t>(jitter.count(), 0);
    return std::chrono::milliseconds(std::min(delay, cap));
}

std::string dial_outcome_to_string(DialOutcome outcome) {
    switch (outcome) {
        case DialOutcome::CONNECTED: return "CONNECTED";
        case DialOutcome::FAILED: return "FAILED";
        case DialOutcome::SUPPRESSED: return "SUPPRESSED";
        case DialOutcome::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Dialer - Constructor and Destructor
// ============================================================================

Dialer::Dialer(PeerDirectory& directory,
               std::shared_ptr<DialTransport> transport,
               DialPolicy policy,
               size_t max_concurrent)
    : directory_(directory)
    , transport_(std::move(transport))
    , policy_(policy)
    , pool_(max_concurrent == 0 ? 1 : max_concurrent)
    , shutdown_(false)
    , rng_(std::random_device{}())
{
    if (!transport_) {
        throw std::invalid_argument("Dialer: transport cannot be null");
    }
}

Dialer::~Dialer() {
    shutdown();
}

// ============================================================================
// Dialing
// ============================================================================

DialReport Dialer::attempt_connect(const std::string& peer_id,
                                   const std::vector<std::string>& candidate_addresses,
                                   size_t max_retries) {
    DialReport report;
    report.peer_id = peer_id;

    if (shutdown_) {
        report.outcome = DialOutcome::CANCELLED;
        return report;
    }

    if (!try_claim(peer_id)) {
        log_debug("Dialer: Dial to " + peer_id + " already in progress");
        report.outcome = DialOutcome::SUPPRESSED;
        report.error = "dial already in progress";
        return report;
    }

    report = run_rounds(peer_id, candidate_addresses, max_retries);
    release(peer_id);
    return report;
}

bool Dialer::dial_async(const std::string& peer_id,
                        const std::vector<std::string>& candidate_addresses,
                        size_t max_retries,
                        CompletionCallback on_complete) {
    if (shutdown_) {
        return false;
    }

    if (!try_claim(peer_id)) {
        return false;
    }

    asio::post(pool_, [this, peer_id, candidate_addresses, max_retries, on_complete]() {
        DialReport report = run_rounds(peer_id, candidate_addresses, max_retries);
        release(peer_id);

        if (on_complete) {
            try {
                on_complete(report);
            } catch (const std::exception& e) {
                log_error("Dialer: Completion callback failed: " + std::string(e.what()));
            }
        }
    });

    return true;
}

DialReport Dialer::run_rounds(const std::string& peer_id,
                              const std::vector<std::string>& candidate_addresses,
                              size_t max_retries) {
    DialReport report;
    report.peer_id = peer_id;

    if (max_retries == 0) {
        max_retries = 1;
    }

    if (directory_.is_dial_suppressed(peer_id)) {
        auto record = directory_.get(peer_id);
        report.outcome = DialOutcome::SUPPRESSED;
        report.error = record ? "peer is " + node_status_to_string(record->status) + " or in backoff window"
                              : "unknown peer";
        return report;
    }

    auto ordered = order_by_preference(candidate_addresses);
    if (ordered.empty()) {
        report.outcome = DialOutcome::FAILED;
        report.error = "no dialable addresses";
        directory_.record_dial_failure(peer_id, report.error);
        return report;
    }

    for (size_t round = 0; round < max_retries; ++round) {
        if (shutdown_) {
            report.outcome = DialOutcome::CANCELLED;
            return report;
        }

        if (!directory_.mark_dialing(peer_id)) {
            // Connected by another path (e.g., inbound) or removed from eligibility
            auto record = directory_.get(peer_id);
            bool connected = record && record->status == NodeStatus::CONNECTED;
            report.outcome = connected ? DialOutcome::CONNECTED : DialOutcome::SUPPRESSED;
            return report;
        }

        report.rounds = round + 1;

        for (const auto& [address, kind] : ordered) {
            if (shutdown_) {
                break;
            }

            DialAttemptResult attempt;
            try {
                attempt = transport_->dial(peer_id, address, kind, policy_.attempt_timeout);
            } catch (const std::exception& e) {
                attempt.success = false;
                attempt.error = e.what();
            }

            if (attempt.success) {
                directory_.mark_connected(peer_id, {address});
                report.outcome = DialOutcome::CONNECTED;
                report.address = address;
                report.error.clear();
                log_info("Dialer: Connected to " + peer_id + " via " +
                         transport_kind_to_string(kind) + " " + address);
                return report;
            }

            report.error = attempt.error;
            log_debug("Dialer: " + peer_id + " " + address + " failed: " + attempt.error);
        }

        directory_.record_dial_failure(peer_id, report.error);

        if (shutdown_) {
            report.outcome = DialOutcome::CANCELLED;
            return report;
        }

        if (round + 1 < max_retries) {
            auto delay = compute_backoff_delay(round, draw_jitter(), policy_);
            log_debug("Dialer: Retrying " + peer_id + " in " + std::to_string(delay.count()) + "ms");

            if (!wait_backoff(delay)) {
                report.outcome = DialOutcome::CANCELLED;
                return report;
            }
        }
    }

    report.outcome = DialOutcome::FAILED;
    log_warn("Dialer: Giving up on " + peer_id + " after " + std::to_string(report.rounds) +
             " rounds: " + report.error);
    return report;
}

// ============================================================================
// Lifecycle
// ============================================================================

void Dialer::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();

    pool_.join();
    log_debug("Dialer: Shut down");
}

bool Dialer::is_shut_down() const {
    return shutdown_;
}

size_t Dialer::in_flight_count() const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.size();
}

// ============================================================================
// Private Methods
// ============================================================================

bool Dialer::try_claim(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.insert(peer_id).second;
}

void Dialer::release(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(peer_id);
}

std::chrono::milliseconds Dialer::draw_jitter() {
    if (policy_.max_jitter.count() <= 0) {
        return std::chrono::milliseconds(0);
    }

    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<int64_t> distribution(0, policy_.max_jitter.count());
    return std::chrono::milliseconds(distribution(rng_));
}

bool Dialer::wait_backoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return !wait_cv_.wait_for(lock, delay, [this]() { return shutdown_.load(); });
}

} // namespace filemesh
