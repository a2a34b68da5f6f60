/**
 * @file lan_overlay.cpp
 * @brief Implementation of the UDP broadcast overlay
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/lan_overlay.hpp"
#include "filemesh/utilities.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace filemesh {

using namespace filemesh::utilities;

// ============================================================================
// OverlayEnvelope
// ============================================================================

std::string OverlayEnvelope::to_json() const {
    json j;
    j["from"] = from;

    if (kind == EnvelopeKind::BEACON) {
        j["kind"] = "beacon";
        j["addresses"] = addresses;
    } else {
        j["kind"] = "pubsub";
        j["topic"] = topic;
        j["data"] = data;
    }

    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<OverlayEnvelope> OverlayEnvelope::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object() || !j.contains("kind") || !j.contains("from") ||
            !j["kind"].is_string() || !j["from"].is_string()) {
            return std::nullopt;
        }

        OverlayEnvelope envelope;
        envelope.from = j["from"].get<std::string>();

        std::string kind = j["kind"].get<std::string>();
        if (kind == "beacon") {
            envelope.kind = EnvelopeKind::BEACON;
            if (j.contains("addresses")) {
                if (!j["addresses"].is_array()) {
                    return std::nullopt;
                }
                for (const auto& address : j["addresses"]) {
                    if (!address.is_string()) {
                        return std::nullopt;
                    }
                    envelope.addresses.push_back(address.get<std::string>());
                }
            }
        } else if (kind == "pubsub") {
            envelope.kind = EnvelopeKind::PUBSUB;
            if (!j.contains("topic") || !j["topic"].is_string() ||
                !j.contains("data") || !j["data"].is_string()) {
                return std::nullopt;
            }
            envelope.topic = j["topic"].get<std::string>();
            envelope.data = j["data"].get<std::string>();
        } else {
            return std::nullopt;
        }

        return envelope;

    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

LanOverlay::LanOverlay(std::string local_node_id, asio::io_context& io_context, uint16_t port)
    : local_node_id_(std::move(local_node_id))
    , port_(port)
    , socket_(io_context)
    , broadcast_endpoint_(asio::ip::address_v4::broadcast(), port)
    , running_(false)
    , messages_sent_(0)
    , messages_received_(0)
{
    if (local_node_id_.empty()) {
        throw std::invalid_argument("LanOverlay: local node id cannot be empty");
    }
}

LanOverlay::~LanOverlay() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool LanOverlay::start() {
    if (running_.load()) {
        return true;
    }

    try {
        socket_.open(asio::ip::udp::v4());
        socket_.set_option(asio::socket_base::broadcast(true));
        socket_.set_option(asio::socket_base::reuse_address(true));
        socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), port_));

        running_.store(true);
        start_receive();

        log_info("LanOverlay: Listening on UDP port " + std::to_string(port_));
        return true;

    } catch (const std::exception& e) {
        log_error("LanOverlay: Failed to start: " + std::string(e.what()));
        asio::error_code ignored;
        socket_.close(ignored);
        running_.store(false);
        return false;
    }
}

void LanOverlay::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::error_code ec;
    socket_.close(ec);
    if (ec) {
        log_warn("LanOverlay: Error closing socket: " + ec.message());
    }
    log_info("LanOverlay: Stopped");
}

bool LanOverlay::is_running() const {
    return running_.load();
}

// ============================================================================
// Sending
// ============================================================================

bool LanOverlay::announce_presence(const std::vector<std::string>& addresses) {
    OverlayEnvelope envelope;
    envelope.kind = EnvelopeKind::BEACON;
    envelope.from = local_node_id_;
    envelope.addresses = addresses;

    bool sent = send_broadcast(envelope.to_json());
    if (sent) {
        log_debug("LanOverlay: Announced presence");
    }
    return sent;
}

bool LanOverlay::publish(const std::string& topic, const std::string& payload) {
    OverlayEnvelope envelope;
    envelope.kind = EnvelopeKind::PUBSUB;
    envelope.from = local_node_id_;
    envelope.topic = topic;
    envelope.data = payload;

    return send_broadcast(envelope.to_json());
}

bool LanOverlay::send_broadcast(const std::string& data) {
    if (!running_.load()) {
        log_warn("LanOverlay: Cannot send, overlay not running");
        return false;
    }

    if (data.size() > config::MAX_UDP_PACKET_SIZE) {
        log_error("LanOverlay: Datagram too large to send (" + std::to_string(data.size()) + " bytes)");
        return false;
    }

    try {
        std::lock_guard<std::mutex> lock(send_mutex_);
        socket_.send_to(asio::buffer(data), broadcast_endpoint_);
        messages_sent_++;
        return true;

    } catch (const std::exception& e) {
        log_error("LanOverlay: Failed to send broadcast: " + std::string(e.what()));
        return false;
    }
}

// ============================================================================
// Subscriptions and Callbacks
// ============================================================================

void LanOverlay::subscribe(const std::string& topic) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    topics_.insert(topic);
    log_debug("LanOverlay: Subscribed to " + topic);
}

bool LanOverlay::is_subscribed(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return topics_.count(topic) > 0;
}

void LanOverlay::set_discovery_callback(DiscoveryCallback callback) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    discovery_callback_ = std::move(callback);
}

void LanOverlay::set_message_callback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    message_callback_ = std::move(callback);
}

// ============================================================================
// Receiving
// ============================================================================

void LanOverlay::start_receive() {
    socket_.async_receive_from(
        asio::buffer(recv_buffer_),
        sender_endpoint_,
        [this](const asio::error_code& error, size_t bytes_transferred) {
            handle_receive(error, bytes_transferred);
        });
}

void LanOverlay::handle_receive(const asio::error_code& error, size_t bytes_transferred) {
    if (error) {
        if (error != asio::error::operation_aborted) {
            log_error("LanOverlay: Receive error: " + error.message());
        }
        return;
    }

    messages_received_++;

    try {
        std::string data(recv_buffer_.data(), bytes_transferred);
        process_datagram(data, sender_endpoint_.address().to_string());
    } catch (const std::exception& e) {
        log_error("LanOverlay: Error processing datagram: " + std::string(e.what()));
    }

    if (running_.load()) {
        start_receive();
    }
}

bool LanOverlay::process_datagram(const std::string& data, const std::string& sender_host) {
    auto envelope = OverlayEnvelope::from_json(data);
    if (!envelope) {
        log_debug("LanOverlay: Dropping unparseable datagram from " + sender_host);
        return false;
    }

    if (envelope->from == local_node_id_) {
        return false;
    }

    if (!config::validate_identifier(envelope->from)) {
        log_warn("LanOverlay: Dropping datagram with invalid sender id from " + sender_host);
        return false;
    }

    if (envelope->kind == EnvelopeKind::BEACON) {
        std::vector<std::string> addresses;
        for (const auto& address : envelope->addresses) {
            if (addresses.size() >= config::MAX_ADDRESSES_PER_NODE) {
                break;
            }
            addresses.push_back(rewrite_unspecified_host(address, sender_host));
        }

        DiscoveryCallback callback;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            callback = discovery_callback_;
        }
        if (callback) {
            callback(envelope->from, addresses);
        }
        return true;
    }

    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (topics_.count(envelope->topic) == 0) {
            return false;
        }
        callback = message_callback_;
    }
    if (callback) {
        callback(envelope->from, envelope->topic, envelope->data);
    }
    return true;
}

// ============================================================================
// Address Helpers
// ============================================================================

std::string LanOverlay::rewrite_unspecified_host(const std::string& address, const std::string& sender_host) {
    const std::string unspecified = "/ip4/0.0.0.0/";
    if (sender_host.empty() || !starts_with(address, unspecified)) {
        return address;
    }
    return "/ip4/" + sender_host + "/" + address.substr(unspecified.size());
}

std::optional<std::pair<std::string, std::string>> LanOverlay::parse_bootstrap(const std::string& multiaddr) {
    const std::string marker = "/p2p/";
    auto pos = multiaddr.rfind(marker);
    if (pos == std::string::npos || pos == 0) {
        return std::nullopt;
    }

    std::string peer_id = multiaddr.substr(pos + marker.size());
    if (!config::validate_identifier(peer_id)) {
        return std::nullopt;
    }

    return std::make_pair(peer_id, multiaddr.substr(0, pos));
}

} // namespace filemesh
