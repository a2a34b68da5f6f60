/**
 * @file lan_overlay.hpp
 * @brief UDP broadcast overlay: presence beacons and topic pubsub on the LAN
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides the minimal transport the coordination layer needs:
 * - Periodic presence beacons carrying node id and dialable addresses
 * - Topic-addressed payloads broadcast to every node on the segment
 * - Own datagrams are dropped; 0.0.0.0 addresses are rewritten to the sender
 */

#pragma once

#include "filemesh/announcement_bus.hpp"
#include "filemesh/config.hpp"

#include <asio.hpp>

#include <array>
#include <atomic>
#include <set>
#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <functional>
#include <cstdint>

namespace filemesh {

/**
 * @brief Datagram kinds carried by the overlay
 */
enum class EnvelopeKind {
    BEACON,     ///< Presence beacon (node id + addresses)
    PUBSUB      ///< Topic payload
};

/**
 * @brief One overlay datagram
 */
struct OverlayEnvelope {
    EnvelopeKind kind = EnvelopeKind::BEACON;
    std::string from;                        ///< Sender node id
    std::vector<std::string> addresses;      ///< Beacon only
    std::string topic;                       ///< Pubsub only
    std::string data;                        ///< Pubsub only (opaque payload)

    std::string to_json() const;
    static std::optional<OverlayEnvelope> from_json(const std::string& json_str);
};

/// Called when a beacon from another node arrives
using DiscoveryCallback = std::function<void(const std::string& peer_id,
                                             const std::vector<std::string>& addresses)>;

/// Called when a payload arrives on a subscribed topic
using MessageCallback = std::function<void(const std::string& from_peer_id,
                                           const std::string& topic,
                                           const std::string& data)>;

/**
 * @brief LanOverlay - broadcast-based discovery and pubsub
 */
class LanOverlay : public PubSubChannel {
public:
    /**
     * @brief Construct overlay
     * @param local_node_id This node's id (own datagrams are ignored)
     * @param io_context ASIO I/O context for async receive
     * @param port UDP port shared by all nodes on the segment
     */
    LanOverlay(std::string local_node_id,
               asio::io_context& io_context,
               uint16_t port = config::BEACON_PORT);

    ~LanOverlay() override;

    // Disable copy and move
    LanOverlay(const LanOverlay&) = delete;
    LanOverlay& operator=(const LanOverlay&) = delete;
    LanOverlay(LanOverlay&&) = delete;
    LanOverlay& operator=(LanOverlay&&) = delete;

    /**
     * @brief Open, bind and start receiving
     * @return true if listening (also when already running)
     */
    bool start();

    /**
     * @brief Close the socket (idempotent)
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Broadcast a presence beacon
     * @param addresses Dialable addresses of this node
     */
    bool announce_presence(const std::vector<std::string>& addresses);

    /**
     * @brief Broadcast payload on a topic
     * @return false if not running, oversized or the send fails
     */
    bool publish(const std::string& topic, const std::string& payload) override;

    /**
     * @brief Accept inbound payloads on a topic
     */
    void subscribe(const std::string& topic);

    bool is_subscribed(const std::string& topic) const;

    void set_discovery_callback(DiscoveryCallback callback);
    void set_message_callback(MessageCallback callback);

    /**
     * @brief Handle one received datagram
     * @param data Raw datagram bytes
     * @param sender_host Source IP of the datagram
     * @return true if it was a valid envelope from another node
     */
    bool process_datagram(const std::string& data, const std::string& sender_host);

    /**
     * @brief Split "/ip4/h/tcp/p/p2p/<id>" into peer id and dialable address
     * @return (peer_id, address) or std::nullopt without a valid /p2p/ suffix
     */
    static std::optional<std::pair<std::string, std::string>> parse_bootstrap(const std::string& multiaddr);

    /**
     * @brief Replace an unspecified host (0.0.0.0) with the sender's address
     */
    static std::string rewrite_unspecified_host(const std::string& address, const std::string& sender_host);

    uint16_t port() const { return port_; }
    uint64_t messages_sent() const { return messages_sent_.load(); }
    uint64_t messages_received() const { return messages_received_.load(); }

private:
    std::string local_node_id_;
    uint16_t port_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint broadcast_endpoint_;
    asio::ip::udp::endpoint sender_endpoint_;
    std::array<char, config::MAX_UDP_PACKET_SIZE> recv_buffer_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> messages_sent_;
    std::atomic<uint64_t> messages_received_;

    std::mutex send_mutex_;

    mutable std::mutex state_mutex_;
    std::set<std::string> topics_;
    DiscoveryCallback discovery_callback_;
    MessageCallback message_callback_;

    void start_receive();
    void handle_receive(const asio::error_code& error, size_t bytes_transferred);
    bool send_broadcast(const std::string& data);
};

} // namespace filemesh
