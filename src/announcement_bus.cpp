/**
 * @file announcement_bus.cpp
 * @brief Implementation of the announcement bus
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/announcement_bus.hpp"
#include "filemesh/config.hpp"
#include "filemesh/utilities.hpp"

namespace filemesh {

using namespace filemesh::utilities;

std::string receive_status_to_string(ReceiveStatus status) {
    switch (status) {
        case ReceiveStatus::APPLIED: return "APPLIED";
        case ReceiveStatus::IGNORED: return "IGNORED";
        case ReceiveStatus::MALFORMED: return "MALFORMED";
        case ReceiveStatus::RATE_LIMITED: return "RATE_LIMITED";
        default: return "UNKNOWN";
    }
}

AnnouncementBus::AnnouncementBus(PeerDirectory& directory,
                                 FileCatalog& catalog,
                                 std::shared_ptr<PubSubChannel> channel)
    : directory_(directory)
    , catalog_(catalog)
    , channel_(std::move(channel))
{
}

// ============================================================================
// Outbound
// ============================================================================

PublishResult AnnouncementBus::publish_file_available(const std::string& filename,
                                                      uint64_t size,
                                                      const std::string& origin_node_id) {
    PublishResult result;
    result.announcement.filename = filename;
    result.announcement.size = size;
    result.announcement.timestamp = current_time_ms();
    result.announcement.node_id = origin_node_id;

    if (filename.empty() || origin_node_id.empty()) {
        log_error("AnnouncementBus: Refusing to announce file without name or origin");
        result.error = ErrorKind::MALFORMED_MESSAGE;
        return result;
    }

    // Self-consistency: visible locally before any network round trip
    catalog_.add_hosting_record(filename, origin_node_id, size, origin_node_id,
                                result.announcement.timestamp);
    directory_.add_file_to_node(origin_node_id, filename);

    std::shared_ptr<PubSubChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        channel = channel_;
    }

    if (!channel) {
        log_error("AnnouncementBus: No channel, " + filename + " not announced");
        result.error = ErrorKind::PUBLISH_FAILURE;
        return result;
    }

    try {
        if (!channel->publish(config::FILE_SHARE_TOPIC, result.announcement.to_json())) {
            log_error("AnnouncementBus: Channel rejected announcement for " + filename);
            result.error = ErrorKind::PUBLISH_FAILURE;
            return result;
        }
    } catch (const std::exception& e) {
        log_error("AnnouncementBus: Failed to publish " + filename + ": " + e.what());
        result.error = ErrorKind::PUBLISH_FAILURE;
        return result;
    }

    log_info("AnnouncementBus: Announced " + filename + " (" + format_file_size(size) + ")");
    return result;
}

// ============================================================================
// Inbound
// ============================================================================

ReceiveResult AnnouncementBus::on_announcement_received(const std::string& from_peer_id,
                                                        const std::string& raw) {
    try {
        return handle_payload(from_peer_id, raw);
    } catch (const std::exception& e) {
        log_error("AnnouncementBus: Error processing announcement from " + from_peer_id +
                  ": " + e.what());
        ReceiveResult result;
        result.status = ReceiveStatus::MALFORMED;
        result.error = ErrorKind::MALFORMED_MESSAGE;
        return result;
    }
}

ReceiveResult AnnouncementBus::handle_payload(const std::string& from_peer_id, const std::string& raw) {
    ReceiveResult result;

    if (!throttle_.allow(from_peer_id.empty() ? std::string("anonymous") : from_peer_id)) {
        log_warn("AnnouncementBus: Rate limit exceeded for " + from_peer_id + ", dropping");
        result.status = ReceiveStatus::RATE_LIMITED;
        return result;
    }

    DecodedAnnouncement decoded = decode_announcement(raw);

    if (decoded.status == DecodeStatus::UNKNOWN_TYPE) {
        log_debug("AnnouncementBus: Ignoring message type '" + decoded.type_name + "'");
        result.status = ReceiveStatus::IGNORED;
        return result;
    }

    if (decoded.status == DecodeStatus::MALFORMED) {
        log_warn("AnnouncementBus: Malformed announcement from " + from_peer_id + ": " + decoded.error);
        result.status = ReceiveStatus::MALFORMED;
        result.error = ErrorKind::MALFORMED_MESSAGE;
        return result;
    }

    const FileAnnouncement& announcement = decoded.announcement;

    std::string hosting_peer = from_peer_id.empty() ? announcement.node_id : from_peer_id;
    if (hosting_peer.empty()) {
        log_warn("AnnouncementBus: Announcement for " + announcement.filename + " has no sender");
        result.status = ReceiveStatus::MALFORMED;
        result.error = ErrorKind::MALFORMED_MESSAGE;
        return result;
    }

    std::string origin = announcement.node_id.empty() ? hosting_peer : announcement.node_id;
    uint64_t timestamp = announcement.timestamp != 0 ? announcement.timestamp : current_time_ms();

    catalog_.add_hosting_record(announcement.filename, hosting_peer, announcement.size, origin, timestamp);
    directory_.add_file_to_node(hosting_peer, announcement.filename);
    directory_.touch(hosting_peer);

    log_info("AnnouncementBus: New file available in the network: " + announcement.filename +
             " (hosted by " + hosting_peer + ")");

    result.status = ReceiveStatus::APPLIED;
    result.filename = announcement.filename;
    result.hosting_peer = hosting_peer;
    return result;
}

// ============================================================================
// Management
// ============================================================================

void AnnouncementBus::set_channel(std::shared_ptr<PubSubChannel> channel) {
    std::lock_guard<std::mutex> lock(channel_mutex_);
    channel_ = std::move(channel);
}

size_t AnnouncementBus::prune_throttle() {
    return throttle_.prune_idle();
}

const AnnouncementThrottle& AnnouncementBus::throttle() const {
    return throttle_;
}

} // namespace filemesh
