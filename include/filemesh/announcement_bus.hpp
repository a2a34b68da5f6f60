/**
 * @file announcement_bus.hpp
 * @brief Outbound file announcements and inbound announcement merging
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Local shares are applied to the catalog before they are published
 * - Inbound payloads are untrusted: decoded without throwing, throttled
 *   per sender, and merged idempotently
 */

#pragma once

#include "filemesh/announcement.hpp"
#include "filemesh/announcement_throttle.hpp"
#include "filemesh/errors.hpp"
#include "filemesh/file_catalog.hpp"
#include "filemesh/peer_directory.hpp"

#include <string>
#include <memory>
#include <mutex>

namespace filemesh {

/**
 * @brief PubSubChannel - outbound half of the overlay's pub/sub
 */
class PubSubChannel {
public:
    virtual ~PubSubChannel() = default;

    /**
     * @brief Publish payload on a topic
     * @return false if the payload could not be handed to the overlay
     */
    virtual bool publish(const std::string& topic, const std::string& payload) = 0;
};

/**
 * @brief Result of publishing a local share
 */
struct PublishResult {
    ErrorKind error = ErrorKind::NONE;
    FileAnnouncement announcement;

    bool ok() const { return error == ErrorKind::NONE; }
};

/**
 * @brief What happened to an inbound payload
 */
enum class ReceiveStatus {
    APPLIED,        ///< Merged into catalog and directory
    IGNORED,        ///< Well-formed but not a file-available announcement
    MALFORMED,      ///< Dropped and logged
    RATE_LIMITED    ///< Sender exceeded its budget, dropped
};

/**
 * @brief Convert ReceiveStatus to string
 */
std::string receive_status_to_string(ReceiveStatus status);

/**
 * @brief Result of handling an inbound payload
 */
struct ReceiveResult {
    ReceiveStatus status = ReceiveStatus::MALFORMED;
    ErrorKind error = ErrorKind::NONE;
    std::string filename;
    std::string hosting_peer;
};

/**
 * @brief AnnouncementBus - bridges pub/sub and the catalog
 */
class AnnouncementBus {
public:
    /**
     * @brief Construct bus
     * @param directory Peer directory (file sets, liveness)
     * @param catalog File catalog
     * @param channel Outbound channel (may be null until the overlay starts)
     */
    AnnouncementBus(PeerDirectory& directory,
                    FileCatalog& catalog,
                    std::shared_ptr<PubSubChannel> channel = nullptr);

    // Disable copy and move
    AnnouncementBus(const AnnouncementBus&) = delete;
    AnnouncementBus& operator=(const AnnouncementBus&) = delete;
    AnnouncementBus(AnnouncementBus&&) = delete;
    AnnouncementBus& operator=(AnnouncementBus&&) = delete;

    /**
     * @brief Announce a locally shared file
     *
     * The catalog and the origin node's file set are updated first, so the
     * file is listed even when publishing fails.
     *
     * @param filename Shared file name
     * @param size Size in bytes
     * @param origin_node_id Node hosting the file (normally the local node)
     * @return PUBLISH_FAILURE if the channel rejected it, MALFORMED_MESSAGE for an empty name
     */
    PublishResult publish_file_available(const std::string& filename,
                                         uint64_t size,
                                         const std::string& origin_node_id);

    /**
     * @brief Handle a payload received on the file-share topic
     *
     * Never throws. The hosting peer is the transport-level sender when
     * known, otherwise the payload's nodeId.
     *
     * @param from_peer_id Transport-level sender (may be empty)
     * @param raw Raw payload
     * @return Receive result
     */
    ReceiveResult on_announcement_received(const std::string& from_peer_id, const std::string& raw);

    /**
     * @brief Replace the outbound channel
     */
    void set_channel(std::shared_ptr<PubSubChannel> channel);

    /**
     * @brief Drop idle throttle buckets
     * @return Number of buckets removed
     */
    size_t prune_throttle();

    /**
     * @brief Inbound throttle (for inspection)
     */
    const AnnouncementThrottle& throttle() const;

private:
    PeerDirectory& directory_;
    FileCatalog& catalog_;

    std::shared_ptr<PubSubChannel> channel_;
    mutable std::mutex channel_mutex_;

    AnnouncementThrottle throttle_;

    ReceiveResult handle_payload(const std::string& from_peer_id, const std::string& raw);
};

} // namespace filemesh
