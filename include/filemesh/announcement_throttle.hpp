/**
 * @file announcement_throttle.hpp
 * @brief Per-peer token bucket for inbound announcements
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - 20 announcements per second per sending peer (sustained)
 * - Burst of 50
 * - Idle buckets pruned by the node's maintenance loop
 */

#pragma once

#include "filemesh/config.hpp"
#include <string>
#include <chrono>
#include <mutex>
#include <map>
#include <cstdint>

namespace filemesh {

/**
 * @brief AnnouncementThrottle - token bucket per sending peer
 */
class AnnouncementThrottle {
public:
    /**
     * @brief Construct throttle
     * @param rate_per_second Sustained announcements per peer
     * @param burst Bucket capacity per peer
     */
    explicit AnnouncementThrottle(
        double rate_per_second = config::ANNOUNCE_RATE_PER_SECOND,
        double burst = config::ANNOUNCE_RATE_BURST
    );

    // Disable copy and move
    AnnouncementThrottle(const AnnouncementThrottle&) = delete;
    AnnouncementThrottle& operator=(const AnnouncementThrottle&) = delete;
    AnnouncementThrottle(AnnouncementThrottle&&) = delete;
    AnnouncementThrottle& operator=(AnnouncementThrottle&&) = delete;

    /**
     * @brief Take one token for the peer
     * @param peer_id Sending peer
     * @return false if the peer's bucket is empty (announcement must be dropped)
     */
    bool allow(const std::string& peer_id);

    /**
     * @brief Tokens currently available to a peer (burst if untracked)
     */
    double available(const std::string& peer_id);

    /**
     * @brief Drop buckets untouched for longer than idle
     * @return Number of buckets removed
     */
    size_t prune_idle(std::chrono::milliseconds idle = config::RATE_LIMITER_IDLE);

    /**
     * @brief Number of peers with a bucket
     */
    size_t tracked_peers() const;

    /**
     * @brief Announcements rejected since construction
     */
    uint64_t dropped_total() const;

private:
    struct Bucket {
        double tokens;
        std::chrono::steady_clock::time_point last_refill;
    };

    double rate_per_second_;
    double burst_;

    std::map<std::string, Bucket> buckets_;
    uint64_t dropped_total_ = 0;

    mutable std::mutex mutex_;

    /**
     * @brief Add tokens earned since last refill (caller holds lock)
     */
    void refill(Bucket& bucket, std::chrono::steady_clock::time_point now) const;
};

} // namespace filemesh
