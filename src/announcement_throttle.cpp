/**
 * @file announcement_throttle.cpp
 * @brief Implementation of the inbound announcement throttle
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/announcement_throttle.hpp"
#include <algorithm>

namespace filemesh {

AnnouncementThrottle::AnnouncementThrottle(double rate_per_second, double burst)
    : rate_per_second_(rate_per_second)
    , burst_(burst)
{
}

bool AnnouncementThrottle::allow(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();

    auto [it, created] = buckets_.try_emplace(peer_id, Bucket{burst_, now});
    Bucket& bucket = it->second;

    if (!created) {
        refill(bucket, now);
    }

    if (bucket.tokens < 1.0) {
        dropped_total_++;
        return false;
    }

    bucket.tokens -= 1.0;
    return true;
}

double AnnouncementThrottle::available(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(peer_id);
    if (it == buckets_.end()) {
        return burst_;
    }

    refill(it->second, std::chrono::steady_clock::now());
    return it->second.tokens;
}

size_t AnnouncementThrottle::prune_idle(std::chrono::milliseconds idle) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    size_t removed = 0;

    for (auto it = buckets_.begin(); it != buckets_.end(); ) {
        if (now - it->second.last_refill > idle) {
            it = buckets_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    return removed;
}

size_t AnnouncementThrottle::tracked_peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

uint64_t AnnouncementThrottle::dropped_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_total_;
}

void AnnouncementThrottle::refill(Bucket& bucket, std::chrono::steady_clock::time_point now) const {
    std::chrono::duration<double> elapsed = now - bucket.last_refill;
    if (elapsed.count() <= 0.0) {
        return;
    }

    bucket.tokens = std::min(bucket.tokens + elapsed.count() * rate_per_second_, burst_);
    bucket.last_refill = now;
}

} // namespace filemesh
