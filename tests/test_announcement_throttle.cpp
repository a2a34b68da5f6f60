/**
 * @file test_announcement_throttle.cpp
 * @brief Unit tests for AnnouncementThrottle
 *
 * Tests the per-peer token bucket including:
 * - Burst handling
 * - Refill over time
 * - Per-peer isolation
 * - Pruning of idle buckets
 */

#include <gtest/gtest.h>
#include "filemesh/announcement_throttle.hpp"
#include <memory>
#include <thread>
#include <chrono>

using namespace filemesh;

class AnnouncementThrottleTest : public ::testing::Test {
protected:
    void SetUp() override {
        throttle_ = std::make_unique<AnnouncementThrottle>(10.0, 5.0);
    }

    std::unique_ptr<AnnouncementThrottle> throttle_;
};

// ============================================================================
// Bucket Tests
// ============================================================================

TEST_F(AnnouncementThrottleTest, AllowsBurstThenDenies) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(throttle_->allow("peerA")) << "announcement " << i;
    }
    EXPECT_FALSE(throttle_->allow("peerA"));
    EXPECT_EQ(throttle_->dropped_total(), 1u);
}

TEST_F(AnnouncementThrottleTest, UntrackedPeerHasFullBurst) {
    EXPECT_DOUBLE_EQ(throttle_->available("nobody"), 5.0);
    EXPECT_EQ(throttle_->tracked_peers(), 0u);
}

TEST_F(AnnouncementThrottleTest, RefillsOverTime) {
    for (int i = 0; i < 5; ++i) {
        throttle_->allow("peerA");
    }
    EXPECT_FALSE(throttle_->allow("peerA"));

    // 10 tokens per second: 250ms earns at least two
    std::this_thread::sleep_for(std::chrono::milliseconds(250));

    EXPECT_GE(throttle_->available("peerA"), 2.0);
    EXPECT_TRUE(throttle_->allow("peerA"));
}

TEST_F(AnnouncementThrottleTest, RefillIsCappedAtBurst) {
    throttle_->allow("peerA");
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    EXPECT_LE(throttle_->available("peerA"), 5.0);
}

TEST_F(AnnouncementThrottleTest, PeersAreIndependent) {
    for (int i = 0; i < 5; ++i) {
        throttle_->allow("peerA");
    }
    EXPECT_FALSE(throttle_->allow("peerA"));
    EXPECT_TRUE(throttle_->allow("peerB"));
    EXPECT_EQ(throttle_->tracked_peers(), 2u);
}

TEST_F(AnnouncementThrottleTest, DefaultsMatchConfiguredBudget) {
    AnnouncementThrottle throttle;
    EXPECT_DOUBLE_EQ(throttle.available("x"), config::ANNOUNCE_RATE_BURST);
}

// ============================================================================
// Pruning Tests
// ============================================================================

TEST_F(AnnouncementThrottleTest, PrunesIdleBuckets) {
    throttle_->allow("peerA");
    throttle_->allow("peerB");

    EXPECT_EQ(throttle_->prune_idle(std::chrono::minutes(5)), 0u);
    EXPECT_EQ(throttle_->tracked_peers(), 2u);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_EQ(throttle_->prune_idle(std::chrono::milliseconds(1)), 2u);
    EXPECT_EQ(throttle_->tracked_peers(), 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
