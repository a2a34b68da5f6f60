/**
 * @file test_announcement_bus.cpp
 * @brief Unit tests for announcement decoding and AnnouncementBus
 *
 * Tests announcement handling including:
 * - Wire format encoding and validation
 * - Self-consistency after a local publish
 * - Publish failures keep local state
 * - Malformed and unknown payloads
 * - Hosting peer attribution and inbound throttling
 */

#include <gtest/gtest.h>
#include "filemesh/announcement.hpp"
#include "filemesh/announcement_bus.hpp"
#include "filemesh/file_catalog.hpp"
#include "filemesh/peer_directory.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace filemesh;
using json = nlohmann::json;

namespace {

/**
 * @brief Channel capturing published payloads
 */
class RecordingChannel : public PubSubChannel {
public:
    bool publish(const std::string& topic, const std::string& payload) override {
        if (fail) {
            return false;
        }
        published.emplace_back(topic, payload);
        return true;
    }

    bool fail = false;
    std::vector<std::pair<std::string, std::string>> published;
};

class ThrowingChannel : public PubSubChannel {
public:
    bool publish(const std::string&, const std::string&) override {
        throw std::runtime_error("overlay gone");
    }
};

std::string announcement_json(const std::string& filename, int64_t size, const std::string& node_id) {
    json j;
    j["type"] = "file-available";
    j["filename"] = filename;
    j["size"] = size;
    j["timestamp"] = 1700000000000LL;
    j["nodeId"] = node_id;
    return j.dump();
}

} // namespace

// ============================================================================
// Decoding Tests
// ============================================================================

TEST(AnnouncementDecodeTest, EncodesWireFormat) {
    FileAnnouncement announcement;
    announcement.filename = "notes.txt";
    announcement.size = 42;
    announcement.timestamp = 1700000000000ULL;
    announcement.node_id = "nodeA";

    json j = json::parse(announcement.to_json());
    EXPECT_EQ(j["type"], "file-available");
    EXPECT_EQ(j["filename"], "notes.txt");
    EXPECT_EQ(j["size"], 42);
    EXPECT_EQ(j["timestamp"], 1700000000000ULL);
    EXPECT_EQ(j["nodeId"], "nodeA");
}

TEST(AnnouncementDecodeTest, DecodesValidAnnouncement) {
    auto decoded = decode_announcement(announcement_json("notes.txt", 42, "nodeA"));

    ASSERT_EQ(decoded.status, DecodeStatus::OK);
    EXPECT_EQ(decoded.announcement.filename, "notes.txt");
    EXPECT_EQ(decoded.announcement.size, 42u);
    EXPECT_EQ(decoded.announcement.timestamp, 1700000000000ULL);
    EXPECT_EQ(decoded.announcement.node_id, "nodeA");
}

TEST(AnnouncementDecodeTest, OptionalFieldsMayBeMissing) {
    auto decoded = decode_announcement(R"({"type":"file-available","filename":"a.bin","size":0})");

    ASSERT_EQ(decoded.status, DecodeStatus::OK);
    EXPECT_EQ(decoded.announcement.timestamp, 0u);
    EXPECT_TRUE(decoded.announcement.node_id.empty());
}

TEST(AnnouncementDecodeTest, OutOfRangeTimestampIsAbsent) {
    for (const char* timestamp : {"1e300", "-5.5", "-7", "1.8446744073709552e19", "\"soon\""}) {
        auto decoded = decode_announcement(
            std::string(R"({"type":"file-available","filename":"a.bin","size":1,"timestamp":)") +
            timestamp + "}");

        ASSERT_EQ(decoded.status, DecodeStatus::OK) << timestamp;
        EXPECT_EQ(decoded.announcement.timestamp, 0u) << timestamp;
    }

    auto fractional = decode_announcement(
        R"({"type":"file-available","filename":"a.bin","size":1,"timestamp":1700000000000.5})");
    ASSERT_EQ(fractional.status, DecodeStatus::OK);
    EXPECT_EQ(fractional.announcement.timestamp, 1700000000000ULL);
}

TEST(AnnouncementDecodeTest, UnknownTypeIsNotMalformed) {
    auto decoded = decode_announcement(R"({"type":"node-announce","nodeId":"x"})");
    EXPECT_EQ(decoded.status, DecodeStatus::UNKNOWN_TYPE);
    EXPECT_EQ(decoded.type_name, "node-announce");
}

TEST(AnnouncementDecodeTest, RejectsMalformedPayloads) {
    const std::vector<std::string> bad = {
        "",
        "not json",
        "[1,2,3]",
        R"({"filename":"a.txt","size":1})",
        R"({"type":"file-available","size":1})",
        R"({"type":"file-available","filename":"","size":1})",
        R"({"type":"file-available","filename":"../etc/passwd","size":1})",
        R"({"type":"file-available","filename":"a.txt"})",
        R"({"type":"file-available","filename":"a.txt","size":-5})",
        R"({"type":"file-available","filename":"a.txt","size":"12"})",
        R"({"type":"file-available","filename":"a.txt","size":1,"nodeId":"bad id!"})",
        std::string(config::MAX_ANNOUNCEMENT_SIZE + 1, ' '),
    };

    for (const auto& payload : bad) {
        EXPECT_EQ(decode_announcement(payload).status, DecodeStatus::MALFORMED)
            << "payload: " << payload.substr(0, 80);
    }
}

TEST(AnnouncementDecodeTest, FromJsonMatchesDecode) {
    EXPECT_TRUE(FileAnnouncement::from_json(announcement_json("a.txt", 1, "nodeA")).has_value());
    EXPECT_FALSE(FileAnnouncement::from_json("{}").has_value());
}

// ============================================================================
// Bus Fixture
// ============================================================================

class AnnouncementBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = std::make_unique<PeerDirectory>("local");
        catalog_ = std::make_unique<FileCatalog>();
        channel_ = std::make_shared<RecordingChannel>();
        bus_ = std::make_unique<AnnouncementBus>(*directory_, *catalog_, channel_);
    }

    std::unique_ptr<PeerDirectory> directory_;
    std::unique_ptr<FileCatalog> catalog_;
    std::shared_ptr<RecordingChannel> channel_;
    std::unique_ptr<AnnouncementBus> bus_;
};

// ============================================================================
// Publish Tests
// ============================================================================

TEST_F(AnnouncementBusTest, PublishIsSelfConsistent) {
    PublishResult result = bus_->publish_file_available("photo.jpg", 1234, "local");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.announcement.filename, "photo.jpg");
    EXPECT_GT(result.announcement.timestamp, 0u);

    EXPECT_TRUE(catalog_->is_hosted_by("photo.jpg", "local"));
    EXPECT_EQ(directory_->get("local")->files.count("photo.jpg"), 1u);

    ASSERT_EQ(channel_->published.size(), 1u);
    EXPECT_EQ(channel_->published[0].first, config::FILE_SHARE_TOPIC);

    auto decoded = decode_announcement(channel_->published[0].second);
    ASSERT_EQ(decoded.status, DecodeStatus::OK);
    EXPECT_EQ(decoded.announcement.node_id, "local");
    EXPECT_EQ(decoded.announcement.size, 1234u);
}

TEST_F(AnnouncementBusTest, PublishFailureKeepsLocalState) {
    channel_->fail = true;

    PublishResult result = bus_->publish_file_available("photo.jpg", 1234, "local");

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ErrorKind::PUBLISH_FAILURE);
    EXPECT_TRUE(catalog_->is_hosted_by("photo.jpg", "local"));
    EXPECT_EQ(directory_->get("local")->files.count("photo.jpg"), 1u);
}

TEST_F(AnnouncementBusTest, ThrowingChannelIsAPublishFailure) {
    bus_->set_channel(std::make_shared<ThrowingChannel>());

    PublishResult result = bus_->publish_file_available("photo.jpg", 1, "local");
    EXPECT_EQ(result.error, ErrorKind::PUBLISH_FAILURE);
    EXPECT_TRUE(catalog_->get("photo.jpg").has_value());
}

TEST_F(AnnouncementBusTest, MissingChannelIsAPublishFailure) {
    bus_->set_channel(nullptr);

    PublishResult result = bus_->publish_file_available("photo.jpg", 1, "local");
    EXPECT_EQ(result.error, ErrorKind::PUBLISH_FAILURE);
    EXPECT_TRUE(catalog_->get("photo.jpg").has_value());
}

TEST_F(AnnouncementBusTest, PublishRejectsEmptyNames) {
    EXPECT_EQ(bus_->publish_file_available("", 1, "local").error, ErrorKind::MALFORMED_MESSAGE);
    EXPECT_EQ(bus_->publish_file_available("a.txt", 1, "").error, ErrorKind::MALFORMED_MESSAGE);
    EXPECT_EQ(catalog_->size(), 0u);
    EXPECT_TRUE(channel_->published.empty());
}

// ============================================================================
// Receive Tests
// ============================================================================

TEST_F(AnnouncementBusTest, AppliesValidAnnouncement) {
    directory_->upsert_discovered("peerA", {"/ip4/10.0.0.2/tcp/3000"});

    ReceiveResult result = bus_->on_announcement_received("peerA", announcement_json("song.mp3", 99, "peerA"));

    EXPECT_EQ(result.status, ReceiveStatus::APPLIED);
    EXPECT_EQ(result.filename, "song.mp3");
    EXPECT_EQ(result.hosting_peer, "peerA");
    EXPECT_TRUE(catalog_->is_hosted_by("song.mp3", "peerA"));
    EXPECT_EQ(directory_->get("peerA")->files.count("song.mp3"), 1u);
    EXPECT_EQ(catalog_->get("song.mp3")->first_announced_at, 1700000000000ULL);
}

TEST_F(AnnouncementBusTest, SenderIsTheHostingPeer) {
    // peerB relays an announcement that originated on peerA
    ReceiveResult result = bus_->on_announcement_received("peerB", announcement_json("song.mp3", 99, "peerA"));

    ASSERT_EQ(result.status, ReceiveStatus::APPLIED);
    EXPECT_EQ(result.hosting_peer, "peerB");

    auto entry = catalog_->get("song.mp3");
    EXPECT_EQ(entry->origin_node_id, "peerA");
    EXPECT_EQ(entry->hosting_peers.count("peerB"), 1u);
}

TEST_F(AnnouncementBusTest, FallsBackToNodeIdWithoutSender) {
    ReceiveResult result = bus_->on_announcement_received("", announcement_json("song.mp3", 99, "peerA"));

    ASSERT_EQ(result.status, ReceiveStatus::APPLIED);
    EXPECT_EQ(result.hosting_peer, "peerA");
}

TEST_F(AnnouncementBusTest, NoSenderAndNoNodeIdIsMalformed) {
    ReceiveResult result = bus_->on_announcement_received(
        "", R"({"type":"file-available","filename":"a.txt","size":1})");

    EXPECT_EQ(result.status, ReceiveStatus::MALFORMED);
    EXPECT_EQ(catalog_->size(), 0u);
}

TEST_F(AnnouncementBusTest, AnnouncementBeforeDiscoveryStillCatalogued) {
    ReceiveResult result = bus_->on_announcement_received("peerZ", announcement_json("early.txt", 5, "peerZ"));

    EXPECT_EQ(result.status, ReceiveStatus::APPLIED);
    EXPECT_TRUE(catalog_->is_hosted_by("early.txt", "peerZ"));
    EXPECT_FALSE(directory_->contains("peerZ"));
}

TEST_F(AnnouncementBusTest, MalformedPayloadIsDroppedSafely) {
    size_t directory_size = directory_->size();

    ReceiveResult result = bus_->on_announcement_received("peerA", "{{{ not json");

    EXPECT_EQ(result.status, ReceiveStatus::MALFORMED);
    EXPECT_EQ(result.error, ErrorKind::MALFORMED_MESSAGE);
    EXPECT_EQ(catalog_->size(), 0u);
    EXPECT_EQ(directory_->size(), directory_size);
}

TEST_F(AnnouncementBusTest, UnknownTypeIsIgnored) {
    ReceiveResult result = bus_->on_announcement_received("peerA", R"({"type":"node-announce","nodeId":"peerA"})");

    EXPECT_EQ(result.status, ReceiveStatus::IGNORED);
    EXPECT_EQ(result.error, ErrorKind::NONE);
    EXPECT_EQ(catalog_->size(), 0u);
}

TEST_F(AnnouncementBusTest, ReceiveRefreshesKnownSender) {
    uint64_t now = 1000;
    PeerDirectory directory("local", {}, [&now]() { return now; });
    FileCatalog catalog;
    AnnouncementBus bus(directory, catalog);

    directory.upsert_discovered("peerA", {});
    now = 5000;
    bus.on_announcement_received("peerA", announcement_json("a.txt", 1, "peerA"));

    EXPECT_EQ(directory.get("peerA")->last_seen, 5000u);
}

TEST_F(AnnouncementBusTest, FloodFromOnePeerIsThrottled) {
    size_t applied = 0;
    size_t limited = 0;

    for (int i = 0; i < 200; ++i) {
        auto result = bus_->on_announcement_received(
            "flooder", announcement_json("f" + std::to_string(i) + ".txt", 1, "flooder"));
        if (result.status == ReceiveStatus::APPLIED) {
            applied++;
        } else if (result.status == ReceiveStatus::RATE_LIMITED) {
            limited++;
        }
    }

    EXPECT_GE(applied, static_cast<size_t>(config::ANNOUNCE_RATE_BURST));
    EXPECT_GT(limited, 0u);
    EXPECT_EQ(applied + limited, 200u);

    // Other peers are unaffected
    EXPECT_EQ(bus_->on_announcement_received("quiet", announcement_json("q.txt", 1, "quiet")).status,
              ReceiveStatus::APPLIED);
    EXPECT_EQ(bus_->throttle().tracked_peers(), 2u);
}

TEST(ReceiveStatusTest, Names) {
    EXPECT_EQ(receive_status_to_string(ReceiveStatus::APPLIED), "APPLIED");
    EXPECT_EQ(receive_status_to_string(ReceiveStatus::IGNORED), "IGNORED");
    EXPECT_EQ(receive_status_to_string(ReceiveStatus::MALFORMED), "MALFORMED");
    EXPECT_EQ(receive_status_to_string(ReceiveStatus::RATE_LIMITED), "RATE_LIMITED");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
