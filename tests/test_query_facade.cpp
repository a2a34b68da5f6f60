/**
 * @file test_query_facade.cpp
 * @brief Unit tests for QueryFacade
 *
 * Tests read-only views including:
 * - Network status composition and JSON shape
 * - Download target resolution for local and remote nodes
 */

#include <gtest/gtest.h>
#include "filemesh/query_facade.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <memory>

using namespace filemesh;
using json = nlohmann::json;

class QueryFacadeTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "filemesh_facade_test";
        std::filesystem::remove_all(root_);

        directory_ = std::make_unique<PeerDirectory>("local", std::vector<std::string>{"/ip4/0.0.0.0/tcp/3000"});
        catalog_ = std::make_unique<FileCatalog>();
        store_ = std::make_unique<SharedFileStore>(root_ / "shared");
        ASSERT_TRUE(store_->initialize());
        facade_ = std::make_unique<QueryFacade>(*directory_, *catalog_, *store_);
    }

    void TearDown() override {
        facade_.reset();
        store_.reset();
        std::filesystem::remove_all(root_);
    }

    void connect(const std::string& peer_id) {
        directory_->upsert_discovered(peer_id, {"/ip4/10.0.0.9/tcp/3000"});
        directory_->mark_dialing(peer_id);
        directory_->mark_connected(peer_id);
    }

    const NodeView* find_node(const NetworkStatus& status, const std::string& id) {
        auto it = std::find_if(status.nodes.begin(), status.nodes.end(),
            [&id](const NodeView& node) { return node.id == id; });
        return it == status.nodes.end() ? nullptr : &*it;
    }

    std::filesystem::path root_;
    std::unique_ptr<PeerDirectory> directory_;
    std::unique_ptr<FileCatalog> catalog_;
    std::unique_ptr<SharedFileStore> store_;
    std::unique_ptr<QueryFacade> facade_;
};

// ============================================================================
// Network Status Tests
// ============================================================================

TEST_F(QueryFacadeTest, StatusOfLoneNode) {
    NetworkStatus status = facade_->network_status();

    EXPECT_EQ(status.current_node, "local");
    ASSERT_EQ(status.nodes.size(), 1u);
    EXPECT_TRUE(status.nodes[0].is_local);
    EXPECT_FALSE(status.nodes[0].is_connected);
    EXPECT_TRUE(status.connected_peers.empty());
}

TEST_F(QueryFacadeTest, StatusListsConnectedPeers) {
    connect("peerA");
    directory_->upsert_discovered("peerB", {"/ip4/10.0.0.3/tcp/3000"});

    NetworkStatus status = facade_->network_status();

    EXPECT_EQ(status.nodes.size(), 3u);
    ASSERT_EQ(status.connected_peers.size(), 1u);
    EXPECT_EQ(status.connected_peers[0], "peerA");

    const NodeView* peer_b = find_node(status, "peerB");
    ASSERT_NE(peer_b, nullptr);
    EXPECT_FALSE(peer_b->is_connected);
    EXPECT_EQ(peer_b->addresses.size(), 1u);
}

TEST_F(QueryFacadeTest, StatusIncludesCatalogHosts) {
    directory_->upsert_discovered("peerA", {});
    catalog_->add_hosting_record("early.txt", "peerA", 4, "peerA", 1);
    directory_->add_file_to_node("peerA", "known.txt");

    NetworkStatus status = facade_->network_status();
    const NodeView* peer_a = find_node(status, "peerA");
    ASSERT_NE(peer_a, nullptr);
    ASSERT_EQ(peer_a->files.size(), 2u);
    EXPECT_EQ(peer_a->files[0], "early.txt");
    EXPECT_EQ(peer_a->files[1], "known.txt");
}

TEST_F(QueryFacadeTest, StatusListsHostsOnlySeenInCatalog) {
    catalog_->add_hosting_record("b.txt", "ghost", 4, "ghost", 1);
    catalog_->add_hosting_record("a.txt", "ghost", 2, "ghost", 1);

    NetworkStatus status = facade_->network_status();
    EXPECT_EQ(status.nodes.size(), 2u);

    const NodeView* ghost = find_node(status, "ghost");
    ASSERT_NE(ghost, nullptr);
    EXPECT_FALSE(ghost->is_local);
    EXPECT_FALSE(ghost->is_connected);
    EXPECT_TRUE(ghost->addresses.empty());
    ASSERT_EQ(ghost->files.size(), 2u);
    EXPECT_EQ(ghost->files[0], "a.txt");
    EXPECT_EQ(ghost->files[1], "b.txt");
    EXPECT_TRUE(status.connected_peers.empty());
}

TEST_F(QueryFacadeTest, StatusJsonShape) {
    connect("peerA");
    directory_->add_file_to_node("local", "mine.txt");

    json j = json::parse(facade_->network_status().to_json());

    ASSERT_TRUE(j["nodes"].is_array());
    EXPECT_EQ(j["currentNode"], "local");
    ASSERT_TRUE(j["connectedPeers"].is_array());
    EXPECT_EQ(j["connectedPeers"][0], "peerA");

    for (const auto& node : j["nodes"]) {
        EXPECT_TRUE(node.contains("id"));
        EXPECT_TRUE(node["address"].is_array());
        EXPECT_TRUE(node["files"].is_array());
        EXPECT_TRUE(node["lastSeen"].is_number());
        EXPECT_TRUE(node["isLocal"].is_boolean());
        EXPECT_TRUE(node["isConnected"].is_boolean());
        if (node["id"] == "local") {
            EXPECT_EQ(node["files"][0], "mine.txt");
            EXPECT_TRUE(node["isLocal"].get<bool>());
        }
    }
}

// ============================================================================
// Download Resolution Tests
// ============================================================================

TEST_F(QueryFacadeTest, LocalFilePresent) {
    store_->store("mine.txt", "data");

    DownloadResolution resolution = facade_->resolve_download_target("local", "mine.txt");

    EXPECT_EQ(resolution.kind, ResolutionKind::LOCAL);
    EXPECT_EQ(resolution.local_path.string(), (root_ / "shared" / "mine.txt").string());
    EXPECT_EQ(resolution.error(), ErrorKind::NONE);
}

TEST_F(QueryFacadeTest, LocalFileMissing) {
    DownloadResolution resolution = facade_->resolve_download_target("local", "nothing.txt");
    EXPECT_EQ(resolution.kind, ResolutionKind::NOT_FOUND);
    EXPECT_EQ(resolution.error(), ErrorKind::NOT_FOUND);
}

TEST_F(QueryFacadeTest, LocalTraversalIsNotFound) {
    EXPECT_EQ(facade_->resolve_download_target("local", "../etc/passwd").kind, ResolutionKind::NOT_FOUND);
}

TEST_F(QueryFacadeTest, UnknownNodeIsNotConnected) {
    DownloadResolution resolution = facade_->resolve_download_target("ghost", "a.txt");
    EXPECT_EQ(resolution.kind, ResolutionKind::NOT_CONNECTED);
    EXPECT_EQ(resolution.error(), ErrorKind::NOT_CONNECTED);
}

TEST_F(QueryFacadeTest, DiscoveredNodeIsNotConnected) {
    directory_->upsert_discovered("peerA", {"/ip4/10.0.0.2/tcp/3000"});
    directory_->add_file_to_node("peerA", "a.txt");

    EXPECT_EQ(facade_->resolve_download_target("peerA", "a.txt").kind, ResolutionKind::NOT_CONNECTED);
}

TEST_F(QueryFacadeTest, ConnectedNodeWithoutFileIsNotFound) {
    connect("peerA");
    EXPECT_EQ(facade_->resolve_download_target("peerA", "a.txt").kind, ResolutionKind::NOT_FOUND);
}

TEST_F(QueryFacadeTest, ConnectedNodeHostingFileIsRemote) {
    connect("peerA");
    catalog_->add_hosting_record("a.txt", "peerA", 3, "peerA", 1);

    DownloadResolution resolution = facade_->resolve_download_target("peerA", "a.txt");

    EXPECT_EQ(resolution.kind, ResolutionKind::REMOTE);
    EXPECT_EQ(resolution.error(), ErrorKind::NONE);
    ASSERT_FALSE(resolution.addresses.empty());
    EXPECT_EQ(resolution.addresses[0], "/ip4/10.0.0.9/tcp/3000");
}

TEST(ResolutionKindTest, Names) {
    EXPECT_EQ(resolution_kind_to_string(ResolutionKind::LOCAL), "LOCAL");
    EXPECT_EQ(resolution_kind_to_string(ResolutionKind::REMOTE), "REMOTE");
    EXPECT_EQ(resolution_kind_to_string(ResolutionKind::NOT_CONNECTED), "NOT_CONNECTED");
    EXPECT_EQ(resolution_kind_to_string(ResolutionKind::NOT_FOUND), "NOT_FOUND");
}

TEST(ErrorKindTest, NamesAndStatusClasses) {
    EXPECT_EQ(error_kind_to_string(ErrorKind::NOT_CONNECTED), "NOT_CONNECTED");
    EXPECT_EQ(error_kind_to_string(ErrorKind::PUBLISH_FAILURE), "PUBLISH_FAILURE");
    EXPECT_EQ(error_kind_http_status(ErrorKind::NONE), 200);
    EXPECT_EQ(error_kind_http_status(ErrorKind::MALFORMED_MESSAGE), 400);
    EXPECT_EQ(error_kind_http_status(ErrorKind::NOT_CONNECTED), 404);
    EXPECT_EQ(error_kind_http_status(ErrorKind::NOT_FOUND), 404);
    EXPECT_EQ(error_kind_http_status(ErrorKind::DIAL_FAILURE), 500);
    EXPECT_EQ(error_kind_http_status(ErrorKind::PUBLISH_FAILURE), 500);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
