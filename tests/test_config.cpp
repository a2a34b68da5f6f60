/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and input validation
 *
 * Tests configuration including:
 * - Identifier validation
 * - Filename sanitization
 * - Path traversal detection
 * - Command line and environment overrides
 */

#include <gtest/gtest.h>
#include "filemesh/config.hpp"
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

using namespace filemesh;
using namespace filemesh::config;

// ============================================================================
// Identifier Validation Tests
// ============================================================================

TEST(ConfigValidationTest, ValidIdentifiers) {
    EXPECT_TRUE(validate_identifier("node1"));
    EXPECT_TRUE(validate_identifier("a1b2c3d4e5f6a7b8c9d0e1f2a3b4c5d6"));
    EXPECT_TRUE(validate_identifier("peer_with-dashes"));
}

TEST(ConfigValidationTest, InvalidIdentifiers) {
    EXPECT_FALSE(validate_identifier(""));
    EXPECT_FALSE(validate_identifier("has space"));
    EXPECT_FALSE(validate_identifier("slash/id"));
    EXPECT_FALSE(validate_identifier("dot.id"));
    EXPECT_FALSE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH + 1, 'a')));
    EXPECT_TRUE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH, 'a')));
}

// ============================================================================
// Filename Sanitization Tests
// ============================================================================

TEST(ConfigValidationTest, SanitizeKeepsPlainNames) {
    EXPECT_EQ(sanitize_filename("report.pdf"), "report.pdf");
    EXPECT_EQ(sanitize_filename("my song.mp3"), "my song.mp3");
}

TEST(ConfigValidationTest, SanitizeStripsDirectories) {
    EXPECT_EQ(sanitize_filename("../../etc/passwd"), "passwd");
    EXPECT_EQ(sanitize_filename("C:\\Users\\x\\file.txt"), "file.txt");
    EXPECT_EQ(sanitize_filename("/absolute/name.bin"), "name.bin");
}

TEST(ConfigValidationTest, SanitizeReplacesUnsafeCharacters) {
    EXPECT_EQ(sanitize_filename("a<b>c.txt"), "a_b_c.txt");
    EXPECT_EQ(sanitize_filename("what?.txt"), "what_.txt");
    EXPECT_EQ(sanitize_filename("  padded.txt  "), "padded.txt");
}

TEST(ConfigValidationTest, SanitizeRefusesDotNames) {
    EXPECT_EQ(sanitize_filename(".."), "");
    EXPECT_EQ(sanitize_filename("."), "");
    EXPECT_EQ(sanitize_filename("dir/.."), "");
    EXPECT_EQ(sanitize_filename(""), "");
}

TEST(ConfigValidationTest, SanitizeTruncatesLongNames) {
    EXPECT_EQ(sanitize_filename(std::string(400, 'x')).size(), MAX_FILENAME_LENGTH);
}

// ============================================================================
// Path Safety Tests
// ============================================================================

class ConfigPathTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = std::filesystem::temp_directory_path() / "filemesh_config_test";
        std::filesystem::create_directories(base_ / "shared");
    }

    void TearDown() override {
        std::filesystem::remove_all(base_);
    }

    std::filesystem::path base_;
};

TEST_F(ConfigPathTest, AcceptsPathsInside) {
    EXPECT_TRUE(is_safe_path(base_ / "shared" / "a.txt", base_ / "shared"));
}

TEST_F(ConfigPathTest, RejectsTraversal) {
    EXPECT_FALSE(is_safe_path(base_ / "shared" / ".." / "a.txt", base_ / "shared"));
    EXPECT_FALSE(is_safe_path("/etc/passwd", base_ / "shared"));
}

TEST_F(ConfigPathTest, RejectsSiblingWithSharedPrefix) {
    EXPECT_FALSE(is_safe_path(base_ / "shared-other" / "a.txt", base_ / "shared"));
}

TEST_F(ConfigPathTest, DirectoryHelpersCreateSubdirectories) {
    EXPECT_TRUE(std::filesystem::is_directory(get_keys_directory(base_)));
    EXPECT_TRUE(std::filesystem::is_directory(get_shared_directory(base_)));
    EXPECT_EQ(get_keys_directory(base_).string(), (base_ / "keys").string());
}

// ============================================================================
// NodeConfig Tests
// ============================================================================

class NodeConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear_environment();
    }

    void TearDown() override {
        clear_environment();
    }

    static void clear_environment() {
        unsetenv("PORT");
        unsetenv("FILEMESH_DATA_DIR");
        unsetenv("FILEMESH_LOG_LEVEL");
        unsetenv("FILEMESH_LOG_FILE");
        unsetenv("FILEMESH_BOOTSTRAP");
    }
};

TEST_F(NodeConfigTest, Defaults) {
    NodeConfig config = NodeConfig::from_environment();

    EXPECT_EQ(config.http_port, DEFAULT_HTTP_PORT);
    EXPECT_EQ(config.beacon_port, BEACON_PORT);
    EXPECT_TRUE(config.data_dir.empty());
    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config.bootstrap_addresses.empty());
    EXPECT_EQ(config.max_dial_retries, MAX_DIAL_RETRIES);
}

TEST_F(NodeConfigTest, ReadsEnvironment) {
    setenv("PORT", "4100", 1);
    setenv("FILEMESH_DATA_DIR", "/tmp/fm-data", 1);
    setenv("FILEMESH_LOG_LEVEL", "debug", 1);
    setenv("FILEMESH_BOOTSTRAP", "/ip4/10.0.0.1/tcp/3000/p2p/nodeA, /ip4/10.0.0.2/tcp/3000/p2p/nodeB,", 1);

    NodeConfig config = NodeConfig::from_environment();

    EXPECT_EQ(config.http_port, 4100);
    EXPECT_EQ(config.data_dir.string(), "/tmp/fm-data");
    EXPECT_EQ(config.log_level, "debug");
    ASSERT_EQ(config.bootstrap_addresses.size(), 2u);
    EXPECT_EQ(config.bootstrap_addresses[1], "/ip4/10.0.0.2/tcp/3000/p2p/nodeB");
}

TEST_F(NodeConfigTest, InvalidPortInEnvironmentKeepsDefault) {
    setenv("PORT", "not-a-port", 1);
    EXPECT_EQ(NodeConfig::from_environment().http_port, DEFAULT_HTTP_PORT);

    setenv("PORT", "70000", 1);
    EXPECT_EQ(NodeConfig::from_environment().http_port, DEFAULT_HTTP_PORT);
}

TEST_F(NodeConfigTest, ArgumentsOverrideEnvironment) {
    setenv("PORT", "4100", 1);
    NodeConfig config = NodeConfig::from_environment();

    std::string error;
    ASSERT_TRUE(config.apply_arguments({"--port", "5000", "--beacon-port", "10002",
                                        "--log-level", "WARN", "--bootstrap", "/ip4/1.2.3.4/tcp/1/p2p/x",
                                        "--max-dial-retries", "2"}, error)) << error;

    EXPECT_EQ(config.http_port, 5000);
    EXPECT_EQ(config.beacon_port, 10002);
    EXPECT_EQ(config.log_level, "warn");
    EXPECT_EQ(config.bootstrap_addresses.size(), 1u);
    EXPECT_EQ(config.max_dial_retries, 2u);
}

TEST_F(NodeConfigTest, RejectsBadArguments) {
    NodeConfig config;
    std::string error;

    EXPECT_FALSE(config.apply_arguments({"--port"}, error));
    EXPECT_NE(error.find("Missing value"), std::string::npos);

    EXPECT_FALSE(config.apply_arguments({"--port", "0"}, error));
    EXPECT_FALSE(config.apply_arguments({"--port", "12ab"}, error));
    EXPECT_FALSE(config.apply_arguments({"--port", "-18446744073709486081"}, error));
    EXPECT_FALSE(config.apply_arguments({"--max-dial-retries", "0"}, error));
    EXPECT_FALSE(config.apply_arguments({"--max-dial-retries", "many"}, error));
    EXPECT_FALSE(config.apply_arguments({"--max-dial-retries", "-1"}, error));
    EXPECT_NE(error.find("Invalid retry count"), std::string::npos);
    EXPECT_FALSE(config.apply_arguments({"--max-dial-retries", "+3"}, error));
    EXPECT_FALSE(config.apply_arguments({"--max-dial-retries", " 3"}, error));
    EXPECT_EQ(config.max_dial_retries, MAX_DIAL_RETRIES);

    EXPECT_FALSE(config.apply_arguments({"--verbose", "yes"}, error));
    EXPECT_NE(error.find("Unknown option"), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
