/**
 * @file test_shared_file_store.cpp
 * @brief Unit tests for SharedFileStore
 *
 * Tests shared file storage including:
 * - Storing and reading files
 * - Filename sanitization on store
 * - Overwrite semantics
 * - Rejection of unsafe names on lookup
 */

#include <gtest/gtest.h>
#include "filemesh/shared_file_store.hpp"
#include <filesystem>
#include <fstream>
#include <memory>

using namespace filemesh;

class SharedFileStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "filemesh_store_test";
        std::filesystem::remove_all(root_);
        store_ = std::make_unique<SharedFileStore>(root_ / "shared");
        ASSERT_TRUE(store_->initialize());
    }

    void TearDown() override {
        store_.reset();
        std::filesystem::remove_all(root_);
    }

    std::filesystem::path root_;
    std::unique_ptr<SharedFileStore> store_;
};

// ============================================================================
// Store and Read Tests
// ============================================================================

TEST_F(SharedFileStoreTest, InitializeCreatesDirectory) {
    EXPECT_TRUE(std::filesystem::is_directory(root_ / "shared"));
    EXPECT_EQ(store_->directory().string(), (root_ / "shared").string());
    EXPECT_TRUE(store_->list().empty());
}

TEST_F(SharedFileStoreTest, StoreAndRead) {
    auto stored = store_->store("hello.txt", "hello world");

    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->filename, "hello.txt");
    EXPECT_EQ(stored->size, 11u);
    EXPECT_TRUE(store_->exists("hello.txt"));

    auto content = store_->read("hello.txt");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "hello world");
}

TEST_F(SharedFileStoreTest, BinaryContentSurvives) {
    std::string binary("a\0b\xff\x01", 5);
    ASSERT_TRUE(store_->store("blob.bin", binary).has_value());
    EXPECT_EQ(store_->read("blob.bin").value(), binary);
}

TEST_F(SharedFileStoreTest, StoreSanitizesName) {
    auto stored = store_->store("../../escape.txt", "x");

    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->filename, "escape.txt");
    EXPECT_TRUE(std::filesystem::exists(root_ / "shared" / "escape.txt"));
    EXPECT_FALSE(std::filesystem::exists(root_ / "escape.txt"));
}

TEST_F(SharedFileStoreTest, StoreRejectsUnusableNames) {
    EXPECT_FALSE(store_->store("", "x").has_value());
    EXPECT_FALSE(store_->store("..", "x").has_value());
    EXPECT_FALSE(store_->store("dir/", "x").has_value());
}

TEST_F(SharedFileStoreTest, SameNameOverwrites) {
    store_->store("a.txt", "first version");
    auto stored = store_->store("a.txt", "second");

    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->size, 6u);
    EXPECT_EQ(store_->read("a.txt").value(), "second");
    EXPECT_EQ(store_->list().size(), 1u);
}

// ============================================================================
// Lookup Tests
// ============================================================================

TEST_F(SharedFileStoreTest, MissingFile) {
    EXPECT_FALSE(store_->exists("missing.txt"));
    EXPECT_FALSE(store_->read("missing.txt").has_value());
}

TEST_F(SharedFileStoreTest, LookupRejectsTraversal) {
    std::ofstream(root_ / "secret.txt") << "secret";

    EXPECT_FALSE(store_->path_for("../secret.txt").has_value());
    EXPECT_FALSE(store_->exists("../secret.txt"));
    EXPECT_FALSE(store_->read("../secret.txt").has_value());
}

TEST_F(SharedFileStoreTest, DirectoriesAreNotFiles) {
    std::filesystem::create_directories(root_ / "shared" / "subdir");

    EXPECT_FALSE(store_->exists("subdir"));
    EXPECT_TRUE(store_->list().empty());
}

TEST_F(SharedFileStoreTest, ListIsSortedWithSizes) {
    store_->store("b.txt", "bb");
    store_->store("a.txt", "a");

    auto files = store_->list();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename, "a.txt");
    EXPECT_EQ(files[0].size, 1u);
    EXPECT_EQ(files[1].filename, "b.txt");
    EXPECT_EQ(files[1].size, 2u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
