/**
 * @file shared_file_store.hpp
 * @brief Flat directory holding the files this node shares
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Files are keyed by their sanitised original name. Storing a name that
 * already exists overwrites it (no versioning).
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace filemesh {

/**
 * @brief A file present in the shared directory
 */
struct StoredFile {
    std::string filename;
    uint64_t size = 0;
};

/**
 * @brief SharedFileStore - storage collaborator for shared files
 */
class SharedFileStore {
public:
    /**
     * @brief Construct store over a directory
     * @param directory Shared directory (created by initialize())
     */
    explicit SharedFileStore(std::filesystem::path directory);

    /**
     * @brief Create the directory if missing
     * @return true if the directory exists afterwards
     */
    bool initialize();

    /**
     * @brief Write a file, overwriting any existing one with the same name
     * @param filename Original filename (sanitised before use)
     * @param content File bytes
     * @return Stored name and size, or std::nullopt on invalid name or I/O failure
     */
    std::optional<StoredFile> store(const std::string& filename, const std::string& content);

    /**
     * @brief Check whether a regular file with this exact name exists
     */
    bool exists(const std::string& filename) const;

    /**
     * @brief Path for a filename inside the store
     * @return std::nullopt if the name is not a plain, safe filename
     */
    std::optional<std::filesystem::path> path_for(const std::string& filename) const;

    /**
     * @brief Read a stored file
     * @return File bytes or std::nullopt if missing or unreadable
     */
    std::optional<std::string> read(const std::string& filename) const;

    /**
     * @brief All regular files in the store, ordered by name
     */
    std::vector<StoredFile> list() const;

    /**
     * @brief Store directory
     */
    const std::filesystem::path& directory() const;

private:
    std::filesystem::path directory_;
};

} // namespace filemesh
