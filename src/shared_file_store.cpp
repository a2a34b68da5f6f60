/**
 * @file shared_file_store.cpp
 * @brief Implementation of the shared file store
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/shared_file_store.hpp"
#include "filemesh/config.hpp"
#include "filemesh/utilities.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace filemesh {

using namespace filemesh::utilities;

SharedFileStore::SharedFileStore(std::filesystem::path directory)
    : directory_(std::move(directory))
{
}

bool SharedFileStore::initialize() {
    try {
        if (!std::filesystem::exists(directory_)) {
            std::filesystem::create_directories(directory_);
            log_info("SharedFileStore: Created " + directory_.string());
        }
        return std::filesystem::is_directory(directory_);

    } catch (const std::filesystem::filesystem_error& e) {
        log_error("SharedFileStore: Cannot create " + directory_.string() + ": " + e.what());
        return false;
    }
}

std::optional<StoredFile> SharedFileStore::store(const std::string& filename, const std::string& content) {
    std::string safe_name = config::sanitize_filename(filename);
    if (safe_name.empty()) {
        log_warn("SharedFileStore: Rejected filename '" + filename + "'");
        return std::nullopt;
    }

    auto path = path_for(safe_name);
    if (!path) {
        log_warn("SharedFileStore: Unsafe path for '" + safe_name + "'");
        return std::nullopt;
    }

    try {
        std::ofstream file(*path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            log_error("SharedFileStore: Failed to open " + path->string() + " for writing");
            return std::nullopt;
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();

        if (!file) {
            log_error("SharedFileStore: Failed to write " + path->string());
            return std::nullopt;
        }

    } catch (const std::exception& e) {
        log_error("SharedFileStore: Exception writing " + safe_name + ": " + e.what());
        return std::nullopt;
    }

    log_info("SharedFileStore: Stored " + safe_name + " (" + format_file_size(content.size()) + ")");
    return StoredFile{safe_name, static_cast<uint64_t>(content.size())};
}

bool SharedFileStore::exists(const std::string& filename) const {
    auto path = path_for(filename);
    if (!path) {
        return false;
    }

    std::error_code ec;
    return std::filesystem::is_regular_file(*path, ec);
}

std::optional<std::filesystem::path> SharedFileStore::path_for(const std::string& filename) const {
    if (filename.empty() || config::sanitize_filename(filename) != filename) {
        return std::nullopt;
    }

    std::filesystem::path path = directory_ / filename;
    if (!config::is_safe_path(path, directory_)) {
        return std::nullopt;
    }

    return path;
}

std::optional<std::string> SharedFileStore::read(const std::string& filename) const {
    auto path = path_for(filename);
    if (!path) {
        return std::nullopt;
    }

    try {
        std::ifstream file(*path, std::ios::binary);
        if (!file.is_open()) {
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            log_error("SharedFileStore: Failed to read " + path->string());
            return std::nullopt;
        }

        return content;

    } catch (const std::exception& e) {
        log_error("SharedFileStore: Exception reading " + filename + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<StoredFile> SharedFileStore::list() const {
    std::vector<StoredFile> files;

    try {
        if (!std::filesystem::is_directory(directory_)) {
            return files;
        }

        for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            files.push_back({entry.path().filename().string(), static_cast<uint64_t>(entry.file_size())});
        }

    } catch (const std::filesystem::filesystem_error& e) {
        log_error("SharedFileStore: Cannot list " + directory_.string() + ": " + e.what());
    }

    std::sort(files.begin(), files.end(),
        [](const StoredFile& a, const StoredFile& b) { return a.filename < b.filename; });

    return files;
}

const std::filesystem::path& SharedFileStore::directory() const {
    return directory_;
}

} // namespace filemesh
