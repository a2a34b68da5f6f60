/**
 * @file announcement.hpp
 * @brief File availability announcement and its JSON wire form
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Wire payload on the "file-share" topic:
 *   {"type":"file-available","filename":"a.txt","size":12,
 *    "timestamp":1700000000000,"nodeId":"..."}
 *
 * Unknown "type" values decode as UNKNOWN_TYPE and are ignored by receivers.
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace filemesh {

/// Wire name of the file availability announcement
constexpr const char* FILE_AVAILABLE_TYPE = "file-available";

/**
 * @brief Declaration that a node hosts a file
 */
struct FileAnnouncement {
    std::string filename;
    uint64_t size = 0;
    uint64_t timestamp = 0;     ///< ms since epoch (0 if the sender omitted it)
    std::string node_id;        ///< Origin node (may be empty on inbound)

    /**
     * @brief Serialize to the wire JSON object
     * @return JSON string including "type":"file-available"
     */
    std::string to_json() const;

    /**
     * @brief Deserialize a file-available payload
     * @param json JSON string
     * @return Announcement or std::nullopt if malformed or of another type
     */
    static std::optional<FileAnnouncement> from_json(const std::string& json);
};

/**
 * @brief Result class of decoding an inbound payload
 */
enum class DecodeStatus {
    OK,              ///< Valid file-available announcement
    UNKNOWN_TYPE,    ///< Well-formed object with an unrecognised type
    MALFORMED        ///< Not JSON, not an object, or invalid fields
};

/**
 * @brief Decoded inbound payload
 */
struct DecodedAnnouncement {
    DecodeStatus status = DecodeStatus::MALFORMED;
    std::string type_name;          ///< Value of "type" when present
    FileAnnouncement announcement;  ///< Valid only when status == OK
    std::string error;              ///< Reason when MALFORMED
};

/**
 * @brief Decode an untrusted payload without throwing
 * @param raw Raw payload bytes as received
 * @return Decoding result
 */
DecodedAnnouncement decode_announcement(const std::string& raw);

} // namespace filemesh
