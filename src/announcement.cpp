/**
 * @file announcement.cpp
 * @brief Implementation of the announcement JSON codec
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/announcement.hpp"
#include "filemesh/config.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using json = nlohmann::json;

namespace filemesh {

std::string FileAnnouncement::to_json() const {
    json j;
    j["type"] = FILE_AVAILABLE_TYPE;
    j["filename"] = filename;
    j["size"] = size;
    j["timestamp"] = timestamp;
    j["nodeId"] = node_id;

    // Invalid UTF-8 in a filename is replaced rather than thrown
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<FileAnnouncement> FileAnnouncement::from_json(const std::string& json_str) {
    DecodedAnnouncement decoded = decode_announcement(json_str);
    if (decoded.status != DecodeStatus::OK) {
        return std::nullopt;
    }
    return decoded.announcement;
}

DecodedAnnouncement decode_announcement(const std::string& raw) {
    DecodedAnnouncement result;

    if (raw.empty() || raw.size() > config::MAX_ANNOUNCEMENT_SIZE) {
        result.error = "payload size " + std::to_string(raw.size()) + " out of range";
        return result;
    }

    try {
        json j = json::parse(raw);

        if (!j.is_object()) {
            result.error = "payload is not a JSON object";
            return result;
        }

        if (!j.contains("type") || !j["type"].is_string()) {
            result.error = "missing type";
            return result;
        }

        result.type_name = j["type"].get<std::string>();
        if (result.type_name != FILE_AVAILABLE_TYPE) {
            result.status = DecodeStatus::UNKNOWN_TYPE;
            return result;
        }

        if (!j.contains("filename") || !j["filename"].is_string()) {
            result.error = "missing filename";
            return result;
        }

        FileAnnouncement announcement;
        announcement.filename = j["filename"].get<std::string>();

        // Names that would escape the shared directory are rejected outright
        if (announcement.filename.empty() ||
            config::sanitize_filename(announcement.filename) != announcement.filename) {
            result.error = "invalid filename";
            return result;
        }

        if (!j.contains("size") || !j["size"].is_number_integer() || j["size"].get<int64_t>() < 0) {
            result.error = "missing or negative size";
            return result;
        }
        announcement.size = j["size"].get<uint64_t>();

        // Out of range or negative timestamps are treated as absent
        if (j.contains("timestamp")) {
            const json& timestamp = j["timestamp"];
            if (timestamp.is_number_unsigned()) {
                announcement.timestamp = timestamp.get<uint64_t>();
            } else if (timestamp.is_number_float()) {
                double value = timestamp.get<double>();
                if (value > 0 &&
                    value < static_cast<double>(std::numeric_limits<uint64_t>::max())) {
                    announcement.timestamp = static_cast<uint64_t>(value);
                }
            }
        }

        if (j.contains("nodeId") && j["nodeId"].is_string()) {
            announcement.node_id = j["nodeId"].get<std::string>();
            if (!announcement.node_id.empty() &&
                !config::validate_identifier(announcement.node_id)) {
                result.error = "invalid nodeId";
                return result;
            }
        }

        result.announcement = std::move(announcement);
        result.status = DecodeStatus::OK;
        return result;

    } catch (const json::exception& e) {
        result.status = DecodeStatus::MALFORMED;
        result.error = e.what();
        return result;
    }
}

} // namespace filemesh
