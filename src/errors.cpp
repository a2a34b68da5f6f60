/**
 * @file errors.cpp
 * @brief Error kind names and HTTP status mapping
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/errors.hpp"

namespace filemesh {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::MALFORMED_MESSAGE: return "MALFORMED_MESSAGE";
        case ErrorKind::DIAL_FAILURE: return "DIAL_FAILURE";
        case ErrorKind::NOT_CONNECTED: return "NOT_CONNECTED";
        case ErrorKind::NOT_FOUND: return "NOT_FOUND";
        case ErrorKind::PUBLISH_FAILURE: return "PUBLISH_FAILURE";
        default: return "UNKNOWN";
    }
}

int error_kind_http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return 200;
        case ErrorKind::MALFORMED_MESSAGE: return 400;
        case ErrorKind::NOT_CONNECTED: return 404;
        case ErrorKind::NOT_FOUND: return 404;
        case ErrorKind::DIAL_FAILURE: return 500;
        case ErrorKind::PUBLISH_FAILURE: return 500;
        default: return 500;
    }
}

} // namespace filemesh
