/**
 * @file errors.hpp
 * @brief Error kinds surfaced by the coordination layer
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Internal failures (parse errors, unknown peers) are absorbed and logged.
 * Caller-facing operations translate them into one of these kinds.
 */

#pragma once

#include <string>

namespace filemesh {

/**
 * @brief Error kinds returned to the HTTP boundary and callers
 */
enum class ErrorKind {
    NONE,                ///< No error
    MALFORMED_MESSAGE,   ///< Bad announcement payload (logged, dropped)
    DIAL_FAILURE,        ///< Connect attempt failed (recorded on the node)
    NOT_CONNECTED,       ///< Target node known but not connected
    NOT_FOUND,           ///< Unknown node or missing file
    PUBLISH_FAILURE      ///< Outbound announcement channel failed
};

/**
 * @brief Convert ErrorKind to string
 * @param kind Error kind
 * @return Upper-case name (e.g., "NOT_FOUND")
 */
std::string error_kind_to_string(ErrorKind kind);

/**
 * @brief HTTP status class for an error kind
 * @param kind Error kind
 * @return 200 for NONE, 404 for lookup failures, 400 for malformed input, 500 otherwise
 */
int error_kind_http_status(ErrorKind kind);

} // namespace filemesh
