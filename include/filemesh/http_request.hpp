/**
 * @file http_request.hpp
 * @brief Minimal HTTP/1.1 request/response model and multipart parsing
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Enough HTTP for the node's local API:
 * - Request line and header parsing (Content-Length bodies only)
 * - multipart/form-data body splitting
 * - Path segment splitting with percent-decoding
 * - Response serialization with Connection: close
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <utility>

namespace filemesh {

/**
 * @brief Parsed HTTP request
 */
struct HttpRequest {
    std::string method;
    std::string target;                          ///< Raw request target
    std::string path;                            ///< Target without query string
    std::string query;                           ///< Text after '?', if any
    std::string version;
    std::map<std::string, std::string> headers;  ///< Keys lower-cased
    std::string body;

    /**
     * @brief Header value by case-insensitive name
     */
    std::optional<std::string> header(const std::string& name) const;
};

/**
 * @brief HTTP response
 */
struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /**
     * @brief Response with a JSON body
     */
    static HttpResponse json(int status, const std::string& json_body);

    /**
     * @brief Response with body {"error": message}
     */
    static HttpResponse error(int status, const std::string& message);

    /**
     * @brief Serialize status line, headers (with Content-Length) and body
     */
    std::string serialize() const;
};

/**
 * @brief Reason phrase for a status code
 */
std::string http_status_text(int status);

/**
 * @brief Parse request line and headers
 * @param head Bytes up to and including the blank line
 * @param error Set to the reason on failure
 * @return Request without body, or std::nullopt if malformed
 */
std::optional<HttpRequest> parse_request_head(const std::string& head, std::string& error);

/**
 * @brief Declared body length
 * @return 0 if no Content-Length, std::nullopt if the header is invalid
 */
std::optional<size_t> declared_content_length(const HttpRequest& request);

/**
 * @brief Split a path into percent-decoded segments
 *
 * "/download/abc/my%20file.txt" -> {"download", "abc", "my file.txt"}
 *
 * @return Segments, or std::nullopt on invalid percent-encoding
 */
std::optional<std::vector<std::string>> split_path(const std::string& path);

/**
 * @brief One part of a multipart/form-data body
 */
struct MultipartPart {
    std::string name;           ///< Form field name
    std::string filename;       ///< Empty when the part is not a file
    bool has_filename = false;
    std::string content_type;
    std::string content;
};

/**
 * @brief Extract the boundary parameter of a multipart Content-Type
 * @return Boundary or std::nullopt if not multipart/form-data
 */
std::optional<std::string> multipart_boundary(const std::string& content_type);

/**
 * @brief Split a multipart/form-data body into parts
 * @return Parts, or std::nullopt if the body is not well formed
 */
std::optional<std::vector<MultipartPart>> parse_multipart(const std::string& body,
                                                          const std::string& boundary);

} // namespace filemesh
