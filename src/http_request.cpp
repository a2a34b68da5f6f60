/**
 * @file http_request.cpp
 * @brief Implementation of HTTP request parsing and multipart splitting
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/http_request.hpp"
#include "filemesh/utilities.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

namespace filemesh {

using namespace filemesh::utilities;

namespace {

/**
 * @brief Split "a=1; b=\"x;y\"" on ';' outside double quotes
 */
std::vector<std::string> split_header_params(const std::string& value) {
    std::vector<std::string> params;
    std::string current;
    bool in_quotes = false;

    for (char c : value) {
        if (c == '"') {
            in_quotes = !in_quotes;
            current += c;
        } else if (c == ';' && !in_quotes) {
            params.push_back(trim_string(current));
            current.clear();
        } else {
            current += c;
        }
    }

    if (!trim_string(current).empty()) {
        params.push_back(trim_string(current));
    }

    return params;
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

/**
 * @brief Parse "Name: value" lines into a lower-cased map
 */
bool parse_header_lines(const std::vector<std::string>& lines,
                        size_t first,
                        std::map<std::string, std::string>& headers) {
    for (size_t i = first; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.empty()) {
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }

        std::string name = to_lowercase(trim_string(line.substr(0, colon)));
        std::string value = trim_string(line.substr(colon + 1));
        headers[name] = value;
    }
    return true;
}

std::vector<std::string> split_crlf_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;

    while (start <= text.size()) {
        size_t end = text.find("\r\n", start);
        if (end == std::string::npos) {
            if (start < text.size()) {
                lines.push_back(text.substr(start));
            }
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 2;
    }

    return lines;
}

} // namespace

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

std::optional<std::string> HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lowercase(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

HttpResponse HttpResponse::json(int status, const std::string& json_body) {
    HttpResponse response;
    response.status = status;
    response.headers.emplace_back("Content-Type", "application/json; charset=utf-8");
    response.body = json_body;
    return response;
}

HttpResponse HttpResponse::error(int status, const std::string& message) {
    nlohmann::json j;
    j["error"] = message;
    return json(status, j.dump());
}

std::string HttpResponse::serialize() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << http_status_text(status) << "\r\n";

    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }

    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";
    oss << "\r\n";
    oss << body;

    return oss.str();
}

std::string http_status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

// ============================================================================
// Request Parsing
// ============================================================================

std::optional<HttpRequest> parse_request_head(const std::string& head, std::string& error) {
    std::vector<std::string> lines = split_crlf_lines(head);
    if (lines.empty() || lines[0].empty()) {
        error = "empty request";
        return std::nullopt;
    }

    std::istringstream request_line(lines[0]);
    HttpRequest request;
    std::string extra;

    if (!(request_line >> request.method >> request.target >> request.version) || (request_line >> extra)) {
        error = "malformed request line";
        return std::nullopt;
    }

    if (!starts_with(request.version, "HTTP/1.")) {
        error = "unsupported version " + request.version;
        return std::nullopt;
    }

    if (request.target.empty() || request.target[0] != '/') {
        error = "unsupported request target";
        return std::nullopt;
    }

    auto query_start = request.target.find('?');
    request.path = request.target.substr(0, query_start);
    if (query_start != std::string::npos) {
        request.query = request.target.substr(query_start + 1);
    }

    if (!parse_header_lines(lines, 1, request.headers)) {
        error = "malformed header line";
        return std::nullopt;
    }

    return request;
}

std::optional<size_t> declared_content_length(const HttpRequest& request) {
    auto value = request.header("content-length");
    if (!value) {
        return size_t{0};
    }

    if (value->empty() || value->find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    try {
        return static_cast<size_t>(std::stoull(*value));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::vector<std::string>> split_path(const std::string& path) {
    std::vector<std::string> segments;

    for (const auto& raw : split_string(path, '/')) {
        if (raw.empty()) {
            continue;
        }

        auto decoded = url_decode(raw);
        if (!decoded) {
            return std::nullopt;
        }
        segments.push_back(*decoded);
    }

    return segments;
}

// ============================================================================
// Multipart
// ============================================================================

std::optional<std::string> multipart_boundary(const std::string& content_type) {
    auto params = split_header_params(content_type);
    if (params.empty() || to_lowercase(params[0]) != "multipart/form-data") {
        return std::nullopt;
    }

    for (size_t i = 1; i < params.size(); ++i) {
        auto eq = params[i].find('=');
        if (eq == std::string::npos) {
            continue;
        }

        if (to_lowercase(trim_string(params[i].substr(0, eq))) == "boundary") {
            std::string boundary = unquote(trim_string(params[i].substr(eq + 1)));
            if (boundary.empty() || boundary.size() > 70) {
                return std::nullopt;
            }
            return boundary;
        }
    }

    return std::nullopt;
}

std::optional<std::vector<MultipartPart>> parse_multipart(const std::string& body,
                                                          const std::string& boundary) {
    const std::string delimiter = "--" + boundary;
    const std::string separator = "\r\n" + delimiter;

    std::vector<MultipartPart> parts;

    size_t pos = body.find(delimiter);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    pos += delimiter.size();

    while (true) {
        if (body.compare(pos, 2, "--") == 0) {
            return parts;
        }

        if (body.compare(pos, 2, "\r\n") != 0) {
            return std::nullopt;
        }
        pos += 2;

        size_t header_end = body.find("\r\n\r\n", pos);
        if (header_end == std::string::npos) {
            return std::nullopt;
        }

        std::map<std::string, std::string> headers;
        if (!parse_header_lines(split_crlf_lines(body.substr(pos, header_end - pos)), 0, headers)) {
            return std::nullopt;
        }

        size_t content_start = header_end + 4;
        size_t next = body.find(separator, content_start);
        if (next == std::string::npos) {
            return std::nullopt;
        }

        MultipartPart part;
        part.content = body.substr(content_start, next - content_start);

        auto type_it = headers.find("content-type");
        if (type_it != headers.end()) {
            part.content_type = type_it->second;
        }

        auto disposition_it = headers.find("content-disposition");
        if (disposition_it != headers.end()) {
            for (const auto& param : split_header_params(disposition_it->second)) {
                auto eq = param.find('=');
                if (eq == std::string::npos) {
                    continue;
                }

                std::string key = to_lowercase(trim_string(param.substr(0, eq)));
                std::string value = unquote(trim_string(param.substr(eq + 1)));

                if (key == "name") {
                    part.name = value;
                } else if (key == "filename") {
                    part.filename = value;
                    part.has_filename = true;
                }
            }
        }

        parts.push_back(std::move(part));
        pos = next + separator.size();
    }
}

} // namespace filemesh
