/**
 * @file http_api.cpp
 * @brief Implementation of the HTTP boundary
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/http_api.hpp"
#include "filemesh/config.hpp"
#include "filemesh/utilities.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <functional>

using json = nlohmann::json;

namespace filemesh {

using namespace filemesh::utilities;

namespace {

/**
 * @brief One HTTP exchange: read head, read body, respond, close
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    HttpSession(asio::ip::tcp::socket socket, Handler handler, std::chrono::milliseconds read_timeout)
        : socket_(std::move(socket))
        , timer_(socket_.get_executor())
        , head_buffer_(config::MAX_HTTP_HEADER_SIZE)
        , handler_(std::move(handler))
        , read_timeout_(read_timeout)
        , body_received_(0)
    {
    }

    void start() {
        arm_timer();
        read_head();
    }

private:
    /// Body bytes requested per read; the idle timer restarts after each one
    static constexpr size_t BODY_CHUNK_SIZE = 64 * 1024;

    asio::ip::tcp::socket socket_;
    asio::steady_timer timer_;
    asio::streambuf head_buffer_;
    HttpRequest request_;
    std::string response_data_;
    Handler handler_;
    std::chrono::milliseconds read_timeout_;
    size_t body_received_;

    // Restarting the timer cancels the pending wait
    void arm_timer() {
        auto self = shared_from_this();

        timer_.expires_after(read_timeout_);
        timer_.async_wait([self](const asio::error_code& error) {
            if (!error) {
                log_debug("HttpApi: Closing idle connection");
                self->close();
            }
        });
    }

    void read_head() {
        auto self = shared_from_this();

        asio::async_read_until(socket_, head_buffer_, "\r\n\r\n",
            [self](const asio::error_code& error, std::size_t bytes_transferred) {
                self->on_head(error, bytes_transferred);
            });
    }

    void on_head(const asio::error_code& error, std::size_t head_size) {
        if (error == asio::error::not_found) {
            respond(HttpResponse::error(431, "Request headers too large"));
            return;
        }
        if (error) {
            close();
            return;
        }

        auto begin = asio::buffers_begin(head_buffer_.data());
        std::string head(begin, begin + static_cast<std::ptrdiff_t>(head_size));
        head_buffer_.consume(head_size);

        std::string parse_error;
        auto request = parse_request_head(head, parse_error);
        if (!request) {
            log_warn("HttpApi: Bad request: " + parse_error);
            respond(HttpResponse::error(400, "Bad request"));
            return;
        }
        request_ = std::move(*request);

        if (request_.header("transfer-encoding")) {
            respond(HttpResponse::error(411, "Content-Length required"));
            return;
        }

        auto length = declared_content_length(request_);
        if (!length) {
            respond(HttpResponse::error(400, "Invalid Content-Length"));
            return;
        }

        if (*length > config::MAX_UPLOAD_SIZE + config::MAX_HTTP_HEADER_SIZE) {
            respond(HttpResponse::error(413, "File too large"));
            return;
        }

        // Bytes read past the blank line belong to the body
        auto leftover = asio::buffers_begin(head_buffer_.data());
        size_t available = std::min(head_buffer_.size(), *length);
        request_.body.assign(leftover, leftover + static_cast<std::ptrdiff_t>(available));
        head_buffer_.consume(available);

        if (request_.body.size() == *length) {
            dispatch();
            return;
        }

        body_received_ = request_.body.size();
        request_.body.resize(*length);
        arm_timer();
        read_body();
    }

    void read_body() {
        size_t remaining = request_.body.size() - body_received_;
        auto self = shared_from_this();

        socket_.async_read_some(
            asio::buffer(&request_.body[body_received_], std::min(remaining, BODY_CHUNK_SIZE)),
            [self](const asio::error_code& read_error, std::size_t bytes_transferred) {
                if (read_error) {
                    self->close();
                    return;
                }

                self->body_received_ += bytes_transferred;
                if (self->body_received_ == self->request_.body.size()) {
                    self->dispatch();
                    return;
                }

                self->arm_timer();
                self->read_body();
            });
    }

    void dispatch() {
        respond(handler_(request_));
    }

    void respond(const HttpResponse& response) {
        response_data_ = response.serialize();

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(response_data_),
            [self](const asio::error_code&, std::size_t) {
                self->close();
            });
    }

    void close() {
        asio::error_code ignored;
        timer_.cancel();
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
};

std::string content_disposition(const std::string& filename) {
    std::string escaped;
    for (char c : filename) {
        if (c == '"' || c == '\\') {
            escaped += '\\';
            escaped += c;
        } else if (c != '\r' && c != '\n') {
            escaped += c;
        }
    }
    return "attachment; filename=\"" + escaped + "\"";
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

HttpApi::HttpApi(uint16_t port,
                 std::string local_node_id,
                 QueryFacade& facade,
                 AnnouncementBus& bus,
                 SharedFileStore& store,
                 std::string bind_address)
    : port_(port)
    , local_node_id_(std::move(local_node_id))
    , facade_(facade)
    , bus_(bus)
    , store_(store)
    , bind_address_(std::move(bind_address))
    , io_context_()
    , acceptor_(nullptr)
    , running_(false)
    , read_timeout_(config::HTTP_READ_TIMEOUT)
{
}

HttpApi::~HttpApi() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool HttpApi::start() {
    if (running_.exchange(true)) {
        log_warn("HttpApi: Already running");
        return false;
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(bind_address_), port_);

        acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(io_context_);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();

        port_ = acceptor_->local_endpoint().port();

    } catch (const std::exception& e) {
        log_error("HttpApi: Failed to listen on " + bind_address_ + ":" + std::to_string(port_) +
                  ": " + e.what());
        acceptor_.reset();
        running_ = false;
        return false;
    }

    do_accept();

    server_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            log_error("HttpApi: Server loop failed: " + std::string(e.what()));
        }
    });

    log_info("HttpApi: HTTP server listening on port " + std::to_string(port_));
    return true;
}

void HttpApi::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    io_context_.stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    if (acceptor_) {
        asio::error_code ignored;
        acceptor_->close(ignored);
    }

    log_info("HttpApi: Stopped");
}

bool HttpApi::is_running() const {
    return running_;
}

uint16_t HttpApi::port() const {
    return port_;
}

void HttpApi::set_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout_ = timeout;
}

void HttpApi::do_accept() {
    acceptor_->async_accept([this](const asio::error_code& error, asio::ip::tcp::socket socket) {
        if (!running_) {
            return;
        }

        if (!error) {
            std::make_shared<HttpSession>(std::move(socket),
                [this](const HttpRequest& request) { return handle(request); },
                read_timeout_)->start();
        } else {
            log_warn("HttpApi: Accept failed: " + error.message());
        }

        do_accept();
    });
}

// ============================================================================
// Routing
// ============================================================================

HttpResponse HttpApi::handle(const HttpRequest& request) {
    try {
        HttpResponse response = route(request);
        log_debug("HttpApi: " + request.method + " " + request.path + " -> " +
                  std::to_string(response.status));
        return response;
    } catch (const std::exception& e) {
        log_error("HttpApi: Handler for " + request.path + " failed: " + e.what());
        return HttpResponse::error(500, "Internal server error");
    }
}

HttpResponse HttpApi::route(const HttpRequest& request) {
    auto segments = split_path(request.path);
    if (!segments) {
        return HttpResponse::error(400, "Invalid path encoding");
    }

    const auto& parts = *segments;

    if (parts.size() == 1 && parts[0] == "share") {
        if (request.method != "POST") {
            HttpResponse response = HttpResponse::error(405, "Method not allowed");
            response.headers.emplace_back("Allow", "POST");
            return response;
        }
        return handle_share(request);
    }

    if (parts.size() == 1 && parts[0] == "network-status") {
        if (request.method != "GET") {
            HttpResponse response = HttpResponse::error(405, "Method not allowed");
            response.headers.emplace_back("Allow", "GET");
            return response;
        }
        return handle_network_status();
    }

    if (parts.size() == 3 && parts[0] == "download") {
        if (request.method != "GET") {
            HttpResponse response = HttpResponse::error(405, "Method not allowed");
            response.headers.emplace_back("Allow", "GET");
            return response;
        }
        return handle_download(parts[1], parts[2]);
    }

    return HttpResponse::error(404, "Not found");
}

// ============================================================================
// Handlers
// ============================================================================

HttpResponse HttpApi::handle_share(const HttpRequest& request) {
    auto content_type = request.header("content-type");
    auto boundary = content_type ? multipart_boundary(*content_type) : std::nullopt;
    if (!boundary) {
        return HttpResponse::error(400, "No file uploaded");
    }

    auto parts = parse_multipart(request.body, *boundary);
    if (!parts) {
        log_warn("HttpApi: Malformed multipart body");
        return HttpResponse::error(400, "Malformed multipart body");
    }

    const MultipartPart* upload = nullptr;
    for (const auto& part : *parts) {
        if (part.name == "file" && part.has_filename && !part.filename.empty()) {
            upload = &part;
            break;
        }
    }

    if (!upload) {
        return HttpResponse::error(400, "No file uploaded");
    }

    if (upload->content.size() > config::MAX_UPLOAD_SIZE) {
        return HttpResponse::error(413, "File too large");
    }

    auto stored = store_.store(upload->filename, upload->content);
    if (!stored) {
        return HttpResponse::error(500, "Failed to store file");
    }

    PublishResult result = bus_.publish_file_available(stored->filename, stored->size, local_node_id_);
    if (!result.ok()) {
        log_error("HttpApi: Error publishing file info for " + stored->filename + ": " +
                  error_kind_to_string(result.error));
        return HttpResponse::error(error_kind_http_status(result.error), "Failed to announce file");
    }

    json body;
    body["message"] = "File shared successfully";
    body["fileInfo"] = json::parse(result.announcement.to_json());

    return HttpResponse::json(200, body.dump(-1, ' ', false, json::error_handler_t::replace));
}

HttpResponse HttpApi::handle_network_status() {
    return HttpResponse::json(200, facade_.network_status().to_json());
}

HttpResponse HttpApi::handle_download(const std::string& node_id, const std::string& filename) {
    DownloadResolution resolution = facade_.resolve_download_target(node_id, filename);

    switch (resolution.kind) {
        case ResolutionKind::LOCAL:
            return serve_file(filename);

        case ResolutionKind::REMOTE:
            // Chunk transfer is not implemented; only a local replica can be served
            if (store_.exists(filename)) {
                return serve_file(filename);
            }
            return HttpResponse::error(404, "File not found");

        case ResolutionKind::NOT_CONNECTED:
            return HttpResponse::error(error_kind_http_status(resolution.error()), "Node not connected");

        case ResolutionKind::NOT_FOUND:
        default:
            return HttpResponse::error(error_kind_http_status(resolution.error()), "File not found");
    }
}

HttpResponse HttpApi::serve_file(const std::string& filename) {
    auto content = store_.read(filename);
    if (!content) {
        log_error("HttpApi: Error downloading file " + filename);
        return HttpResponse::error(500, "Failed to download file");
    }

    HttpResponse response;
    response.status = 200;
    response.headers.emplace_back("Content-Type", "application/octet-stream");
    response.headers.emplace_back("Content-Disposition", content_disposition(filename));
    response.body = std::move(*content);
    return response;
}

} // namespace filemesh
