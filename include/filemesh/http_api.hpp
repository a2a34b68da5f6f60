/**
 * @file http_api.hpp
 * @brief HTTP boundary: share, network status and download endpoints
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Endpoints:
 * - POST /share                     multipart upload (field "file")
 * - GET  /network-status            nodes, current node, connected peers
 * - GET  /download/:nodeId/:filename
 *
 * Runs its own io_context on a dedicated thread. Every handler returns an
 * HttpResponse; nothing escapes a handler as an exception.
 */

#pragma once

#include "filemesh/announcement_bus.hpp"
#include "filemesh/http_request.hpp"
#include "filemesh/query_facade.hpp"
#include "filemesh/shared_file_store.hpp"

#include <asio.hpp>

#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace filemesh {

/**
 * @brief HttpApi - local HTTP server for the UI collaborator
 */
class HttpApi {
public:
    /**
     * @brief Construct API server
     * @param port TCP port (0 picks an ephemeral port)
     * @param local_node_id Id of this node (origin of shared files)
     * @param facade Read-only queries
     * @param bus Announcement publishing
     * @param store Shared directory
     * @param bind_address Listen address
     */
    HttpApi(uint16_t port,
            std::string local_node_id,
            QueryFacade& facade,
            AnnouncementBus& bus,
            SharedFileStore& store,
            std::string bind_address = "0.0.0.0");

    ~HttpApi();

    // Disable copy and move
    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;
    HttpApi(HttpApi&&) = delete;
    HttpApi& operator=(HttpApi&&) = delete;

    /**
     * @brief Bind, listen and start the server thread
     * @return false if already running or the port cannot be bound
     */
    bool start();

    /**
     * @brief Stop accepting, close connections and join the thread (idempotent)
     */
    void stop();

    /**
     * @brief Check if server is running
     */
    bool is_running() const;

    /**
     * @brief Bound port (valid after start())
     */
    uint16_t port() const;

    /**
     * @brief Idle timeout between reads on one connection (call before start())
     */
    void set_read_timeout(std::chrono::milliseconds timeout);

    /**
     * @brief Route a complete request to its handler
     * @param request Parsed request with body
     * @return Response (never throws)
     */
    HttpResponse handle(const HttpRequest& request);

private:
    uint16_t port_;
    std::string local_node_id_;
    QueryFacade& facade_;
    AnnouncementBus& bus_;
    SharedFileStore& store_;
    std::string bind_address_;

    asio::io_context io_context_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::thread server_thread_;
    std::atomic<bool> running_;
    std::chrono::milliseconds read_timeout_;

    void do_accept();

    HttpResponse route(const HttpRequest& request);
    HttpResponse handle_share(const HttpRequest& request);
    HttpResponse handle_network_status();
    HttpResponse handle_download(const std::string& node_id, const std::string& filename);

    /**
     * @brief 200 response with file bytes as an attachment
     */
    HttpResponse serve_file(const std::string& filename);
};

} // namespace filemesh
