/**
 * @file filemesh_node.hpp
 * @brief High-level node wiring directory, catalog, dialer, overlay and HTTP
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * FileMeshNode owns every component and drives them:
 * - Beacons from the overlay become DISCOVERED records and background dials
 * - file-share payloads are handed to the AnnouncementBus
 * - A maintenance loop re-announces presence, marks silent peers
 *   disconnected and re-dials peers whose suppression window has elapsed
 */

#pragma once

#include "filemesh/config.hpp"
#include "filemesh/node_identity.hpp"
#include "filemesh/peer_directory.hpp"
#include "filemesh/file_catalog.hpp"
#include "filemesh/shared_file_store.hpp"
#include "filemesh/dialer.hpp"
#include "filemesh/announcement_bus.hpp"
#include "filemesh/query_facade.hpp"
#include "filemesh/lan_overlay.hpp"
#include "filemesh/http_api.hpp"

#include <asio.hpp>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace filemesh {

/**
 * @brief FileMeshNode - one participating process
 */
class FileMeshNode {
public:
    /**
     * @brief Construct node (nothing is opened until start())
     * @param config Runtime configuration
     */
    explicit FileMeshNode(config::NodeConfig config);

    /**
     * @brief Destructor - stops the node if still running
     */
    ~FileMeshNode();

    // Disable copy and move
    FileMeshNode(const FileMeshNode&) = delete;
    FileMeshNode& operator=(const FileMeshNode&) = delete;
    FileMeshNode(FileMeshNode&&) = delete;
    FileMeshNode& operator=(FileMeshNode&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Create directories, load identity, start overlay and HTTP
     * @return true if the node is serving
     */
    bool start();

    /**
     * @brief Stop dialer, overlay and HTTP and join threads (idempotent)
     */
    void stop();

    /**
     * @brief Block running the maintenance loop until stop() is called
     */
    void run();

    bool is_running() const;

    // ========================================================================
    // Maintenance
    // ========================================================================

    /**
     * @brief One maintenance pass
     *
     * Marks connected peers silent for longer than the liveness timeout as
     * disconnected, re-dials dial candidates and prunes idle throttle buckets.
     *
     * @return Number of peers marked disconnected
     */
    size_t perform_maintenance();

    // ========================================================================
    // Accessors (valid after start())
    // ========================================================================

    std::string node_id() const;
    uint16_t http_port() const;
    const std::vector<std::string>& local_addresses() const;

    PeerDirectory* directory() { return directory_.get(); }
    FileCatalog* catalog() { return catalog_.get(); }
    QueryFacade* facade() { return facade_.get(); }

private:
    config::NodeConfig config_;
    std::filesystem::path data_dir_;
    std::optional<NodeIdentity> identity_;
    std::vector<std::string> local_addresses_;

    asio::io_context io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::thread event_thread_;

    std::unique_ptr<PeerDirectory> directory_;
    std::unique_ptr<FileCatalog> catalog_;
    std::unique_ptr<SharedFileStore> store_;
    std::unique_ptr<Dialer> dialer_;
    std::unique_ptr<AnnouncementBus> bus_;
    std::unique_ptr<QueryFacade> facade_;
    std::shared_ptr<LanOverlay> overlay_;
    std::unique_ptr<HttpApi> http_;

    std::atomic<bool> running_;
    std::mutex run_mutex_;
    std::condition_variable run_cv_;

    // ========================================================================
    // Initialization
    // ========================================================================

    bool initialize_data_directory();
    bool initialize_identity();
    bool initialize_subsystems();

    // ========================================================================
    // Event Handlers (event thread)
    // ========================================================================

    void handle_peer_discovered(const std::string& peer_id, const std::vector<std::string>& addresses);
    void handle_message(const std::string& from_peer_id, const std::string& topic, const std::string& data);
    void handle_dial_complete(const DialReport& report);

    /**
     * @brief Queue a background dial when the directory allows one
     */
    void schedule_dial(const std::string& peer_id, const std::vector<std::string>& addresses);

    /**
     * @brief Announce files already in the shared directory
     */
    void announce_existing_files();

    /**
     * @brief Feed configured bootstrap addresses in as discovery events
     */
    void dial_bootstrap_peers();
};

} // namespace filemesh
