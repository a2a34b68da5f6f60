/**
 * @file filemesh_node.cpp
 * @brief Implementation of the FileMesh node orchestrator
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/filemesh_node.hpp"
#include "filemesh/errors.hpp"
#include "filemesh/utilities.hpp"

#include <chrono>

namespace filemesh {

using namespace filemesh::utilities;

// ============================================================================
// Constructor and Destructor
// ============================================================================

FileMeshNode::FileMeshNode(config::NodeConfig config)
    : config_(std::move(config))
    , running_(false)
{
    log_info("FileMeshNode: Initializing node");
}

FileMeshNode::~FileMeshNode() {
    if (running_) {
        log_warn("FileMeshNode: Destructor called while still running, forcing stop");
    }
    stop();
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool FileMeshNode::start() {
    if (running_) {
        log_warn("FileMeshNode: Already running");
        return false;
    }

    log_info("FileMeshNode: Starting node...");

    try {
        if (!initialize_data_directory()) {
            log_error("FileMeshNode: Failed to initialize data directory");
            return false;
        }

        if (!initialize_identity()) {
            log_error("FileMeshNode: Failed to initialize identity");
            return false;
        }

        if (!initialize_subsystems()) {
            log_error("FileMeshNode: Failed to initialize subsystems");
            return false;
        }

        io_context_.restart();

        // Keep the event thread alive between datagrams
        work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            io_context_.get_executor()
        );

        event_thread_ = std::thread([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                log_error("FileMeshNode: Event thread exception: " + std::string(e.what()));
            }
        });

        running_ = true;

        if (!overlay_->start()) {
            log_error("FileMeshNode: Failed to start LAN overlay");
            stop();
            return false;
        }

        if (!http_->start()) {
            log_error("FileMeshNode: Failed to start HTTP API");
            stop();
            return false;
        }

        local_addresses_ = {"/ip4/0.0.0.0/tcp/" + std::to_string(http_->port())};
        directory_->set_local_addresses(local_addresses_);

        overlay_->announce_presence(local_addresses_);
        announce_existing_files();
        dial_bootstrap_peers();

        log_info("FileMeshNode: Node " + identity_->node_id() + " started, HTTP on port " +
                 std::to_string(http_->port()));
        return true;

    } catch (const std::exception& e) {
        log_error("FileMeshNode: Exception during start: " + std::string(e.what()));
        stop();
        return false;
    }
}

void FileMeshNode::stop() {
    bool was_running = false;
    {
        // Held so the wakeup cannot fall between run()'s check and its wait
        std::lock_guard<std::mutex> lock(run_mutex_);
        was_running = running_.exchange(false);
    }
    run_cv_.notify_all();

    if (dialer_) {
        dialer_->shutdown();
    }

    if (overlay_) {
        overlay_->stop();
    }

    if (http_) {
        http_->stop();
    }

    work_guard_.reset();
    io_context_.stop();

    if (event_thread_.joinable()) {
        event_thread_.join();
    }

    if (was_running) {
        log_info("FileMeshNode: Stopped");
    }
}

void FileMeshNode::run() {
    if (!running_) {
        log_error("FileMeshNode: Cannot run - not started");
        return;
    }

    log_info("FileMeshNode: Entering maintenance loop (Ctrl+C to stop)");

    auto last_maintenance = std::chrono::steady_clock::now();

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(run_mutex_);
            run_cv_.wait_for(lock, config::ANNOUNCE_INTERVAL, [this]() { return !running_; });
        }

        if (!running_) {
            break;
        }

        try {
            overlay_->announce_presence(local_addresses_);

            auto now = std::chrono::steady_clock::now();
            if (now - last_maintenance >= config::MAINTENANCE_INTERVAL) {
                last_maintenance = now;

                size_t disconnected = perform_maintenance();
                if (disconnected > 0) {
                    log_info("FileMeshNode: Marked " + std::to_string(disconnected) + " silent peers disconnected");
                }
            }

        } catch (const std::exception& e) {
            log_error("FileMeshNode: Exception in maintenance loop: " + std::string(e.what()));
        }
    }

    log_info("FileMeshNode: Exited maintenance loop");
}

bool FileMeshNode::is_running() const {
    return running_;
}

// ============================================================================
// Maintenance
// ============================================================================

size_t FileMeshNode::perform_maintenance() {
    size_t disconnected = 0;

    for (const auto& peer_id : directory_->stale_connected_peers(config::PEER_LIVENESS_TIMEOUT)) {
        PeerEvent event;
        event.type = PeerEventType::DISCONNECTED;
        event.peer_id = peer_id;

        if (directory_->apply(event)) {
            log_info("FileMeshNode: Peer " + peer_id + " went silent, marked disconnected");
            disconnected++;
        }
    }

    for (const auto& record : directory_->dial_candidates()) {
        schedule_dial(record.id, record.addresses);
    }

    size_t pruned = bus_->prune_throttle();
    if (pruned > 0) {
        log_debug("FileMeshNode: Pruned " + std::to_string(pruned) + " idle throttle buckets");
    }

    return disconnected;
}

// ============================================================================
// Accessors
// ============================================================================

std::string FileMeshNode::node_id() const {
    return identity_ ? identity_->node_id() : std::string();
}

uint16_t FileMeshNode::http_port() const {
    return http_ ? http_->port() : config_.http_port;
}

const std::vector<std::string>& FileMeshNode::local_addresses() const {
    return local_addresses_;
}

// ============================================================================
// Private Methods - Initialization
// ============================================================================

bool FileMeshNode::initialize_data_directory() {
    try {
        data_dir_ = config_.data_dir.empty() ? config::get_data_directory() : config_.data_dir;

        if (!std::filesystem::exists(data_dir_)) {
            std::filesystem::create_directories(data_dir_);
            log_info("FileMeshNode: Created data directory: " + data_dir_.string());
        }

        config::get_keys_directory(data_dir_);
        config::get_shared_directory(data_dir_);
        return true;

    } catch (const std::exception& e) {
        log_error("FileMeshNode: Failed to initialize data directory: " + std::string(e.what()));
        return false;
    }
}

bool FileMeshNode::initialize_identity() {
    identity_ = NodeIdentity::load_or_create(config::get_keys_directory(data_dir_));
    if (!identity_) {
        return false;
    }

    log_info("FileMeshNode: Identity initialized for " + identity_->node_id());
    return true;
}

bool FileMeshNode::initialize_subsystems() {
    try {
        const std::string& node_id = identity_->node_id();

        directory_ = std::make_unique<PeerDirectory>(node_id);
        catalog_ = std::make_unique<FileCatalog>();

        store_ = std::make_unique<SharedFileStore>(config::get_shared_directory(data_dir_));
        if (!store_->initialize()) {
            return false;
        }

        DialPolicy policy;
        dialer_ = std::make_unique<Dialer>(*directory_, std::make_shared<TcpDialTransport>(), policy);

        overlay_ = std::make_shared<LanOverlay>(node_id, io_context_, config_.beacon_port);
        overlay_->subscribe(config::FILE_SHARE_TOPIC);
        overlay_->subscribe(config::PEER_DISCOVERY_TOPIC);

        overlay_->set_discovery_callback(
            [this](const std::string& peer_id, const std::vector<std::string>& addresses) {
                handle_peer_discovered(peer_id, addresses);
            });

        overlay_->set_message_callback(
            [this](const std::string& from, const std::string& topic, const std::string& data) {
                handle_message(from, topic, data);
            });

        bus_ = std::make_unique<AnnouncementBus>(*directory_, *catalog_, overlay_);
        facade_ = std::make_unique<QueryFacade>(*directory_, *catalog_, *store_);
        http_ = std::make_unique<HttpApi>(config_.http_port, node_id, *facade_, *bus_, *store_);

        log_info("FileMeshNode: Subsystems initialized");
        return true;

    } catch (const std::exception& e) {
        log_error("FileMeshNode: Failed to initialize subsystems: " + std::string(e.what()));
        return false;
    }
}

// ============================================================================
// Private Methods - Event Handlers
// ============================================================================

void FileMeshNode::handle_peer_discovered(const std::string& peer_id, const std::vector<std::string>& addresses) {
    PeerEvent event;
    event.type = PeerEventType::DISCOVERED;
    event.peer_id = peer_id;
    event.addresses = addresses;

    if (!directory_->apply(event)) {
        return;
    }

    auto record = directory_->get(peer_id);
    if (record && record->status == NodeStatus::DISCOVERED) {
        schedule_dial(peer_id, record->addresses);
    }
}

void FileMeshNode::handle_message(const std::string& from_peer_id,
                                  const std::string& topic,
                                  const std::string& data) {
    if (topic != config::FILE_SHARE_TOPIC) {
        directory_->touch(from_peer_id);
        return;
    }

    ReceiveResult result = bus_->on_announcement_received(from_peer_id, data);
    if (result.status == ReceiveStatus::APPLIED) {
        log_info("FileMeshNode: " + result.hosting_peer + " shares " + result.filename);
    }
}

void FileMeshNode::handle_dial_complete(const DialReport& report) {
    switch (report.outcome) {
        case DialOutcome::CONNECTED:
            log_info("FileMeshNode: Connected to " + report.peer_id + " via " + report.address);
            break;
        case DialOutcome::FAILED:
            log_warn("FileMeshNode: Could not reach " + report.peer_id + " after " +
                     std::to_string(report.rounds) + " rounds: " + report.error);
            break;
        default:
            log_debug("FileMeshNode: Dial to " + report.peer_id + " " + dial_outcome_to_string(report.outcome));
            break;
    }
}

void FileMeshNode::schedule_dial(const std::string& peer_id, const std::vector<std::string>& addresses) {
    if (!running_ || directory_->is_dial_suppressed(peer_id)) {
        return;
    }

    dialer_->dial_async(peer_id, addresses, config_.max_dial_retries,
                        [this](const DialReport& report) { handle_dial_complete(report); });
}

void FileMeshNode::announce_existing_files() {
    for (const auto& file : store_->list()) {
        PublishResult result = bus_->publish_file_available(file.filename, file.size, identity_->node_id());
        if (!result.ok()) {
            log_warn("FileMeshNode: Failed to announce existing file " + file.filename + ": " +
                     error_kind_to_string(result.error));
        }
    }
}

void FileMeshNode::dial_bootstrap_peers() {
    for (const auto& multiaddr : config_.bootstrap_addresses) {
        auto parsed = LanOverlay::parse_bootstrap(multiaddr);
        if (!parsed) {
            log_warn("FileMeshNode: Ignoring bootstrap address without /p2p/ peer id: " + multiaddr);
            continue;
        }

        std::string peer_id = parsed->first;
        std::string address = parsed->second;
        asio::post(io_context_, [this, peer_id, address]() {
            handle_peer_discovered(peer_id, {address});
        });
    }
}

} // namespace filemesh
