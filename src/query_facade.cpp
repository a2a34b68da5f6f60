/**
 * @file query_facade.cpp
 * @brief Implementation of the read-only query facade
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/query_facade.hpp"
#include "filemesh/utilities.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>
#include <set>

using json = nlohmann::json;

namespace filemesh {

using namespace filemesh::utilities;

// ============================================================================
// NetworkStatus
// ============================================================================

std::string NetworkStatus::to_json() const {
    json nodes_json = json::array();

    for (const auto& node : nodes) {
        json entry;
        entry["id"] = node.id;
        entry["address"] = node.addresses;
        entry["files"] = node.files;
        entry["lastSeen"] = node.last_seen;
        entry["isLocal"] = node.is_local;
        entry["isConnected"] = node.is_connected;
        nodes_json.push_back(std::move(entry));
    }

    json j;
    j["nodes"] = std::move(nodes_json);
    j["currentNode"] = current_node;
    j["connectedPeers"] = connected_peers;

    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string resolution_kind_to_string(ResolutionKind kind) {
    switch (kind) {
        case ResolutionKind::LOCAL: return "LOCAL";
        case ResolutionKind::REMOTE: return "REMOTE";
        case ResolutionKind::NOT_CONNECTED: return "NOT_CONNECTED";
        case ResolutionKind::NOT_FOUND: return "NOT_FOUND";
        default: return "UNKNOWN";
    }
}

ErrorKind DownloadResolution::error() const {
    switch (kind) {
        case ResolutionKind::LOCAL:
        case ResolutionKind::REMOTE:
            return ErrorKind::NONE;
        case ResolutionKind::NOT_CONNECTED:
            return ErrorKind::NOT_CONNECTED;
        default:
            return ErrorKind::NOT_FOUND;
    }
}

// ============================================================================
// QueryFacade
// ============================================================================

QueryFacade::QueryFacade(const PeerDirectory& directory,
                         const FileCatalog& catalog,
                         const SharedFileStore& store)
    : directory_(directory)
    , catalog_(catalog)
    , store_(store)
{
}

NetworkStatus QueryFacade::network_status() const {
    NetworkStatus status;
    status.current_node = directory_.local_node_id();

    std::vector<NodeRecord> records = directory_.snapshot();
    std::vector<FileEntry> entries = catalog_.list_files();

    for (const auto& record : records) {
        NodeView view;
        view.id = record.id;
        view.addresses = record.addresses;
        view.last_seen = record.last_seen;
        view.is_local = record.is_local;
        view.is_connected = !record.is_local && record.status == NodeStatus::CONNECTED;

        // Catalog hosting records can arrive before the node's own record
        std::set<std::string> files = record.files;
        for (const auto& entry : entries) {
            if (entry.hosting_peers.count(record.id) > 0) {
                files.insert(entry.filename);
            }
        }
        view.files.assign(files.begin(), files.end());

        if (view.is_connected) {
            status.connected_peers.push_back(record.id);
        }

        status.nodes.push_back(std::move(view));
    }

    // Hosts known only through announcements have no directory record yet
    std::map<std::string, std::set<std::string>> catalog_only;
    for (const auto& entry : entries) {
        for (const auto& [peer_id, announced_at] : entry.hosting_peers) {
            bool known = std::any_of(records.begin(), records.end(),
                [&peer_id](const NodeRecord& record) { return record.id == peer_id; });
            if (!known) {
                catalog_only[peer_id].insert(entry.filename);
            }
        }
    }

    for (const auto& [peer_id, files] : catalog_only) {
        NodeView view;
        view.id = peer_id;
        view.files.assign(files.begin(), files.end());
        status.nodes.push_back(std::move(view));
    }

    return status;
}

DownloadResolution QueryFacade::resolve_download_target(const std::string& node_id,
                                                        const std::string& filename) const {
    DownloadResolution resolution;
    resolution.node_id = node_id;
    resolution.filename = filename;

    if (node_id == directory_.local_node_id()) {
        auto path = store_.path_for(filename);
        if (path && store_.exists(filename)) {
            resolution.kind = ResolutionKind::LOCAL;
            resolution.local_path = *path;
        } else {
            resolution.kind = ResolutionKind::NOT_FOUND;
        }
        return resolution;
    }

    auto record = directory_.get(node_id);
    if (!record || record->status != NodeStatus::CONNECTED) {
        log_debug("QueryFacade: " + node_id + " is not connected");
        resolution.kind = ResolutionKind::NOT_CONNECTED;
        return resolution;
    }

    bool hosts = record->files.count(filename) > 0 || catalog_.is_hosted_by(filename, node_id);
    if (!hosts) {
        resolution.kind = ResolutionKind::NOT_FOUND;
        return resolution;
    }

    resolution.kind = ResolutionKind::REMOTE;
    resolution.addresses = record->addresses;
    return resolution;
}

} // namespace filemesh
