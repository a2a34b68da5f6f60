/**
 * @file query_facade.hpp
 * @brief Read-only views over directory and catalog for the HTTP boundary
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "filemesh/errors.hpp"
#include "filemesh/file_catalog.hpp"
#include "filemesh/peer_directory.hpp"
#include "filemesh/shared_file_store.hpp"

#include <string>
#include <vector>
#include <filesystem>

namespace filemesh {

/**
 * @brief One node as shown by the network status endpoint
 */
struct NodeView {
    std::string id;
    std::vector<std::string> addresses;
    std::vector<std::string> files;
    uint64_t last_seen = 0;
    bool is_local = false;
    bool is_connected = false;
};

/**
 * @brief Network status response
 */
struct NetworkStatus {
    std::vector<NodeView> nodes;
    std::string current_node;
    std::vector<std::string> connected_peers;

    /**
     * @brief Serialize as {nodes:[{id,address,files,lastSeen,isLocal,isConnected}],
     *        currentNode, connectedPeers}
     */
    std::string to_json() const;
};

/**
 * @brief Classification of a download target
 */
enum class ResolutionKind {
    LOCAL,          ///< Local node, file present in the shared directory
    REMOTE,         ///< Connected remote node that hosts the file
    NOT_CONNECTED,  ///< Remote node not currently connected
    NOT_FOUND       ///< File missing locally or not hosted by the node
};

/**
 * @brief Convert ResolutionKind to string
 */
std::string resolution_kind_to_string(ResolutionKind kind);

/**
 * @brief Result of resolve_download_target()
 */
struct DownloadResolution {
    ResolutionKind kind = ResolutionKind::NOT_FOUND;
    std::string node_id;
    std::string filename;
    std::filesystem::path local_path;   ///< Set for LOCAL
    std::vector<std::string> addresses; ///< Set for REMOTE

    /**
     * @brief Error kind for the boundary (NONE for LOCAL and REMOTE)
     */
    ErrorKind error() const;
};

/**
 * @brief QueryFacade - composes point-in-time copies for readers
 *
 * Never mutates state and never dials.
 */
class QueryFacade {
public:
    QueryFacade(const PeerDirectory& directory,
                const FileCatalog& catalog,
                const SharedFileStore& store);

    /**
     * @brief Build the network status from one directory snapshot
     */
    NetworkStatus network_status() const;

    /**
     * @brief Decide where a download for (node_id, filename) would be served from
     */
    DownloadResolution resolve_download_target(const std::string& node_id,
                                               const std::string& filename) const;

private:
    const PeerDirectory& directory_;
    const FileCatalog& catalog_;
    const SharedFileStore& store_;
};

} // namespace filemesh
