/**
 * @file node_identity.cpp
 * @brief Implementation of the persistent node identity
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "filemesh/node_identity.hpp"
#include "filemesh/utilities.hpp"

#include <fstream>

namespace filemesh {

using namespace filemesh::utilities;

namespace {
    constexpr size_t NODE_ID_DIGEST_BYTES = 16;
    constexpr const char* KEY_FILE_NAME = "node.key";
}

// ============================================================================
// Construction
// ============================================================================

NodeIdentity::NodeIdentity(const PublicKey& public_key, const SecretKey& secret_key)
    : public_key_(public_key)
    , secret_key_(secret_key)
    , node_id_(derive_node_id(public_key))
{
}

bool NodeIdentity::initialize_crypto() {
    return sodium_init() >= 0;
}

std::optional<NodeIdentity> NodeIdentity::generate() {
    if (!initialize_crypto()) {
        log_critical("NodeIdentity: libsodium initialization failed");
        return std::nullopt;
    }

    PublicKey public_key;
    SecretKey secret_key;
    crypto_sign_keypair(public_key.data(), secret_key.data());

    return NodeIdentity(public_key, secret_key);
}

std::string NodeIdentity::derive_node_id(const PublicKey& public_key) {
    std::array<uint8_t, NODE_ID_DIGEST_BYTES> digest;
    crypto_generichash(digest.data(), digest.size(),
                       public_key.data(), public_key.size(),
                       nullptr, 0);

    std::string hex(digest.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    hex.resize(digest.size() * 2);
    return hex;
}

// ============================================================================
// Persistent Storage
// ============================================================================

std::optional<NodeIdentity> NodeIdentity::load(const std::filesystem::path& key_file) {
    if (!initialize_crypto()) {
        return std::nullopt;
    }

    try {
        if (!std::filesystem::exists(key_file)) {
            return std::nullopt;
        }

        if (std::filesystem::file_size(key_file) != crypto_sign_PUBLICKEYBYTES + crypto_sign_SECRETKEYBYTES) {
            log_error("NodeIdentity: Key file has wrong size: " + key_file.string());
            return std::nullopt;
        }

        std::ifstream file(key_file, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }

        PublicKey public_key;
        SecretKey secret_key;
        file.read(reinterpret_cast<char*>(public_key.data()), public_key.size());
        file.read(reinterpret_cast<char*>(secret_key.data()), secret_key.size());
        if (!file) {
            log_error("NodeIdentity: Failed to read " + key_file.string());
            return std::nullopt;
        }

        // The secret key embeds the public key; a mismatch means a corrupt file
        PublicKey embedded;
        crypto_sign_ed25519_sk_to_pk(embedded.data(), secret_key.data());
        if (sodium_memcmp(embedded.data(), public_key.data(), public_key.size()) != 0) {
            log_error("NodeIdentity: Key file is inconsistent: " + key_file.string());
            sodium_memzero(secret_key.data(), secret_key.size());
            return std::nullopt;
        }

        NodeIdentity identity(public_key, secret_key);
        sodium_memzero(secret_key.data(), secret_key.size());
        return identity;

    } catch (const std::exception& e) {
        log_error("NodeIdentity: Failed to load " + key_file.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool NodeIdentity::save(const std::filesystem::path& key_file) const {
    try {
        if (key_file.has_parent_path() && !std::filesystem::exists(key_file.parent_path())) {
            std::filesystem::create_directories(key_file.parent_path());
        }

        std::ofstream file(key_file, std::ios::binary | std::ios::trunc);
        if (!file) {
            log_error("NodeIdentity: Cannot write " + key_file.string());
            return false;
        }

        file.write(reinterpret_cast<const char*>(public_key_.data()), public_key_.size());
        file.write(reinterpret_cast<const char*>(secret_key_.data()), secret_key_.size());
        file.close();

        if (!file) {
            log_error("NodeIdentity: Failed to write " + key_file.string());
            return false;
        }

#ifndef _WIN32
        std::filesystem::permissions(key_file,
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace);
#endif

        return true;

    } catch (const std::exception& e) {
        log_error("NodeIdentity: Failed to save " + key_file.string() + ": " + e.what());
        return false;
    }
}

std::optional<NodeIdentity> NodeIdentity::load_or_create(const std::filesystem::path& keys_dir) {
    std::filesystem::path key_file = keys_dir / KEY_FILE_NAME;

    auto identity = load(key_file);
    if (identity) {
        log_info("NodeIdentity: Loaded node id " + identity->node_id());
        return identity;
    }

    std::error_code ec;
    if (std::filesystem::exists(key_file, ec)) {
        // Never overwrite an existing identity that failed to load
        log_error("NodeIdentity: Refusing to replace unreadable " + key_file.string());
        return std::nullopt;
    }

    identity = generate();
    if (!identity) {
        return std::nullopt;
    }

    if (!identity->save(key_file)) {
        return std::nullopt;
    }

    log_info("NodeIdentity: Generated node id " + identity->node_id());
    return identity;
}

} // namespace filemesh
