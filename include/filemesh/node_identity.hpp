/**
 * @file node_identity.hpp
 * @brief Persistent Ed25519 node identity
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Ed25519 keypair generated with libsodium on first start
 * - Stored as public key || secret key in keys/node.key (owner-only)
 * - Node id = lowercase hex of a 16-byte BLAKE2b digest of the public key
 */

#pragma once

#include <sodium.h>

#include <array>
#include <string>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace filemesh {

/// Ed25519 public key
using PublicKey = std::array<uint8_t, crypto_sign_PUBLICKEYBYTES>;

/// Ed25519 secret key (seed || public key)
using SecretKey = std::array<uint8_t, crypto_sign_SECRETKEYBYTES>;

/**
 * @brief NodeIdentity - keypair and derived node id
 */
class NodeIdentity {
public:
    /**
     * @brief Initialize libsodium (safe to call repeatedly)
     * @return false if libsodium cannot be initialized
     */
    static bool initialize_crypto();

    /**
     * @brief Generate a fresh identity
     * @return Identity or std::nullopt if libsodium is unavailable
     */
    static std::optional<NodeIdentity> generate();

    /**
     * @brief Load identity from a key file
     * @return Identity or std::nullopt if missing, truncated or inconsistent
     */
    static std::optional<NodeIdentity> load(const std::filesystem::path& key_file);

    /**
     * @brief Load keys/node.key, or generate and save it on first start
     * @param keys_dir Directory holding node.key
     * @return Identity or std::nullopt if neither load nor create succeeded
     */
    static std::optional<NodeIdentity> load_or_create(const std::filesystem::path& keys_dir);

    /**
     * @brief Write the key file with owner-only permissions
     * @return true on success
     */
    bool save(const std::filesystem::path& key_file) const;

    /**
     * @brief Derive a node id from a public key
     */
    static std::string derive_node_id(const PublicKey& public_key);

    /**
     * @brief Node identifier
     */
    const std::string& node_id() const { return node_id_; }

    /**
     * @brief Ed25519 public key
     */
    const PublicKey& public_key() const { return public_key_; }

private:
    NodeIdentity(const PublicKey& public_key, const SecretKey& secret_key);

    PublicKey public_key_;
    SecretKey secret_key_;
    std::string node_id_;
};

} // namespace filemesh
