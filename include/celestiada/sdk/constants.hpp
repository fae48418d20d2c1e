#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace celestiada {
namespace sdk {

/**
 * @brief Constants for the Celestia DA client
 */
namespace constants {
    // Namespaced Merkle tree
    constexpr size_t NAMESPACE_SIZE = 29;          // version byte + 28-byte id
    constexpr size_t NAMESPACE_VERSION_SIZE = 1;
    constexpr size_t NAMESPACE_ID_SIZE = 28;
    constexpr size_t NAMESPACE_V0_USER_ID_SIZE = 10; // user-chosen suffix of a v0 id
    constexpr size_t HASH_SIZE = 32;                 // SHA-256
    constexpr size_t NMT_NODE_SIZE = 2 * NAMESPACE_SIZE + HASH_SIZE;
    constexpr size_t SHARE_SIZE = 512;
    constexpr uint8_t NMT_LEAF_PREFIX = 0x00;
    constexpr uint8_t NMT_NODE_PREFIX = 0x01;
    constexpr uint8_t MAX_NAMESPACE_BYTE = 0xFF;

    // Framing flags, tested by containment (flag & header) != 0
    constexpr uint8_t CELESTIA_MESSAGE_HEADER_FLAG = 0x0c;
    constexpr uint8_t CELESTIA_STUB_MESSAGE_HEADER_FLAG = 0x02;

    // Blob pointer wire schema
    constexpr uint8_t BLOB_POINTER_VERSION = 0x01;
    constexpr size_t BLOB_POINTER_FIXED_SIZE = 1 + 8 + HASH_SIZE + HASH_SIZE;  // 73
    constexpr size_t BLOB_POINTER_EXTENSION_HEADER_SIZE = 6 * 8;                // 48

    // Timing constants
    constexpr auto DEFAULT_POLL_INTERVAL = std::chrono::seconds(5);

    // Size constants
    constexpr size_t MAX_LOG_FILE_SIZE = 10 * 1024 * 1024; // 10 MB

    // Path constants
    const std::string LOG_PATH = "/var/log/celestia-da/";
    const std::string DATA_DIR = "/daroot";
    const std::string CONFIG_FILE_PATH = "/etc/celestia-da/celestia_da.json";
}

} // namespace sdk
} // namespace celestiada
