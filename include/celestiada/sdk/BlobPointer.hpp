#pragma once

#include "types.hpp"
#include "constants.hpp"
#include <string>
#include <vector>

namespace celestiada {
namespace sdk {

/**
 * @brief Reference to a blob posted to Celestia, plus its Blobstream proof
 *
 * Wire layout (schema version 1, all integers little-endian):
 *
 *   version(1) | height(8) | commitment(32) | data_root(32)
 *   [ start(8) | share_count(8) | key(8) | num_leaves(8) | nonce(8)
 *     | side_node_count(8) | side_nodes(32 * count) ]
 *
 * The bracketed extension is written whenever the share range or the
 * proof is populated. A framed message prepends one header byte carrying
 * CELESTIA_MESSAGE_HEADER_FLAG.
 */
struct BlobPointer {
    uint64_t block_height = 0;
    uint64_t start = 0;
    uint64_t share_count = 0;
    Hash32 commitment{};
    Hash32 data_root{};

    // Data root inclusion proof, filled in by verify
    uint64_t key = 0;
    uint64_t num_leaves = 0;
    std::vector<Hash32> side_nodes;
    uint64_t nonce = 0;

    bool has_share_range() const { return share_count != 0 || start != 0; }
    bool has_proof() const { return num_leaves != 0 || !side_nodes.empty() || key != 0 || nonce != 0; }
    bool has_extension() const { return has_share_range() || has_proof(); }

    // key < num_leaves whenever a proof is attached
    Result<void> validate() const;

    // Encode the pointer record (no header byte)
    ByteVector encode() const;

    // Decode a pointer record (no header byte)
    static Result<BlobPointer> decode(const ByteVector& data);
    static Result<BlobPointer> decode(const uint8_t* data, size_t size);

    // Header byte followed by the encoded record
    ByteVector serialize() const;

    // Check the header byte, then decode the rest
    static Result<BlobPointer> deserialize(const ByteVector& framed);

    std::string to_string() const;

    bool operator==(const BlobPointer& other) const;
    bool operator!=(const BlobPointer& other) const { return !(*this == other); }
};

/**
 * @brief Whether a batch header byte marks a Celestia blob pointer
 */
inline bool is_celestia_message_header_byte(uint8_t header) {
    return (constants::CELESTIA_MESSAGE_HEADER_FLAG & header) != 0;
}

} // namespace sdk
} // namespace celestiada
