/**
 * @file BlobPointer.cpp
 * @brief Wire codec for blob pointers
 */

#include "celestiada/sdk/BlobPointer.hpp"
#include <algorithm>
#include <sstream>

namespace celestiada {
namespace sdk {

namespace {

void put_u64(ByteVector& out, uint64_t value) {
    for (int i = 0; i < 8; i++) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

uint64_t get_u64(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; i--) {
        value = (value << 8) | data[i];
    }
    return value;
}

} // namespace

Result<void> BlobPointer::validate() const {
    if (num_leaves != 0 && key >= num_leaves) {
        return {ErrorCode::FORMAT_ERROR,
                "proof key " + std::to_string(key) + " out of range for " +
                std::to_string(num_leaves) + " leaves"};
    }
    if (num_leaves == 0 && key != 0) {
        return {ErrorCode::FORMAT_ERROR,
                "proof key " + std::to_string(key) + " present without a leaf count"};
    }
    if (num_leaves == 0 && !side_nodes.empty()) {
        return {ErrorCode::FORMAT_ERROR, "side nodes present without a leaf count"};
    }
    return ErrorCode::SUCCESS;
}

ByteVector BlobPointer::encode() const {
    ByteVector result;
    result.reserve(constants::BLOB_POINTER_FIXED_SIZE +
                   (has_extension() ? constants::BLOB_POINTER_EXTENSION_HEADER_SIZE +
                                      side_nodes.size() * constants::HASH_SIZE : 0));

    // Fixed section
    result.push_back(constants::BLOB_POINTER_VERSION);
    put_u64(result, block_height);
    result.insert(result.end(), commitment.begin(), commitment.end());
    result.insert(result.end(), data_root.begin(), data_root.end());

    if (!has_extension()) {
        return result;
    }

    // Extension section
    put_u64(result, start);
    put_u64(result, share_count);
    put_u64(result, key);
    put_u64(result, num_leaves);
    put_u64(result, nonce);
    put_u64(result, static_cast<uint64_t>(side_nodes.size()));
    for (const auto& node : side_nodes) {
        result.insert(result.end(), node.begin(), node.end());
    }

    return result;
}

Result<BlobPointer> BlobPointer::decode(const ByteVector& data) {
    return decode(data.data(), data.size());
}

Result<BlobPointer> BlobPointer::decode(const uint8_t* data, size_t size) {
    if (size < constants::BLOB_POINTER_FIXED_SIZE) {
        return {ErrorCode::FORMAT_ERROR,
                "blob pointer too short: " + std::to_string(size) + " bytes"};
    }

    if (data[0] != constants::BLOB_POINTER_VERSION) {
        return {ErrorCode::FORMAT_ERROR,
                "unsupported blob pointer version " + std::to_string(static_cast<int>(data[0]))};
    }

    BlobPointer pointer;
    size_t pos = 1;

    pointer.block_height = get_u64(data + pos);
    pos += 8;

    std::copy(data + pos, data + pos + constants::HASH_SIZE, pointer.commitment.begin());
    pos += constants::HASH_SIZE;

    std::copy(data + pos, data + pos + constants::HASH_SIZE, pointer.data_root.begin());
    pos += constants::HASH_SIZE;

    if (pos == size) {
        return pointer;
    }

    // Extension section
    if (size - pos < constants::BLOB_POINTER_EXTENSION_HEADER_SIZE) {
        return {ErrorCode::FORMAT_ERROR, "truncated blob pointer extension"};
    }

    pointer.start = get_u64(data + pos);
    pos += 8;
    pointer.share_count = get_u64(data + pos);
    pos += 8;
    pointer.key = get_u64(data + pos);
    pos += 8;
    pointer.num_leaves = get_u64(data + pos);
    pos += 8;
    pointer.nonce = get_u64(data + pos);
    pos += 8;
    uint64_t side_node_count = get_u64(data + pos);
    pos += 8;

    // Compare by division so a hostile count cannot overflow the multiplication
    size_t remaining = size - pos;
    if (side_node_count > remaining / constants::HASH_SIZE) {
        return {ErrorCode::FORMAT_ERROR,
                "side node section declares " + std::to_string(side_node_count) +
                " nodes but only " + std::to_string(remaining) + " bytes remain"};
    }
    if (remaining != side_node_count * constants::HASH_SIZE) {
        return {ErrorCode::FORMAT_ERROR, "trailing bytes after blob pointer"};
    }

    pointer.side_nodes.resize(static_cast<size_t>(side_node_count));
    for (auto& node : pointer.side_nodes) {
        std::copy(data + pos, data + pos + constants::HASH_SIZE, node.begin());
        pos += constants::HASH_SIZE;
    }

    auto valid = pointer.validate();
    if (valid.is_err()) {
        return {valid.error(), valid.error_detail()};
    }

    return pointer;
}

ByteVector BlobPointer::serialize() const {
    ByteVector result;
    result.push_back(constants::CELESTIA_MESSAGE_HEADER_FLAG);

    ByteVector record = encode();
    result.insert(result.end(), record.begin(), record.end());
    return result;
}

Result<BlobPointer> BlobPointer::deserialize(const ByteVector& framed) {
    if (framed.empty()) {
        return {ErrorCode::FORMAT_ERROR, "empty message"};
    }
    if (!is_celestia_message_header_byte(framed[0])) {
        return {ErrorCode::FORMAT_ERROR, "header byte does not mark a Celestia blob pointer"};
    }
    return decode(framed.data() + 1, framed.size() - 1);
}

std::string BlobPointer::to_string() const {
    std::stringstream ss;
    ss << "BlobPointer{height=" << block_height
       << " start=" << start
       << " shares=" << share_count
       << " commitment=" << bytes_to_hex(commitment)
       << " data_root=" << bytes_to_hex(data_root);
    if (has_proof()) {
        ss << " key=" << key
           << " num_leaves=" << num_leaves
           << " side_nodes=" << side_nodes.size()
           << " nonce=" << nonce;
    }
    ss << "}";
    return ss.str();
}

bool BlobPointer::operator==(const BlobPointer& other) const {
    return block_height == other.block_height &&
           start == other.start &&
           share_count == other.share_count &&
           commitment == other.commitment &&
           data_root == other.data_root &&
           key == other.key &&
           num_leaves == other.num_leaves &&
           side_nodes == other.side_nodes &&
           nonce == other.nonce;
}

} // namespace sdk
} // namespace celestiada
