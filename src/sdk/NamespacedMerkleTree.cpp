/**
 * @file NamespacedMerkleTree.cpp
 * @brief NMT root computation with preimage capture, and content reconstruction
 */

#include "celestiada/sdk/NamespacedMerkleTree.hpp"
#include "celestiada/sdk/Logger.hpp"
#include <openssl/sha.h>
#include <algorithm>

namespace celestiada {
namespace sdk {

namespace {

// Largest power of two strictly less than n (n > 1)
size_t split_point(size_t n) {
    size_t k = 1;
    while (k * 2 < n) {
        k *= 2;
    }
    return k;
}

} // namespace

NmtHasher::NmtHasher(size_t namespace_size, bool ignore_max_namespace)
    : namespace_size_(namespace_size),
      ignore_max_namespace_(ignore_max_namespace),
      max_namespace_(namespace_size, constants::MAX_NAMESPACE_BYTE) {
}

Hash32 NmtHasher::sha256(const ByteVector& data) {
    Hash32 digest;
    SHA256(data.data(), data.size(), digest.data());
    return digest;
}

Result<NmtHasher::HashStep> NmtHasher::hash_leaf(const ByteVector& share) const {
    if (share.size() < namespace_size_) {
        return {ErrorCode::INVALID_PARAMETER,
                "share of " + std::to_string(share.size()) + " bytes is shorter than its namespace"};
    }

    HashStep step;
    step.preimage.reserve(1 + share.size());
    step.preimage.push_back(constants::NMT_LEAF_PREFIX);
    step.preimage.insert(step.preimage.end(), share.begin(), share.end());
    step.digest = sha256(step.preimage);

    step.node.reserve(node_size());
    step.node.insert(step.node.end(), share.begin(), share.begin() + namespace_size_);
    step.node.insert(step.node.end(), share.begin(), share.begin() + namespace_size_);
    step.node.insert(step.node.end(), step.digest.begin(), step.digest.end());
    return step;
}

Result<NmtHasher::HashStep> NmtHasher::hash_node(const ByteVector& left, const ByteVector& right) const {
    if (left.size() != node_size() || right.size() != node_size()) {
        return {ErrorCode::INVALID_PARAMETER, "child node has the wrong size"};
    }

    const auto ns = static_cast<std::ptrdiff_t>(namespace_size_);
    ByteVector left_min(left.begin(), left.begin() + ns);
    ByteVector left_max(left.begin() + ns, left.begin() + 2 * ns);
    ByteVector right_min(right.begin(), right.begin() + ns);
    ByteVector right_max(right.begin() + ns, right.begin() + 2 * ns);

    if (left_max > right_min) {
        return {ErrorCode::INVALID_PARAMETER, "children are not in namespace order"};
    }

    const ByteVector& min_ns = std::min(left_min, right_min);
    ByteVector max_ns;
    if (ignore_max_namespace_ && left_min == max_namespace_) {
        max_ns = max_namespace_;
    } else if (ignore_max_namespace_ && right_min == max_namespace_) {
        max_ns = left_max;
    } else {
        max_ns = std::max(left_max, right_max);
    }

    HashStep step;
    step.preimage.reserve(1 + 2 * node_size());
    step.preimage.push_back(constants::NMT_NODE_PREFIX);
    step.preimage.insert(step.preimage.end(), left.begin(), left.end());
    step.preimage.insert(step.preimage.end(), right.begin(), right.end());
    step.digest = sha256(step.preimage);

    step.node.reserve(node_size());
    step.node.insert(step.node.end(), min_ns.begin(), min_ns.end());
    step.node.insert(step.node.end(), max_ns.begin(), max_ns.end());
    step.node.insert(step.node.end(), step.digest.begin(), step.digest.end());
    return step;
}

Result<ByteVector> NamespacedMerkleTree::compute_root(const ShareList& shares,
                                                      const PreimageRecorder& on_hash,
                                                      size_t namespace_size) {
    if (shares.empty()) {
        return {ErrorCode::INVALID_PARAMETER, "no shares to compute a root over"};
    }

    for (size_t i = 0; i < shares.size(); i++) {
        if (!shares[i].has_value()) {
            Logger::instance().warning("Cannot compute root of incomplete row: share " +
                                       std::to_string(i) + " is absent");
            return {ErrorCode::INCOMPLETE_INPUT,
                    "share " + std::to_string(i) + " of " + std::to_string(shares.size()) + " is absent"};
        }
    }

    NmtHasher hasher(namespace_size);
    std::vector<ByteVector> leaves;
    leaves.reserve(shares.size());

    const ByteVector* previous = nullptr;
    for (const auto& share : shares) {
        const ByteVector& data = share.value();

        // Namespaces must be pushed in non-decreasing order
        if (previous != nullptr && data.size() >= namespace_size &&
            std::lexicographical_compare(data.begin(), data.begin() + namespace_size,
                                         previous->begin(), previous->begin() + namespace_size)) {
            return {ErrorCode::INVALID_PARAMETER, "shares are not ordered by namespace"};
        }

        auto step = hasher.hash_leaf(data);
        if (step.is_err()) {
            return {step.error(), step.error_detail()};
        }

        auto recorded = on_hash(step.value().digest, step.value().preimage);
        if (recorded.is_err()) {
            return {recorded.error(), recorded.error_detail()};
        }

        leaves.push_back(std::move(step.value().node));
        previous = &data;
    }

    return build(hasher, leaves, 0, leaves.size(), on_hash);
}

Result<ByteVector> NamespacedMerkleTree::compute_root(const std::vector<ByteVector>& shares,
                                                      const PreimageRecorder& on_hash,
                                                      size_t namespace_size) {
    ShareList list(shares.begin(), shares.end());
    return compute_root(list, on_hash, namespace_size);
}

Result<ByteVector> NamespacedMerkleTree::build(const NmtHasher& hasher,
                                               const std::vector<ByteVector>& leaves,
                                               size_t begin, size_t end,
                                               const PreimageRecorder& on_hash) {
    if (end - begin == 1) {
        return leaves[begin];
    }

    size_t k = split_point(end - begin);

    auto left = build(hasher, leaves, begin, begin + k, on_hash);
    if (left.is_err()) {
        return left;
    }
    auto right = build(hasher, leaves, begin + k, end, on_hash);
    if (right.is_err()) {
        return right;
    }

    auto step = hasher.hash_node(left.value(), right.value());
    if (step.is_err()) {
        return {step.error(), step.error_detail()};
    }

    auto recorded = on_hash(step.value().digest, step.value().preimage);
    if (recorded.is_err()) {
        return {recorded.error(), recorded.error_detail()};
    }

    return std::move(step.value().node);
}

Result<std::vector<ByteVector>> NamespacedMerkleTree::reconstruct_content(const PreimageOracle& oracle,
                                                                          const ByteVector& root,
                                                                          size_t namespace_size) {
    std::vector<ByteVector> content;
    auto result = collect(oracle, root, namespace_size, content);
    if (result.is_err()) {
        return {result.error(), result.error_detail()};
    }
    return content;
}

Result<void> NamespacedMerkleTree::collect(const PreimageOracle& oracle,
                                           const ByteVector& node,
                                           size_t namespace_size,
                                           std::vector<ByteVector>& out) {
    const size_t node_size = 2 * namespace_size + constants::HASH_SIZE;
    if (node.size() != node_size) {
        return {ErrorCode::FORMAT_ERROR,
                "node of " + std::to_string(node.size()) + " bytes, expected " + std::to_string(node_size)};
    }

    const auto ns = static_cast<std::ptrdiff_t>(namespace_size);
    Hash32 digest;
    std::copy(node.begin() + 2 * ns, node.end(), digest.begin());

    auto preimage = oracle(digest);
    if (preimage.is_err()) {
        if (preimage.error() == ErrorCode::NOT_FOUND) {
            return {ErrorCode::MISSING_PREIMAGE, bytes_to_hex(digest)};
        }
        return {preimage.error(), preimage.error_detail()};
    }

    const ByteVector& data = preimage.value();
    if (data.empty()) {
        return {ErrorCode::FORMAT_ERROR, "empty preimage for " + bytes_to_hex(digest)};
    }

    // A leaf covers a single namespace and was hashed with the leaf prefix
    bool single_namespace = std::equal(node.begin(), node.begin() + ns, node.begin() + ns);
    if (single_namespace && data[0] == constants::NMT_LEAF_PREFIX) {
        out.emplace_back(data.begin() + 1, data.end());
        return ErrorCode::SUCCESS;
    }

    if (data[0] != constants::NMT_NODE_PREFIX || data.size() != 1 + 2 * node_size) {
        return {ErrorCode::FORMAT_ERROR, "malformed inner node preimage for " + bytes_to_hex(digest)};
    }

    ByteVector left(data.begin() + 1, data.begin() + 1 + node_size);
    ByteVector right(data.begin() + 1 + node_size, data.end());

    auto left_result = collect(oracle, left, namespace_size, out);
    if (left_result.is_err()) {
        return left_result;
    }
    return collect(oracle, right, namespace_size, out);
}

} // namespace sdk
} // namespace celestiada
