#pragma once

#include "types.hpp"
#include "constants.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace celestiada {
namespace sdk {

// Receives every digest the tree computes together with the exact bytes hashed
using PreimageRecorder = std::function<Result<void>(const Hash32& digest, const ByteVector& preimage)>;

// Resolves a digest back to its preimage; NOT_FOUND when the relation has no entry
using PreimageOracle = std::function<Result<ByteVector>(const Hash32& digest)>;

// A share list in which individual entries may be absent
using ShareList = std::vector<std::optional<ByteVector>>;

/**
 * @brief Namespace-aware SHA-256 hasher for NMT leaves and inner nodes
 *
 * A node is minNs || maxNs || digest. Every hash is returned together with the
 * record of what was hashed so the caller decides where the preimage goes.
 */
class NmtHasher {
public:
    struct HashStep {
        ByteVector node;     // minNs || maxNs || digest
        Hash32 digest{};
        ByteVector preimage; // prefix byte || hashed payload
    };

    explicit NmtHasher(size_t namespace_size = constants::NAMESPACE_SIZE,
                       bool ignore_max_namespace = true);

    // leaf = ns || ns || H(0x00 || share), ns being the share's namespace prefix
    Result<HashStep> hash_leaf(const ByteVector& share) const;

    // node = min || max || H(0x01 || left || right)
    Result<HashStep> hash_node(const ByteVector& left, const ByteVector& right) const;

    size_t namespace_size() const { return namespace_size_; }
    size_t node_size() const { return 2 * namespace_size_ + constants::HASH_SIZE; }

    static Hash32 sha256(const ByteVector& data);

private:
    size_t namespace_size_;
    bool ignore_max_namespace_;
    ByteVector max_namespace_;
};

/**
 * @brief Stateless NMT engine
 *
 * The tree is never materialized: compute_root hands every (digest, preimage)
 * pair to a recorder and keeps only the root, and reconstruct_content walks
 * the implicit tree back down through an oracle keyed by digest.
 */
class NamespacedMerkleTree {
public:
    /**
     * @brief Compute the namespaced root over ordered shares
     * @param shares Shares in namespace order; every entry must be present
     * @param on_hash Invoked once per computed digest with its preimage
     * @param namespace_size Namespace prefix length of each share
     * @return minNs || maxNs || hash, or INCOMPLETE_INPUT if any share is absent
     */
    static Result<ByteVector> compute_root(const ShareList& shares,
                                           const PreimageRecorder& on_hash,
                                           size_t namespace_size = constants::NAMESPACE_SIZE);

    static Result<ByteVector> compute_root(const std::vector<ByteVector>& shares,
                                           const PreimageRecorder& on_hash,
                                           size_t namespace_size = constants::NAMESPACE_SIZE);

    /**
     * @brief Recover the ordered leaf payloads below a root
     * @param oracle Digest to preimage lookup
     * @param root minNs || maxNs || hash as returned by compute_root
     * @return Leaf data (namespace prefix included), left to right.
     *         MISSING_PREIMAGE names the first digest the oracle could not resolve.
     */
    static Result<std::vector<ByteVector>> reconstruct_content(const PreimageOracle& oracle,
                                                               const ByteVector& root,
                                                               size_t namespace_size = constants::NAMESPACE_SIZE);

private:
    static Result<ByteVector> build(const NmtHasher& hasher,
                                    const std::vector<ByteVector>& leaves,
                                    size_t begin, size_t end,
                                    const PreimageRecorder& on_hash);

    static Result<void> collect(const PreimageOracle& oracle,
                                const ByteVector& node,
                                size_t namespace_size,
                                std::vector<ByteVector>& out);
};

} // namespace sdk
} // namespace celestiada
