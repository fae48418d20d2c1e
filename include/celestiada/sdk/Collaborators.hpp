/**
 * @file Collaborators.hpp
 * @brief Interfaces to the Celestia node, the consensus RPC and the Blobstream contract
 *
 * Transports live outside this library. Every call receives the caller's
 * cancellation token and reports transport failures as TRANSPORT_ERROR.
 */

#pragma once

#include "types.hpp"
#include "Namespace.hpp"
#include "CancellationToken.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace celestiada {
namespace sdk {

// Half-open range of share indexes [start, end) covered by one row proof
struct ShareRange {
    uint64_t start = 0;
    uint64_t end = 0;
};

struct ExtendedHeader {
    uint64_t height = 0;
    Hash32 data_root{};
    std::vector<ByteVector> row_roots;
    std::vector<ByteVector> column_roots;
};

/**
 * @brief Erasure-coded share matrix of one block
 */
class ExtendedDataSquare {
public:
    virtual ~ExtendedDataSquare() = default;

    // Extended width (twice the original square width)
    virtual uint64_t width() const = 0;

    virtual std::vector<ByteVector> row(uint64_t index) const = 0;
};

// Blobstream leaf: a (height, data root) pair
struct DataRootTuple {
    uint64_t height = 0;
    Hash32 data_root{};
};

struct BinaryMerkleProof {
    std::vector<Hash32> side_nodes;
    uint64_t key = 0;
    uint64_t num_leaves = 0;
};

/**
 * @brief Inclusion of a block's data root in a data commitment range
 *
 * nonce is the Blobstream attestation nonce of the commitment covering the range.
 */
struct DataRootInclusionProof {
    uint64_t index = 0;
    uint64_t total = 0;
    std::vector<ByteVector> aunts;
    uint64_t nonce = 0;
};

class BlobSubmitter {
public:
    virtual ~BlobSubmitter() = default;

    virtual Result<Hash32> create_commitment(const CancellationToken& ctx,
                                             const Namespace& ns,
                                             const ByteVector& payload) = 0;

    // Height of the block that included the blob
    virtual Result<uint64_t> submit(const CancellationToken& ctx,
                                    const Namespace& ns,
                                    const ByteVector& payload) = 0;
};

class ProofFetcher {
public:
    virtual ~ProofFetcher() = default;

    virtual Result<std::vector<ShareRange>> get_inclusion_proof(const CancellationToken& ctx,
                                                                uint64_t height,
                                                                const Namespace& ns,
                                                                const Hash32& commitment) = 0;

    virtual Result<bool> check_included(const CancellationToken& ctx,
                                        uint64_t height,
                                        const Namespace& ns,
                                        const std::vector<ShareRange>& proof,
                                        const Hash32& commitment) = 0;

    virtual Result<ByteVector> get_blob(const CancellationToken& ctx,
                                        uint64_t height,
                                        const Namespace& ns,
                                        const Hash32& commitment) = 0;
};

class HeaderReader {
public:
    virtual ~HeaderReader() = default;

    virtual Result<ExtendedHeader> get_header_by_height(const CancellationToken& ctx, uint64_t height) = 0;

    virtual Result<uint64_t> get_local_head(const CancellationToken& ctx) = 0;
};

class SquareReader {
public:
    virtual ~SquareReader() = default;

    virtual Result<std::shared_ptr<const ExtendedDataSquare>> get_extended_data_square(
        const CancellationToken& ctx, const ExtendedHeader& header) = 0;
};

class DataRootProofFetcher {
public:
    virtual ~DataRootProofFetcher() = default;

    // Proof that height's data root is in the commitment over [begin_block, end_block)
    virtual Result<DataRootInclusionProof> data_root_inclusion_proof(const CancellationToken& ctx,
                                                                     uint64_t height,
                                                                     uint64_t begin_block,
                                                                     uint64_t end_block) = 0;
};

class AttestationBridge {
public:
    virtual ~AttestationBridge() = default;

    virtual Result<uint64_t> current_nonce(const CancellationToken& ctx) = 0;

    virtual Result<bool> verify_attestation(const CancellationToken& ctx,
                                            uint64_t nonce,
                                            const DataRootTuple& tuple,
                                            const BinaryMerkleProof& proof) = 0;
};

} // namespace sdk
} // namespace celestiada
