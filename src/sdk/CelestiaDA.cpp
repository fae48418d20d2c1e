#include "celestiada/sdk/CelestiaDA.hpp"
#include "celestiada/sdk/Logger.hpp"
#include <algorithm>
#include <utility>

namespace celestiada {
namespace sdk {

CelestiaDA::CelestiaDA(ConstructionKey, const DAConfig& config, CelestiaClients clients, Namespace ns)
    : config_(config),
      clients_(std::move(clients)),
      namespace_(ns),
      height_poller_("celestia height", config.poll_interval, config.max_poll_attempts),
      relay_poller_("blobstream relay", config.poll_interval, config.max_poll_attempts) {
    Logger::instance().info("Celestia DA client initialized for namespace " + namespace_.to_hex());
}

Result<std::unique_ptr<CelestiaDA>> CelestiaDA::create(const DAConfig& config, CelestiaClients clients) {
    if (!clients.submitter || !clients.proofs || !clients.headers ||
        !clients.squares || !clients.data_root_proofs || !clients.bridge) {
        Logger::instance().error("Celestia DA client created without all RPC clients");
        return {ErrorCode::INVALID_PARAMETER, "missing client"};
    }

    if (config.namespace_id.empty()) {
        return {ErrorCode::CONFIG_ERROR, "namespace id cannot be blank"};
    }

    auto ns = Namespace::from_v0_hex(config.namespace_id);
    if (ns.is_err()) {
        Logger::instance().error("Invalid namespace id: " + ns.error_message());
        return {ErrorCode::CONFIG_ERROR, ns.error_message()};
    }

    if (config.poll_interval.count() <= 0) {
        return {ErrorCode::CONFIG_ERROR, "poll interval must be positive"};
    }

    return std::make_unique<CelestiaDA>(ConstructionKey(), config, std::move(clients), ns.value());
}

Result<BlobPointer> CelestiaDA::store(const CancellationToken& ctx, const ByteVector& message) {
    auto commitment = clients_.submitter->create_commitment(ctx, namespace_, message);
    if (commitment.is_err()) {
        Logger::instance().warning("Unable to create blob commitment: " + commitment.error_message());
        return {commitment.error(), commitment.error_detail()};
    }

    auto height = clients_.submitter->submit(ctx, namespace_, message);
    if (height.is_err()) {
        Logger::instance().warning("Blob submission error: " + height.error_message());
        return {height.error(), height.error_detail()};
    }
    if (height.value() == 0) {
        Logger::instance().warning("Unexpected height from blob response: 0");
        return {ErrorCode::SUBMISSION_REJECTED, "blob included at height 0"};
    }

    Logger::instance().info("Successfully posted blob height=" + std::to_string(height.value()) +
                            " commitment=" + bytes_to_hex(commitment.value()));

    auto ranges = clients_.proofs->get_inclusion_proof(ctx, height.value(), namespace_, commitment.value());
    if (ranges.is_err()) {
        Logger::instance().warning("Unable to fetch blob proof: " + ranges.error_message());
        return {ranges.error(), ranges.error_detail()};
    }
    if (ranges.value().empty()) {
        Logger::instance().warning("Blob proof has no share ranges");
        return {ErrorCode::FORMAT_ERROR, "empty share range proof"};
    }

    uint64_t share_count = 0;
    for (const auto& range : ranges.value()) {
        if (range.end < range.start) {
            return {ErrorCode::FORMAT_ERROR, "share range ends before it starts"};
        }
        share_count += range.end - range.start;
    }

    auto included = clients_.proofs->check_included(ctx, height.value(), namespace_,
                                                    ranges.value(), commitment.value());
    if (included.is_err()) {
        Logger::instance().warning("Unable to check inclusion: " + included.error_message());
        return {included.error(), included.error_detail()};
    }
    if (!included.value()) {
        Logger::instance().warning("Blob not included at height " + std::to_string(height.value()));
    }

    auto header = clients_.headers->get_header_by_height(ctx, height.value());
    if (header.is_err()) {
        Logger::instance().warning("Header retrieval error: " + header.error_message());
        return {header.error(), header.error_detail()};
    }

    BlobPointer pointer;
    pointer.block_height = height.value();
    pointer.start = ranges.value().front().start;
    pointer.share_count = share_count;
    pointer.commitment = commitment.value();
    pointer.data_root = header.value().data_root;

    Logger::instance().info("Retrieved data root " + bytes_to_hex(pointer.data_root) +
                            " for height " + std::to_string(pointer.block_height));
    Logger::instance().trace("Stored blob pointer " + pointer.to_string());

    return pointer;
}

Result<ByteVector> CelestiaDA::serialize(const BlobPointer& pointer) const {
    auto valid = pointer.validate();
    if (valid.is_err()) {
        return {valid.error(), valid.error_detail()};
    }

    ByteVector framed = pointer.serialize();
    Logger::instance().trace("Serialized blob pointer: " + bytes_to_hex(framed));
    return framed;
}

Result<void> CelestiaDA::wait_for_height(const CancellationToken& ctx, uint64_t height) {
    auto headers = clients_.headers;
    auto result = height_poller_.wait_for_height(
        ctx, [headers](const CancellationToken& c) { return headers->get_local_head(c); }, height);
    if (result.is_err()) {
        return {result.error(), result.error_detail()};
    }
    return ErrorCode::SUCCESS;
}

Result<void> CelestiaDA::wait_for_relay(const CancellationToken& ctx, uint64_t nonce) {
    auto bridge = clients_.bridge;
    auto result = relay_poller_.wait_for_nonce(
        ctx, [bridge](const CancellationToken& c) { return bridge->current_nonce(c); }, nonce);
    if (result.is_err()) {
        return {result.error(), result.error_detail()};
    }
    return ErrorCode::SUCCESS;
}

Result<bool> CelestiaDA::verify(const CancellationToken& ctx, BlobPointer& pointer,
                                uint64_t begin_block, uint64_t end_block) {
    auto proof = clients_.data_root_proofs->data_root_inclusion_proof(ctx, pointer.block_height,
                                                                      begin_block, end_block);
    if (proof.is_err()) {
        Logger::instance().warning("Unable to fetch data root inclusion proof: " + proof.error_message());
        return {proof.error(), proof.error_detail()};
    }

    const DataRootInclusionProof& inclusion = proof.value();

    std::vector<Hash32> side_nodes;
    side_nodes.reserve(inclusion.aunts.size());
    for (size_t i = 0; i < inclusion.aunts.size(); ++i) {
        const ByteVector& aunt = inclusion.aunts[i];
        if (aunt.size() != constants::HASH_SIZE) {
            Logger::instance().warning("Data root proof aunt " + std::to_string(i) + " has " +
                                       std::to_string(aunt.size()) + " bytes");
            return {ErrorCode::FORMAT_ERROR, "aunt " + std::to_string(i) + " is not 32 bytes"};
        }
        Hash32 node;
        std::copy(aunt.begin(), aunt.end(), node.begin());
        side_nodes.push_back(node);
    }

    if (inclusion.total == 0 || inclusion.index >= inclusion.total) {
        return {ErrorCode::FORMAT_ERROR, "proof index " + std::to_string(inclusion.index) +
                                         " outside " + std::to_string(inclusion.total) + " leaves"};
    }

    // All proof fields are checked; commit them to the pointer together
    pointer.key = inclusion.index;
    pointer.num_leaves = inclusion.total;
    pointer.side_nodes = std::move(side_nodes);
    pointer.nonce = inclusion.nonce;

    Logger::instance().debug("Attached data root proof to " + pointer.to_string());

    auto relayed = wait_for_relay(ctx, pointer.nonce);
    if (relayed.is_err()) {
        return {relayed.error(), relayed.error_detail()};
    }

    DataRootTuple tuple;
    tuple.height = pointer.block_height;
    tuple.data_root = pointer.data_root;

    BinaryMerkleProof merkle_proof;
    merkle_proof.side_nodes = pointer.side_nodes;
    merkle_proof.key = pointer.key;
    merkle_proof.num_leaves = pointer.num_leaves;

    auto valid = clients_.bridge->verify_attestation(ctx, pointer.nonce, tuple, merkle_proof);
    if (valid.is_err()) {
        Logger::instance().warning("Blobstream attestation check failed: " + valid.error_message());
        return valid;
    }

    Logger::instance().info("Blobstream attestation for height " + std::to_string(pointer.block_height) +
                            (valid.value() ? " verified" : " rejected"));
    return valid;
}

Result<ReadResult> CelestiaDA::read(const CancellationToken& ctx, const BlobPointer& pointer) {
    Logger::instance().info("Requesting blob " + pointer.to_string());

    auto blob = clients_.proofs->get_blob(ctx, pointer.block_height, namespace_, pointer.commitment);
    if (blob.is_err()) {
        Logger::instance().warning("Blob retrieval error: " + blob.error_message());
        return {blob.error(), blob.error_detail()};
    }

    auto header = clients_.headers->get_header_by_height(ctx, pointer.block_height);
    if (header.is_err()) {
        Logger::instance().warning("Header retrieval error: " + header.error_message());
        return {header.error(), header.error_detail()};
    }

    auto eds = clients_.squares->get_extended_data_square(ctx, header.value());
    if (eds.is_err()) {
        Logger::instance().warning("Extended data square retrieval error: " + eds.error_message());
        return {eds.error(), eds.error_detail()};
    }
    if (!eds.value()) {
        return {ErrorCode::TRANSPORT_ERROR, "no extended data square"};
    }

    const ExtendedDataSquare& square = *eds.value();
    uint64_t width = square.width();
    uint64_t ods_width = width / 2;
    if (ods_width == 0) {
        return {ErrorCode::FORMAT_ERROR, "extended data square of width " + std::to_string(width)};
    }

    uint64_t start_row = pointer.start / ods_width;
    uint64_t end_row = (pointer.start + pointer.share_count) / ods_width;
    if (end_row >= width) {
        end_row = width - 1;
    }
    if (start_row > end_row) {
        return {ErrorCode::FORMAT_ERROR, "share range starts outside the square"};
    }

    ReadResult result;
    result.payload = std::move(blob.value());
    result.square.row_roots = header.value().row_roots;
    result.square.column_roots = header.value().column_roots;
    result.square.square_size = width;
    result.square.start_row = start_row;
    result.square.end_row = end_row;
    for (uint64_t i = start_row; i <= end_row; ++i) {
        result.square.rows.push_back(square.row(i));
    }

    Logger::instance().debug("Read rows " + std::to_string(start_row) + ".." + std::to_string(end_row) +
                             " of a " + std::to_string(width) + " wide square");
    return result;
}

} // namespace sdk
} // namespace celestiada
