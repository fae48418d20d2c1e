#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "BlobPointer.hpp"
#include "Collaborators.hpp"
#include "ConfirmationPoller.hpp"
#include "DAConfig.hpp"
#include "DataAvailability.hpp"
#include "Namespace.hpp"
#include <memory>

namespace celestiada {
namespace sdk {

/**
 * @brief Handles to the external services the client talks to
 */
struct CelestiaClients {
    std::shared_ptr<BlobSubmitter> submitter;
    std::shared_ptr<ProofFetcher> proofs;
    std::shared_ptr<HeaderReader> headers;
    std::shared_ptr<SquareReader> squares;
    std::shared_ptr<DataRootProofFetcher> data_root_proofs;
    std::shared_ptr<AttestationBridge> bridge;
};

/**
 * @brief Celestia DA client: posts batches as blobs, reads them back and
 *        checks their data roots against Blobstream
 *
 * Holds only configuration and client handles after construction; all
 * operations block the calling thread and may run concurrently.
 */
class CelestiaDA : public DataAvailabilityWriter, public DataAvailabilityReader {
    // Tag only create() can name
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /**
     * @brief Validate configuration and clients
     * @return INVALID_PARAMETER if a client is missing, CONFIG_ERROR for a bad namespace
     */
    static Result<std::unique_ptr<CelestiaDA>> create(const DAConfig& config, CelestiaClients clients);

    CelestiaDA(ConstructionKey, const DAConfig& config, CelestiaClients clients, Namespace ns);

    Result<BlobPointer> store(const CancellationToken& ctx, const ByteVector& message) override;

    Result<ByteVector> serialize(const BlobPointer& pointer) const override;

    Result<void> wait_for_height(const CancellationToken& ctx, uint64_t height) override;

    Result<void> wait_for_relay(const CancellationToken& ctx, uint64_t nonce) override;

    Result<bool> verify(const CancellationToken& ctx, BlobPointer& pointer,
                        uint64_t begin_block, uint64_t end_block) override;

    Result<ReadResult> read(const CancellationToken& ctx, const BlobPointer& pointer) override;

    const Namespace& blob_namespace() const { return namespace_; }
    const DAConfig& config() const { return config_; }

private:
    const DAConfig config_;
    const CelestiaClients clients_;
    const Namespace namespace_;
    const ConfirmationPoller height_poller_;
    const ConfirmationPoller relay_poller_;
};

} // namespace sdk
} // namespace celestiada
