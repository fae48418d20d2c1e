#pragma once

#include "types.hpp"
#include "BlobPointer.hpp"
#include "CancellationToken.hpp"
#include <cstdint>
#include <vector>

namespace celestiada {
namespace sdk {

/**
 * @brief Rows of the extended data square covering one blob
 */
struct SquareData {
    std::vector<ByteVector> row_roots;
    std::vector<ByteVector> column_roots;
    std::vector<std::vector<ByteVector>> rows; // rows start_row..end_row inclusive
    uint64_t square_size = 0;                  // width of the extended square
    uint64_t start_row = 0;
    uint64_t end_row = 0;
};

struct ReadResult {
    ByteVector payload;
    SquareData square;
};

class DataAvailabilityWriter {
public:
    virtual ~DataAvailabilityWriter() = default;

    // Any error leaves the inclusion state of message unknown
    virtual Result<BlobPointer> store(const CancellationToken& ctx, const ByteVector& message) = 0;

    virtual Result<ByteVector> serialize(const BlobPointer& pointer) const = 0;

    virtual Result<void> wait_for_height(const CancellationToken& ctx, uint64_t height) = 0;

    virtual Result<void> wait_for_relay(const CancellationToken& ctx, uint64_t nonce) = 0;

    virtual Result<bool> verify(const CancellationToken& ctx, BlobPointer& pointer,
                                uint64_t begin_block, uint64_t end_block) = 0;
};

class DataAvailabilityReader {
public:
    virtual ~DataAvailabilityReader() = default;

    virtual Result<ReadResult> read(const CancellationToken& ctx, const BlobPointer& pointer) = 0;
};

} // namespace sdk
} // namespace celestiada
