#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "KeyValueStore.hpp"
#include <memory>

namespace celestiada {
namespace sdk {

/**
 * @brief Whether a batch header byte marks a locally stored stub blob
 */
inline bool is_stub_message_header_byte(uint8_t header) {
    return (constants::CELESTIA_STUB_MESSAGE_HEADER_FLAG & header) != 0;
}

/**
 * @brief Local stand-in for Celestia used in development setups
 *
 * Messages are stored content-addressed in a file store and referenced by
 * the stub header byte followed by the 32-byte content key.
 */
class CelestiaDAStub {
public:
    explicit CelestiaDAStub(std::shared_ptr<LocalFileStorageService> storage);

    /**
     * @brief Store a message
     * @return Stub header byte || content key
     */
    Result<ByteVector> store(const ByteVector& message);

    /**
     * @brief Fetch a stored message
     * @param reference Either a framed reference as returned by store or a bare 32-byte key
     * @return The message, NOT_FOUND if nothing is stored under the key
     */
    Result<ByteVector> read(const ByteVector& reference) const;

private:
    std::shared_ptr<LocalFileStorageService> storage_;
};

} // namespace sdk
} // namespace celestiada
