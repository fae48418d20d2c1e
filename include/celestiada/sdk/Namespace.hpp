#pragma once

#include "types.hpp"
#include "constants.hpp"
#include <array>
#include <string>

namespace celestiada {
namespace sdk {

/**
 * @brief Celestia namespace: one version byte followed by a 28-byte id
 */
struct Namespace {
    uint8_t version = 0;
    std::array<uint8_t, constants::NAMESPACE_ID_SIZE> id{};

    // Build a version-0 blob namespace from a 1..10 byte user id
    static Result<Namespace> from_v0(const ByteVector& user_id);

    // Parse the hex form of a v0 user id (as found in configuration)
    static Result<Namespace> from_v0_hex(const std::string& hex);

    // Parse the full 29-byte encoding
    static Result<Namespace> from_bytes(const ByteVector& bytes);

    ByteVector bytes() const;

    std::string to_hex() const;

    bool operator==(const Namespace& other) const {
        return version == other.version && id == other.id;
    }
    bool operator!=(const Namespace& other) const { return !(*this == other); }
};

} // namespace sdk
} // namespace celestiada
