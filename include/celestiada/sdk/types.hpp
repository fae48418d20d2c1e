/**
 * @file types.hpp
 * @brief Common type definitions for the Celestia DA client
 */

#pragma once

#include "celestiada/sdk/errors.hpp"
#include "celestiada/sdk/constants.hpp"
#include <vector>
#include <array>
#include <string>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace celestiada {
namespace sdk {

/**
 * @brief Result type for operations that can fail
 *
 * Carries either a value or an error code. An error may carry a detail
 * string (for example the hash a lookup could not resolve).
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(ErrorCode::SUCCESS) {}
    Result(ErrorCode error) : error_(error) {}
    Result(ErrorCode error, std::string detail) : error_(error), detail_(std::move(detail)) {}

    bool is_ok() const { return error_ == ErrorCode::SUCCESS; }
    bool is_err() const { return !is_ok(); }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Attempted to access value of an error result");
        }
        return value_;
    }

    T& value() {
        if (is_err()) {
            throw std::runtime_error("Attempted to access value of an error result");
        }
        return value_;
    }

    ErrorCode error() const { return error_; }

    const std::string& error_detail() const { return detail_; }

    std::string error_message() const {
        if (detail_.empty()) {
            return ErrorCodeToString(error_);
        }
        return ErrorCodeToString(error_) + ": " + detail_;
    }

private:
    T value_{};
    ErrorCode error_;
    std::string detail_;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : error_(ErrorCode::SUCCESS) {}
    Result(ErrorCode error) : error_(error) {}
    Result(ErrorCode error, std::string detail) : error_(error), detail_(std::move(detail)) {}

    bool is_ok() const { return error_ == ErrorCode::SUCCESS; }
    bool is_err() const { return !is_ok(); }

    ErrorCode error() const { return error_; }

    const std::string& error_detail() const { return detail_; }

    std::string error_message() const {
        if (detail_.empty()) {
            return ErrorCodeToString(error_);
        }
        return ErrorCodeToString(error_) + ": " + detail_;
    }

private:
    ErrorCode error_;
    std::string detail_;
};

// Common type aliases
using ByteVector = std::vector<uint8_t>;
using Hash32 = std::array<uint8_t, constants::HASH_SIZE>;

// Hex helpers (lowercase, no 0x prefix)
std::string bytes_to_hex(const uint8_t* data, size_t size);

inline std::string bytes_to_hex(const ByteVector& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

inline std::string bytes_to_hex(const Hash32& hash) {
    return bytes_to_hex(hash.data(), hash.size());
}

// Accepts an optional 0x prefix; fails with INVALID_PARAMETER on odd length or non-hex input
Result<ByteVector> hex_to_bytes(const std::string& hex);

} // namespace sdk
} // namespace celestiada
