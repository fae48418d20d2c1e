#include "celestiada/sdk/CelestiaDAStub.hpp"
#include "celestiada/sdk/Logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace celestiada {
namespace sdk {

CelestiaDAStub::CelestiaDAStub(std::shared_ptr<LocalFileStorageService> storage)
    : storage_(std::move(storage)) {
    if (!storage_) {
        throw std::invalid_argument("CelestiaDAStub requires a storage service");
    }
    Logger::instance().info("Celestia DA stub using " + storage_->to_string());
}

Result<ByteVector> CelestiaDAStub::store(const ByteVector& message) {
    auto key = storage_->put_content(message);
    if (key.is_err()) {
        Logger::instance().error("Stub DA failed to store message: " + key.error_message());
        return {key.error(), key.error_detail()};
    }

    ByteVector reference;
    reference.reserve(1 + constants::HASH_SIZE);
    reference.push_back(constants::CELESTIA_STUB_MESSAGE_HEADER_FLAG);
    reference.insert(reference.end(), key.value().begin(), key.value().end());

    Logger::instance().debug("Stub DA stored " + std::to_string(message.size()) +
                             " bytes under " + bytes_to_hex(key.value()));
    return reference;
}

Result<ByteVector> CelestiaDAStub::read(const ByteVector& reference) const {
    ByteVector::const_iterator begin = reference.begin();
    if (reference.size() == 1 + constants::HASH_SIZE) {
        if (!is_stub_message_header_byte(reference.front())) {
            return {ErrorCode::FORMAT_ERROR, "not a stub DA reference"};
        }
        ++begin;
    } else if (reference.size() != constants::HASH_SIZE) {
        return {ErrorCode::FORMAT_ERROR, "stub DA reference of " + std::to_string(reference.size()) + " bytes"};
    }

    Hash32 key;
    std::copy(begin, reference.end(), key.begin());

    auto message = storage_->get(key);
    if (message.is_err()) {
        Logger::instance().warning("Stub DA lookup of " + bytes_to_hex(key) + " failed: " + message.error_message());
        return message;
    }

    if (LocalFileStorageService::content_hash(message.value()) != key) {
        Logger::instance().error("Stub DA content under " + bytes_to_hex(key) + " does not match its key");
        return {ErrorCode::STORAGE_ERROR, "content hash mismatch for " + bytes_to_hex(key)};
    }

    return message;
}

} // namespace sdk
} // namespace celestiada
