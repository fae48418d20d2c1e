#include "celestiada/sdk/Namespace.hpp"
#include <algorithm>

namespace celestiada {
namespace sdk {

Result<Namespace> Namespace::from_v0(const ByteVector& user_id) {
    if (user_id.empty()) {
        return {ErrorCode::INVALID_PARAMETER, "namespace id cannot be blank"};
    }
    if (user_id.size() > constants::NAMESPACE_V0_USER_ID_SIZE) {
        return {ErrorCode::INVALID_PARAMETER,
                "namespace id must be at most " + std::to_string(constants::NAMESPACE_V0_USER_ID_SIZE) + " bytes"};
    }

    // v0 ids are 18 leading zero bytes followed by the left-padded user id
    Namespace ns;
    ns.version = 0;
    std::copy(user_id.begin(), user_id.end(), ns.id.end() - user_id.size());
    return ns;
}

Result<Namespace> Namespace::from_v0_hex(const std::string& hex) {
    auto bytes = hex_to_bytes(hex);
    if (bytes.is_err()) {
        return {bytes.error(), "namespace id: " + bytes.error_detail()};
    }
    return from_v0(bytes.value());
}

Result<Namespace> Namespace::from_bytes(const ByteVector& bytes) {
    if (bytes.size() != constants::NAMESPACE_SIZE) {
        return {ErrorCode::INVALID_PARAMETER,
                "namespace must be " + std::to_string(constants::NAMESPACE_SIZE) + " bytes"};
    }

    Namespace ns;
    ns.version = bytes[0];
    std::copy(bytes.begin() + constants::NAMESPACE_VERSION_SIZE, bytes.end(), ns.id.begin());
    return ns;
}

ByteVector Namespace::bytes() const {
    ByteVector result;
    result.reserve(constants::NAMESPACE_SIZE);
    result.push_back(version);
    result.insert(result.end(), id.begin(), id.end());
    return result;
}

std::string Namespace::to_hex() const {
    return bytes_to_hex(bytes());
}

} // namespace sdk
} // namespace celestiada
