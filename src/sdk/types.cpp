#include "celestiada/sdk/types.hpp"
#include <iomanip>
#include <sstream>
#include <cctype>

namespace celestiada {
namespace sdk {

std::string bytes_to_hex(const uint8_t* data, size_t size) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');

    for (size_t i = 0; i < size; i++) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }

    return ss.str();
}

Result<ByteVector> hex_to_bytes(const std::string& hex) {
    size_t offset = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        offset = 2;
    }

    if ((hex.size() - offset) % 2 != 0) {
        return {ErrorCode::INVALID_PARAMETER, "odd-length hex string"};
    }

    ByteVector bytes;
    bytes.reserve((hex.size() - offset) / 2);

    for (size_t i = offset; i < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            return {ErrorCode::INVALID_PARAMETER, "invalid hex character"};
        }
        std::string byte_str = hex.substr(i, 2);
        bytes.push_back(static_cast<uint8_t>(std::stoi(byte_str, nullptr, 16)));
    }

    return bytes;
}

} // namespace sdk
} // namespace celestiada
