#pragma once

#include <string>

namespace celestiada {
namespace sdk {

/**
 * @brief Error codes for the Celestia DA client
 */
enum class ErrorCode {
    SUCCESS = 0,
    INVALID_PARAMETER,
    TRANSPORT_ERROR,
    FORMAT_ERROR,
    INCOMPLETE_INPUT,
    MISSING_PREIMAGE,
    SUBMISSION_REJECTED,
    NOT_FOUND,
    FILE_IO_ERROR,
    STORAGE_ERROR,
    CANCELLED,
    TIMEOUT,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

/**
 * @brief Convert error code to string
 */
inline std::string ErrorCodeToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::INVALID_PARAMETER: return "Invalid parameter";
        case ErrorCode::TRANSPORT_ERROR: return "Transport error";
        case ErrorCode::FORMAT_ERROR: return "Malformed data";
        case ErrorCode::INCOMPLETE_INPUT: return "Incomplete input";
        case ErrorCode::MISSING_PREIMAGE: return "Missing preimage";
        case ErrorCode::SUBMISSION_REJECTED: return "Submission rejected";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::FILE_IO_ERROR: return "File I/O error";
        case ErrorCode::STORAGE_ERROR: return "Storage error";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::TIMEOUT: return "Timed out";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

} // namespace sdk
} // namespace celestiada
