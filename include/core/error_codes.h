#ifndef NP_SCROBBLER_ERROR_CODES_H
#define NP_SCROBBLER_ERROR_CODES_H

#include <cstdint>
#include <optional>
#include <string>

namespace ScrobbleEngine {

/**
 * @brief Error codes shared by the service adapters, dispatcher and control plane.
 *
 * Categories use the upper nibble (0xF000 mask):
 * - 0x1xxx: Transport (libcurl)
 * - 0x2xxx: Remote service
 * - 0x3xxx: Authentication
 * - 0x4xxx: IPC/ZeroMQ
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Transport (0x1000)
    NETWORK_ERROR = 0x1001,
    NETWORK_TIMEOUT = 0x1002,

    // Remote service (0x2000)
    SERVICE_UNAVAILABLE = 0x2001,
    SERVICE_RATE_LIMITED = 0x2002,
    SERVICE_REJECTED = 0x2003,
    SERVICE_BAD_RESPONSE = 0x2004,

    // Authentication (0x3000)
    AUTH_INVALID_SESSION = 0x3001,
    AUTH_INVALID_TOKEN = 0x3002,
    AUTH_MISSING_CREDENTIALS = 0x3003,

    // IPC/ZeroMQ (0x4000)
    IPC_INVALID_COMMAND = 0x4001,
    IPC_INVALID_PARAMS = 0x4002,
    IPC_PROTOCOL_ERROR = 0x4003,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_APP_FILTER_CONFLICT = 0x5002,
    VALIDATION_FILE_NOT_FOUND = 0x5003,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Inner error details from lower layers.
 *
 * Carries the transport or HTTP detail that produced an ErrorCode.
 */
struct InnerError {
    std::string cpp_code;                  // Error code as hex string (e.g., "0x2001")
    std::string cpp_message;               // Detailed message
    std::optional<long> http_status;       // HTTP status from the remote service
    std::optional<int> curl_code;          // CURLcode of a failed transfer
    std::optional<int> service_error;      // Service-specific error number (Last.fm "error")

    InnerError() = default;
    InnerError(ErrorCode code, const std::string& message);
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "SERVICE_RATE_LIMITED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "auth"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x2002").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isNetworkError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isServiceError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isAuthError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if error is transient.
 *
 * Transient: every transport error, SERVICE_UNAVAILABLE (5xx, temporary API
 * errors) and SERVICE_RATE_LIMITED. Auth failures and rejected requests are
 * terminal; the dispatcher still retries them within its budget.
 */
constexpr bool isRetryable(ErrorCode code) {
    return isNetworkError(code) || code == ErrorCode::SERVICE_UNAVAILABLE ||
           code == ErrorCode::SERVICE_RATE_LIMITED;
}

}  // namespace ScrobbleEngine

#endif  // NP_SCROBBLER_ERROR_CODES_H
