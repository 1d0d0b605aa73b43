#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace ScrobbleEngine {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    {ErrorCode::NETWORK_ERROR, "NETWORK_ERROR"},
    {ErrorCode::NETWORK_TIMEOUT, "NETWORK_TIMEOUT"},

    {ErrorCode::SERVICE_UNAVAILABLE, "SERVICE_UNAVAILABLE"},
    {ErrorCode::SERVICE_RATE_LIMITED, "SERVICE_RATE_LIMITED"},
    {ErrorCode::SERVICE_REJECTED, "SERVICE_REJECTED"},
    {ErrorCode::SERVICE_BAD_RESPONSE, "SERVICE_BAD_RESPONSE"},

    {ErrorCode::AUTH_INVALID_SESSION, "AUTH_INVALID_SESSION"},
    {ErrorCode::AUTH_INVALID_TOKEN, "AUTH_INVALID_TOKEN"},
    {ErrorCode::AUTH_MISSING_CREDENTIALS, "AUTH_MISSING_CREDENTIALS"},

    {ErrorCode::IPC_INVALID_COMMAND, "IPC_INVALID_COMMAND"},
    {ErrorCode::IPC_INVALID_PARAMS, "IPC_INVALID_PARAMS"},
    {ErrorCode::IPC_PROTOCOL_ERROR, "IPC_PROTOCOL_ERROR"},

    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_APP_FILTER_CONFLICT, "VALIDATION_APP_FILTER_CONFLICT"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},

    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// Reverse lookup, built once from the forward table
static const std::unordered_map<std::string, ErrorCode>& stringTable() {
    static const std::unordered_map<std::string, ErrorCode> table = [] {
        std::unordered_map<std::string, ErrorCode> t;
        for (const auto& [code, name] : kErrorCodeStrings) {
            t.emplace(name, code);
        }
        return t;
    }();
    return table;
}

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }

    switch (static_cast<uint32_t>(code) & 0xF000) {
    case 0x1000:
        return "network";
    case 0x2000:
        return "service";
    case 0x3000:
        return "auth";
    case 0x4000:
        return "ipc_zeromq";
    case 0x5000:
        return "validation";
    default:
        return "internal";
    }
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(4)
        << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    const auto& table = stringTable();
    auto it = table.find(str);
    if (it != table.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

InnerError::InnerError(ErrorCode code, const std::string& message)
    : cpp_code(errorCodeToHex(code)), cpp_message(message) {}

}  // namespace ScrobbleEngine
