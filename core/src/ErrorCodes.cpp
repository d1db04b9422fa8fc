#include "ErrorCodes.h"

namespace Ferry {

ErrorCategory categoryOf(ErrorCode code) {
    int value = static_cast<int>(code);
    if (value == 0) return ErrorCategory::NONE;
    if (value >= 1000 && value < 2000) return ErrorCategory::CONFIG;
    if (value >= 2000 && value < 3000) return ErrorCategory::IO;
    if (value >= 3000 && value < 4000) return ErrorCategory::TRANSPORT;
    if (value >= 4000 && value < 5000) return ErrorCategory::NAME_COLLISION;
    return ErrorCategory::INTERNAL;
}

std::string errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";

        case ErrorCode::INVALID_ADDRESS: return "INVALID_ADDRESS";
        case ErrorCode::CREDENTIALS_UNREADABLE: return "CREDENTIALS_UNREADABLE";
        case ErrorCode::CREDENTIAL_GENERATION_FAILED: return "CREDENTIAL_GENERATION_FAILED";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";

        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_OPEN_FAILED: return "FILE_OPEN_FAILED";
        case ErrorCode::FILE_READ_FAILED: return "FILE_READ_FAILED";
        case ErrorCode::FILE_WRITE_FAILED: return "FILE_WRITE_FAILED";
        case ErrorCode::FILE_PUBLISH_FAILED: return "FILE_PUBLISH_FAILED";
        case ErrorCode::OUTPUT_DIRECTORY_INVALID: return "OUTPUT_DIRECTORY_INVALID";

        case ErrorCode::BIND_FAILED: return "BIND_FAILED";
        case ErrorCode::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case ErrorCode::HANDSHAKE_FAILED: return "HANDSHAKE_FAILED";
        case ErrorCode::CERTIFICATE_REJECTED: return "CERTIFICATE_REJECTED";
        case ErrorCode::PEER_RESET: return "PEER_RESET";
        case ErrorCode::CONNECTION_CLOSED: return "CONNECTION_CLOSED";
        case ErrorCode::CONNECTION_LOST: return "CONNECTION_LOST";
        case ErrorCode::IDLE_TIMEOUT: return "IDLE_TIMEOUT";
        case ErrorCode::PROTOCOL_VIOLATION: return "PROTOCOL_VIOLATION";
        case ErrorCode::STREAM_LIMIT: return "STREAM_LIMIT";

        case ErrorCode::NAME_COLLISION: return "NAME_COLLISION";
        case ErrorCode::NAME_ALLOCATION_EXHAUSTED: return "NAME_ALLOCATION_EXHAUSTED";

        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

std::string categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "None";
        case ErrorCategory::CONFIG: return "ConfigError";
        case ErrorCategory::IO: return "IoError";
        case ErrorCategory::TRANSPORT: return "TransportError";
        case ErrorCategory::NAME_COLLISION: return "NameCollisionError";
        case ErrorCategory::INTERNAL: return "InternalError";
        default: return "Unknown";
    }
}

int exitStatusFor(ErrorCode code) {
    switch (categoryOf(code)) {
        case ErrorCategory::NONE: return 0;
        case ErrorCategory::CONFIG: return 2;
        case ErrorCategory::IO: return 3;
        case ErrorCategory::TRANSPORT: return 4;
        default: return 1;
    }
}

} // namespace Ferry
