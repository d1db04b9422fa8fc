#pragma once

#include <string>

namespace Ferry {

/**
 * @brief Error codes for every fallible operation
 *
 * Codes are grouped by category in numeric ranges so that the category of
 * any error can be derived from its code alone.
 */
enum class ErrorCode : int {
    SUCCESS = 0,

    // Configuration errors (1000-1999)
    INVALID_ADDRESS = 1000,
    CREDENTIALS_UNREADABLE = 1001,
    CREDENTIAL_GENERATION_FAILED = 1002,
    INVALID_CONFIGURATION = 1003,

    // Local I/O errors (2000-2999)
    FILE_NOT_FOUND = 2000,
    FILE_OPEN_FAILED = 2001,
    FILE_READ_FAILED = 2002,
    FILE_WRITE_FAILED = 2003,
    FILE_PUBLISH_FAILED = 2004,
    OUTPUT_DIRECTORY_INVALID = 2005,

    // Transport errors (3000-3999)
    BIND_FAILED = 3000,
    CONNECTION_FAILED = 3001,
    HANDSHAKE_FAILED = 3002,
    CERTIFICATE_REJECTED = 3003,
    PEER_RESET = 3004,
    CONNECTION_CLOSED = 3005,
    CONNECTION_LOST = 3006,
    IDLE_TIMEOUT = 3007,
    PROTOCOL_VIOLATION = 3008,
    STREAM_LIMIT = 3009,

    // Output name allocation (4000-4999)
    NAME_COLLISION = 4000,
    NAME_ALLOCATION_EXHAUSTED = 4001,

    INTERNAL_ERROR = 5000
};

enum class ErrorCategory {
    NONE,
    CONFIG,
    IO,
    TRANSPORT,
    NAME_COLLISION,
    INTERNAL
};

ErrorCategory categoryOf(ErrorCode code);

/**
 * @brief Stable upper-case name of a code, e.g. "PEER_RESET"
 */
std::string errorCodeName(ErrorCode code);

/**
 * @brief Human readable category name, e.g. "TransportError"
 */
std::string categoryName(ErrorCategory category);

/**
 * @brief Process exit status used by the executables for a failed run
 */
int exitStatusFor(ErrorCode code);

} // namespace Ferry
