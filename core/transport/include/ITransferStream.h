#pragma once

#include "Result.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace Ferry {

/**
 * @brief Application error codes carried by RESET_STREAM / STOP_SENDING
 */
enum class StreamResetCode : uint64_t {
    NONE = 0,
    CANCELLED = 1,
    SINK_FAILED = 2,
    SOURCE_FAILED = 3,
    SERVER_BUSY = 4
};

std::string resetCodeName(uint64_t code);

/**
 * @brief One bidirectional byte stream of a transport session
 *
 * Each direction ends independently: finish() half-closes the local send
 * side, and read() returns 0 once the peer has half-closed and every byte
 * before that point has been consumed. reset() abandons both directions.
 */
class ITransferStream {
public:
    virtual ~ITransferStream() = default;

    virtual uint64_t id() const = 0;

    /**
     * @brief Queue all bytes for sending, blocking while the send buffer
     *        is full of unacknowledged data
     */
    virtual VoidResult write(const uint8_t* data, std::size_t size) = 0;

    /**
     * @brief Read up to maxSize bytes, blocking until data, end of data or an error
     * @return Byte count, 0 at end of data
     */
    virtual Result<std::size_t> read(uint8_t* buffer, std::size_t maxSize) = 0;

    /**
     * @brief Half-close the send direction
     */
    virtual VoidResult finish() = 0;

    /**
     * @brief Abort both directions; the peer observes the code
     */
    virtual void reset(StreamResetCode code) = 0;
};

} // namespace Ferry
