#pragma once

#include "ITransferStream.h"
#include "OutputAllocator.h"
#include "StreamFramer.h"
#include "Result.h"

#include <cstdint>
#include <string>

namespace Ferry {

/**
 * @brief Server-side handler for one incoming stream
 *
 * Writes the stream into a fresh output file. The file is published and the
 * stream half-closed as acknowledgement only after the sender's clean
 * half-close; on any failure the partial file is deleted and the stream is
 * reset with SINK_FAILED.
 */
class FileSink {
public:
    enum class State {
        AWAITING_STREAM,
        RECEIVING,
        FINALIZED,
        FAILED
    };

    FileSink(OutputAllocator& allocator, const StreamFramer& framer,
             uint64_t sessionId, std::string peerAddress);

    /**
     * @brief Receive one file
     * @return Bytes stored
     */
    Result<uint64_t> run(ITransferStream& stream);

    State state() const { return state_; }
    uint64_t bytesReceived() const { return bytesReceived_; }
    const std::string& finalPath() const { return finalPath_; }

    static std::string stateName(State state);

private:
    Error fail(ITransferStream& stream, Error error);

    OutputAllocator& allocator_;
    const StreamFramer& framer_;
    uint64_t sessionId_;
    std::string peerAddress_;
    State state_{State::AWAITING_STREAM};
    uint64_t bytesReceived_{0};
    std::string finalPath_;
    std::unique_ptr<OutputFile> file_;
};

} // namespace Ferry
