#include "FileSink.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace Ferry {

FileSink::FileSink(OutputAllocator& allocator, const StreamFramer& framer,
                   uint64_t sessionId, std::string peerAddress)
    : allocator_(allocator)
    , framer_(framer)
    , sessionId_(sessionId)
    , peerAddress_(std::move(peerAddress)) {}

std::string FileSink::stateName(State state) {
    switch (state) {
        case State::AWAITING_STREAM: return "AWAITING_STREAM";
        case State::RECEIVING: return "RECEIVING";
        case State::FINALIZED: return "FINALIZED";
        case State::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

Result<uint64_t> FileSink::run(ITransferStream& stream) {
    auto& logger = Logger::instance();

    auto allocated = allocator_.allocate(sessionId_, stream.id());
    if (!allocated) {
        return fail(stream, allocated.error());
    }
    file_ = std::move(allocated.value());
    state_ = State::RECEIVING;

    LOG_DEBUG_COMP_IF("Session " + std::to_string(sessionId_) + " stream " + std::to_string(stream.id()) +
                      " receiving into " + file_->partialPath().string(), "FileSink");

    auto received = framer_.receive(stream, *file_);
    bytesReceived_ = file_->bytesWritten();
    if (!received) {
        return fail(stream, received.error());
    }

    auto committed = file_->commit();
    if (!committed) {
        return fail(stream, committed.error());
    }
    finalPath_ = file_->finalPath().string();
    state_ = State::FINALIZED;

    // The half-close tells the sender the file is stored
    auto acknowledged = stream.finish();
    if (!acknowledged) {
        logger.warn("Stored " + finalPath_ + " but could not acknowledge to " + peerAddress_ + ": " +
                    acknowledged.error().toString(), "FileSink");
    }

    logger.info("Received " + std::to_string(bytesReceived_) + " bytes from " + peerAddress_ +
                " (session " + std::to_string(sessionId_) + ", stream " + std::to_string(stream.id()) +
                ") -> " + finalPath_, "FileSink");
    return bytesReceived_;
}

Error FileSink::fail(ITransferStream& stream, Error error) {
    if (file_) {
        file_->discard();
    }
    stream.reset(StreamResetCode::SINK_FAILED);

    LOG_ERROR_COMP("Transfer from " + peerAddress_ + " failed (session " + std::to_string(sessionId_) +
                   ", stream " + std::to_string(stream.id()) + ", " + std::to_string(bytesReceived_) +
                   " bytes discarded, state " + stateName(state_) + "): " + error.toString(), "FileSink");

    state_ = State::FAILED;
    return error;
}

} // namespace Ferry
