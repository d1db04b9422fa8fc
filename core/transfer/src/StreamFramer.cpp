#include "StreamFramer.h"
#include "LoggerMacros.h"

#include <vector>

namespace Ferry {

StreamFramer::StreamFramer(std::size_t chunkSize)
    : chunkSize_(chunkSize == 0 ? DEFAULT_CHUNK_SIZE : chunkSize) {}

Result<uint64_t> StreamFramer::send(ITransferStream& stream, IFileReader& reader,
                                    const ProgressCallback& progress) const {
    std::vector<uint8_t> chunk(chunkSize_);
    uint64_t total = 0;

    for (;;) {
        auto n = reader.read(chunk.data(), chunk.size());
        if (!n) {
            stream.reset(StreamResetCode::SOURCE_FAILED);
            return n.error();
        }
        if (n.value() == 0) {
            break;
        }

        auto written = stream.write(chunk.data(), n.value());
        if (!written) {
            return written.error();
        }

        total += n.value();
        if (progress) {
            progress(total);
        }
    }

    auto finished = stream.finish();
    if (!finished) {
        return finished.error();
    }

    LOG_DEBUG_COMP_IF("Sent " + std::to_string(total) + " bytes on stream " +
                      std::to_string(stream.id()), "Framer");
    return total;
}

Result<uint64_t> StreamFramer::receive(ITransferStream& stream, IFileWriter& writer,
                                       const ProgressCallback& progress) const {
    std::vector<uint8_t> chunk(chunkSize_);
    uint64_t total = 0;

    for (;;) {
        auto n = stream.read(chunk.data(), chunk.size());
        if (!n) {
            return n.error();
        }
        if (n.value() == 0) {
            break;
        }

        auto written = writer.write(chunk.data(), n.value());
        if (!written) {
            return written.error();
        }

        total += n.value();
        if (progress) {
            progress(total);
        }
    }

    auto flushed = writer.flush();
    if (!flushed) {
        return flushed.error();
    }

    LOG_DEBUG_COMP_IF("Received " + std::to_string(total) + " bytes on stream " +
                      std::to_string(stream.id()), "Framer");
    return total;
}

VoidResult StreamFramer::awaitAcknowledgement(ITransferStream& stream) const {
    uint8_t byte;
    auto n = stream.read(&byte, 1);
    if (!n) {
        return n.error();
    }
    if (n.value() != 0) {
        return Err(ErrorCode::PROTOCOL_VIOLATION,
                   "Receiver sent data instead of acknowledging stream " + std::to_string(stream.id()),
                   "Framer");
    }
    return Ok();
}

} // namespace Ferry
