#pragma once

#include "FileIO.h"
#include "ITransferStream.h"
#include "Result.h"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace Ferry {

/**
 * @brief Moves file bytes between a local file and a stream
 *
 * A stream carries exactly one file with no length prefix or trailer: the
 * sender's half-close marks end of file, and the receiver's half-close
 * afterwards acknowledges that the file has been stored.
 */
class StreamFramer {
public:
    using ProgressCallback = std::function<void(uint64_t bytesSoFar)>;

    static constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

    explicit StreamFramer(std::size_t chunkSize = DEFAULT_CHUNK_SIZE);

    /**
     * @brief Send the whole file, then half-close the stream
     *
     * A read failure resets the stream with SOURCE_FAILED and returns the
     * IoError; a stream failure returns the TransportError.
     */
    Result<uint64_t> send(ITransferStream& stream, IFileReader& reader,
                          const ProgressCallback& progress = nullptr) const;

    /**
     * @brief Copy the stream into writer until the peer half-closes
     *
     * The writer is flushed only after a clean end of data.
     */
    Result<uint64_t> receive(ITransferStream& stream, IFileWriter& writer,
                             const ProgressCallback& progress = nullptr) const;

    /**
     * @brief Wait for the receiver's half-close after send()
     */
    VoidResult awaitAcknowledgement(ITransferStream& stream) const;

    std::size_t chunkSize() const { return chunkSize_; }

private:
    std::size_t chunkSize_;
};

} // namespace Ferry
