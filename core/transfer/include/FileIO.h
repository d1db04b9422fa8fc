#pragma once

#include "Result.h"
#include "FdGuard.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace Ferry {

/**
 * @brief Sequential byte source for an outgoing transfer
 */
class IFileReader {
public:
    virtual ~IFileReader() = default;

    /**
     * @return Bytes read, 0 at end of file
     */
    virtual Result<std::size_t> read(uint8_t* buffer, std::size_t maxSize) = 0;
};

/**
 * @brief Sequential byte sink for an incoming transfer
 */
class IFileWriter {
public:
    virtual ~IFileWriter() = default;

    virtual VoidResult write(const uint8_t* data, std::size_t size) = 0;

    /**
     * @brief Make everything written so far durable
     */
    virtual VoidResult flush() = 0;

    virtual uint64_t bytesWritten() const = 0;
};

/**
 * @brief Reads a regular local file
 */
class LocalFileReader : public IFileReader {
public:
    /**
     * @brief Open for reading
     * @return FILE_NOT_FOUND if missing, FILE_OPEN_FAILED if not a readable regular file
     */
    static Result<std::unique_ptr<LocalFileReader>> open(const std::string& path);

    Result<std::size_t> read(uint8_t* buffer, std::size_t maxSize) override;

    uint64_t size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    LocalFileReader(FdGuard fd, std::string path, uint64_t size);

    FdGuard fd_;
    std::string path_;
    uint64_t size_;
};

} // namespace Ferry
