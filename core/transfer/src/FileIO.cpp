#include "FileIO.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Ferry {

LocalFileReader::LocalFileReader(FdGuard fd, std::string path, uint64_t size)
    : fd_(std::move(fd)), path_(std::move(path)), size_(size) {}

Result<std::unique_ptr<LocalFileReader>> LocalFileReader::open(const std::string& path) {
    FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        ErrorCode code = (errno == ENOENT || errno == ENOTDIR)
            ? ErrorCode::FILE_NOT_FOUND
            : ErrorCode::FILE_OPEN_FAILED;
        return Err(code, "Cannot open " + path + ": " + std::string(strerror(errno)), "FileReader");
    }

    struct stat st;
    if (fstat(fd.get(), &st) != 0) {
        return Err(ErrorCode::FILE_OPEN_FAILED,
                   "Cannot stat " + path + ": " + std::string(strerror(errno)), "FileReader");
    }
    if (!S_ISREG(st.st_mode)) {
        return Err(ErrorCode::FILE_OPEN_FAILED, path + " is not a regular file", "FileReader");
    }

    return std::unique_ptr<LocalFileReader>(
        new LocalFileReader(std::move(fd), path, static_cast<uint64_t>(st.st_size)));
}

Result<std::size_t> LocalFileReader::read(uint8_t* buffer, std::size_t maxSize) {
    for (;;) {
        ssize_t n = ::read(fd_.get(), buffer, maxSize);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            return Err(ErrorCode::FILE_READ_FAILED,
                       "Read from " + path_ + " failed: " + std::string(strerror(errno)), "FileReader");
        }
    }
}

} // namespace Ferry
