#pragma once

/**
 * @file FdGuard.h
 * @brief RAII owner for POSIX file descriptors (sockets, files, eventfds)
 */

#include <unistd.h>
#include <utility>

namespace Ferry {

/**
 * Usage:
 * @code
 * FdGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
 * if (!sock) { return Err(...); }
 * ::connect(sock.get(), ...);
 * @endcode
 */
class FdGuard {
public:
    FdGuard() noexcept = default;
    explicit FdGuard(int fd) noexcept : fd_(fd) {}

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    FdGuard(FdGuard&& other) noexcept : fd_(other.release()) {}

    FdGuard& operator=(FdGuard&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    ~FdGuard() { reset(); }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    /// Give up ownership without closing
    int release() noexcept {
        return std::exchange(fd_, -1);
    }

    /// Close the owned descriptor (if any) and adopt fd
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /**
     * @brief Close now and report the result of close(2)
     * @return 0 on success, -1 with errno set on failure
     */
    int close() noexcept {
        if (fd_ < 0) {
            return 0;
        }
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_{-1};
};

} // namespace Ferry
