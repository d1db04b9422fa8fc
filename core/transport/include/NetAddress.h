#pragma once

#include "Result.h"

#include <cstdint>
#include <string>
#include <vector>
#include <sys/socket.h>

namespace Ferry {

/**
 * @brief Host and port of a transport endpoint
 *
 * Accepts "host:port", "1.2.3.4:port" and "[::1]:port".
 */
struct NetAddress {
    std::string host;
    uint16_t port{0};

    struct Resolved {
        sockaddr_storage storage{};
        socklen_t length{0};
        int family{AF_UNSPEC};
    };

    static Result<NetAddress> parse(const std::string& text);

    /**
     * @brief Resolve to socket addresses
     * @param passive True for addresses suitable for bind()
     */
    Result<std::vector<Resolved>> resolve(bool passive) const;

    std::string toString() const;

    /**
     * @brief Numeric "ip:port" form of a socket address
     */
    static std::string describe(const sockaddr* addr, socklen_t length);
};

} // namespace Ferry
