#include "NetAddress.h"
#include "Config.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <cstring>

namespace Ferry {

Result<NetAddress> NetAddress::parse(const std::string& text) {
    std::string host;
    std::string portText;

    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            return Err(ErrorCode::INVALID_ADDRESS, "Malformed IPv6 address: " + text, "NetAddress");
        }
        host = text.substr(1, close - 1);
        portText = text.substr(close + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string::npos) {
            return Err(ErrorCode::INVALID_ADDRESS, "Missing port in address: " + text, "NetAddress");
        }
        host = text.substr(0, colon);
        portText = text.substr(colon + 1);
        if (host.find(':') != std::string::npos) {
            return Err(ErrorCode::INVALID_ADDRESS,
                       "IPv6 addresses must be bracketed: " + text, "NetAddress");
        }
    }

    if (host.empty()) {
        return Err(ErrorCode::INVALID_ADDRESS, "Missing host in address: " + text, "NetAddress");
    }
    if (!Config::isUnsignedInteger(portText) || portText.size() > 5) {
        return Err(ErrorCode::INVALID_ADDRESS, "Invalid port in address: " + text, "NetAddress");
    }
    unsigned long port = std::stoul(portText);
    if (port > 65535) {
        return Err(ErrorCode::INVALID_ADDRESS, "Port out of range: " + text, "NetAddress");
    }

    NetAddress address;
    address.host = host;
    address.port = static_cast<uint16_t>(port);
    return address;
}

Result<std::vector<NetAddress::Resolved>> NetAddress::resolve(bool passive) const {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV | (passive ? AI_PASSIVE : 0);

    struct addrinfo* list = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &list);
    if (rc != 0) {
        return Err(ErrorCode::INVALID_ADDRESS,
                   "Cannot resolve " + toString() + ": " + gai_strerror(rc), "NetAddress");
    }

    std::vector<Resolved> results;
    for (auto* ai = list; ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_addrlen > sizeof(sockaddr_storage)) continue;
        Resolved entry;
        std::memcpy(&entry.storage, ai->ai_addr, ai->ai_addrlen);
        entry.length = static_cast<socklen_t>(ai->ai_addrlen);
        entry.family = ai->ai_family;
        results.push_back(entry);
    }
    freeaddrinfo(list);

    if (results.empty()) {
        return Err(ErrorCode::INVALID_ADDRESS, "No usable address for " + toString(), "NetAddress");
    }
    return results;
}

std::string NetAddress::toString() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

std::string NetAddress::describe(const sockaddr* addr, socklen_t length) {
    char hostBuf[NI_MAXHOST];
    char portBuf[NI_MAXSERV];
    if (getnameinfo(addr, length, hostBuf, sizeof(hostBuf), portBuf, sizeof(portBuf),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "unknown";
    }
    if (addr->sa_family == AF_INET6) {
        return std::string("[") + hostBuf + "]:" + portBuf;
    }
    return std::string(hostBuf) + ":" + portBuf;
}

} // namespace Ferry
