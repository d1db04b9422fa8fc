#pragma once

#include "NetAddress.h"
#include "SecureSession.h"
#include "TLSContext.h"
#include "FdGuard.h"
#include "Result.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace Ferry {

/**
 * @brief A connection whose first Initial packet arrived; handshake still running
 */
struct PendingConnection {
    std::shared_ptr<SecureSession> session;
    std::string peerAddress;
};

/**
 * @brief Server side of the transport: one UDP socket shared by every session
 *
 * A receive thread routes datagrams to sessions by peer address. A datagram
 * from an unknown peer that ngtcp2 accepts as a client Initial starts a new
 * server session, which accept() then hands out. handshake() waits for it
 * separately so a caller can run slow handshakes off the accept loop.
 */
class SecureListener {
public:
    /// Connections queued for accept() before new Initials are dropped
    static constexpr std::size_t MAX_PENDING = 64;

    SecureListener(TLSContext& context, SessionOptions options);
    ~SecureListener();

    SecureListener(const SecureListener&) = delete;
    SecureListener& operator=(const SecureListener&) = delete;

    /**
     * @brief Bind the UDP socket; port 0 picks an ephemeral port
     */
    VoidResult bind(const NetAddress& address);

    /**
     * @brief Wait up to timeout for a new connection
     * @return Empty optional on timeout; BIND_FAILED if the listener is unusable
     */
    Result<std::optional<PendingConnection>> accept(std::chrono::milliseconds timeout);

    /**
     * @brief Wait for the server handshake to complete
     */
    Result<std::shared_ptr<SecureSession>> handshake(PendingConnection pending);

    /**
     * @brief Actual bound address (resolves an ephemeral port)
     */
    NetAddress localAddress() const;

    /**
     * @brief Stop receiving and abort every session still routed here
     */
    void close();

private:
    void receiveLoop();
    void route(const uint8_t* data, std::size_t size, const sockaddr_storage& peer, socklen_t peerLength);
    void purgeEndedLocked();

    TLSContext& context_;
    SessionOptions options_;
    std::shared_ptr<FdGuard> socket_;
    sockaddr_storage local_{};
    socklen_t localLength_{0};
    FdGuard wakeFd_;
    std::thread receiver_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
    std::optional<Error> failure_;
    std::map<std::string, std::weak_ptr<SecureSession>> routes_;
    std::deque<PendingConnection> pending_;
};

/**
 * @brief Client side: open a UDP socket, run the QUIC handshake and verify the server
 * @param serverName Name the server certificate must carry
 */
Result<std::shared_ptr<SecureSession>> connectSecure(const NetAddress& address,
                                                     const std::string& serverName,
                                                     TLSContext& context,
                                                     const SessionOptions& options);

} // namespace Ferry
