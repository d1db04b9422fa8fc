#include "SecureEndpoint.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <cerrno>
#include <cstring>
#include <vector>
#include <netinet/in.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>

namespace Ferry {

namespace {
    constexpr int RECEIVE_POLL_MS = 100;
    constexpr int SOCKET_BUFFER_SIZE = 4 * 1024 * 1024;
    constexpr std::size_t MAX_READS_PER_POLL = 256;
    constexpr std::size_t RECEIVE_BUFFER_SIZE = 64 * 1024;

    // Best effort; bulk transfers drop fewer datagrams with a larger buffer
    void enlargeBuffers(int fd) {
        int size = SOCKET_BUFFER_SIZE;
        if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &size, sizeof(size)) < 0 ||
            setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &size, sizeof(size)) < 0) {
            LOG_DEBUG_COMP_IF("Cannot enlarge socket buffers: " + std::string(strerror(errno)), "Listener");
        }
    }
}

SecureListener::SecureListener(TLSContext& context, SessionOptions options)
    : context_(context), options_(options) {}

SecureListener::~SecureListener() {
    close();
}

VoidResult SecureListener::bind(const NetAddress& address) {
    auto& logger = Logger::instance();

    if (socket_) {
        return Err(ErrorCode::BIND_FAILED, "Listener is already bound", "Listener");
    }

    auto resolved = address.resolve(true);
    if (!resolved) {
        return resolved.error();
    }

    FdGuard wake(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
    if (!wake) {
        return Err(ErrorCode::BIND_FAILED, "eventfd failed: " + std::string(strerror(errno)), "Listener");
    }

    std::string lastError = "no address";
    for (const auto& candidate : resolved.value()) {
        FdGuard sock(::socket(candidate.family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
        if (!sock) {
            lastError = strerror(errno);
            continue;
        }

        if (::bind(sock.get(), reinterpret_cast<const sockaddr*>(&candidate.storage), candidate.length) < 0) {
            lastError = strerror(errno);
            continue;
        }

        sockaddr_storage local{};
        socklen_t localLength = sizeof(local);
        if (getsockname(sock.get(), reinterpret_cast<sockaddr*>(&local), &localLength) < 0) {
            lastError = "getsockname: " + std::string(strerror(errno));
            continue;
        }

        enlargeBuffers(sock.get());
        local_ = local;
        localLength_ = localLength;
        socket_ = std::make_shared<FdGuard>(std::move(sock));
        wakeFd_ = std::move(wake);
        receiver_ = std::thread(&SecureListener::receiveLoop, this);

        logger.log(LogLevel::INFO, "Listening on " + localAddress().toString() + " (QUIC)", "Listener");
        return Ok();
    }

    return Err(ErrorCode::BIND_FAILED,
               "Cannot listen on " + address.toString() + ": " + lastError, "Listener");
}

void SecureListener::receiveLoop() {
    std::vector<uint8_t> buffer(RECEIVE_BUFFER_SIZE);

    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
        }

        struct pollfd fds[2];
        fds[0].fd = socket_->get();
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeFd_.get();
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ready = ::poll(fds, 2, RECEIVE_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            failure_ = Error(ErrorCode::BIND_FAILED,
                             "poll on listener failed: " + std::string(strerror(errno)), "Listener");
            cv_.notify_all();
            return;
        }
        if (ready == 0 || !(fds[0].revents & POLLIN)) {
            continue;
        }

        for (std::size_t i = 0; i < MAX_READS_PER_POLL; ++i) {
            sockaddr_storage peer{};
            socklen_t peerLength = sizeof(peer);
            ssize_t n = ::recvfrom(socket_->get(), buffer.data(), buffer.size(), 0,
                                   reinterpret_cast<sockaddr*>(&peer), &peerLength);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                // ICMP errors from one peer surface here; they do not end the listener
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    LOG_DEBUG_COMP_IF("recvfrom failed: " + std::string(strerror(errno)), "Listener");
                }
                break;
            }
            route(buffer.data(), static_cast<std::size_t>(n), peer, peerLength);
        }
    }
}

void SecureListener::route(const uint8_t* data, std::size_t size,
                           const sockaddr_storage& peer, socklen_t peerLength) {
    std::string key = NetAddress::describe(reinterpret_cast<const sockaddr*>(&peer), peerLength);

    std::shared_ptr<SecureSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = routes_.find(key);
        if (it != routes_.end()) {
            session = it->second.lock();
            if (!session || session->hasEnded()) {
                routes_.erase(it);
                session.reset();
            }
        }
    }
    if (session) {
        session->deliver(data, size);
        return;
    }

    ngtcp2_pkt_hd header;
    if (ngtcp2_accept(&header, data, size) != 0) {
        LOG_DEBUG_COMP_IF("Ignoring datagram from " + key + " without a session", "Listener");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        if (pending_.size() >= MAX_PENDING) {
            LOG_WARN_COMP("Dropping Initial from " + key + ": " + std::to_string(MAX_PENDING) +
                          " connections already waiting", "Listener");
            return;
        }
    }

    UdpPath path;
    path.local = local_;
    path.localLength = localLength_;
    path.remote = peer;
    path.remoteLength = peerLength;

    auto started = SecureSession::startServer(socket_, path, header, context_, options_);
    if (!started) {
        Logger::instance().warn("Cannot start session for " + key + ": " + started.error().toString(), "Listener");
        return;
    }
    session = started.value();
    session->deliver(data, size);

    std::lock_guard<std::mutex> lock(mutex_);
    purgeEndedLocked();
    routes_[key] = session;
    pending_.push_back(PendingConnection{session, key});
    LOG_DEBUG_COMP_IF("New QUIC connection from " + key, "Listener");
    cv_.notify_all();
}

void SecureListener::purgeEndedLocked() {
    for (auto it = routes_.begin(); it != routes_.end();) {
        auto session = it->second.lock();
        if (!session || session->hasEnded()) {
            it = routes_.erase(it);
        } else {
            ++it;
        }
    }
}

Result<std::optional<PendingConnection>> SecureListener::accept(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!socket_ || stopping_) {
        return Err(ErrorCode::BIND_FAILED, "Listener is not bound", "Listener");
    }

    cv_.wait_for(lock, timeout, [this]() {
        return !pending_.empty() || stopping_ || failure_.has_value();
    });

    if (failure_) {
        return *failure_;
    }
    if (pending_.empty()) {
        return std::optional<PendingConnection>{};
    }

    PendingConnection pending = std::move(pending_.front());
    pending_.pop_front();
    return std::optional<PendingConnection>(std::move(pending));
}

Result<std::shared_ptr<SecureSession>> SecureListener::handshake(PendingConnection pending) {
    auto ready = pending.session->waitForHandshake(HANDSHAKE_TIMEOUT);
    if (!ready) {
        pending.session->abort();
        return ready.error();
    }
    return pending.session;
}

NetAddress SecureListener::localAddress() const {
    NetAddress address;
    if (!socket_) {
        return address;
    }
    auto parsed = NetAddress::parse(NetAddress::describe(reinterpret_cast<const sockaddr*>(&local_), localLength_));
    return parsed.valueOr(address);
}

void SecureListener::close() {
    std::vector<std::shared_ptr<SecureSession>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
        for (const auto& entry : routes_) {
            if (auto session = entry.second.lock()) {
                live.push_back(session);
            }
        }
        routes_.clear();
        pending_.clear();
        cv_.notify_all();
    }

    if (wakeFd_) {
        uint64_t one = 1;
        ssize_t rc = ::write(wakeFd_.get(), &one, sizeof(one));
        (void)rc;
    }
    if (receiver_.joinable()) {
        receiver_.join();
    }

    for (const auto& session : live) {
        session->abort();
    }
}

Result<std::shared_ptr<SecureSession>> connectSecure(const NetAddress& address,
                                                     const std::string& serverName,
                                                     TLSContext& context,
                                                     const SessionOptions& options) {
    auto& logger = Logger::instance();

    auto resolved = address.resolve(false);
    if (!resolved) {
        return resolved.error();
    }

    std::optional<Error> lastError;
    for (const auto& candidate : resolved.value()) {
        FdGuard sock(::socket(candidate.family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
        if (!sock) {
            lastError = Error(ErrorCode::CONNECTION_FAILED, strerror(errno), "Client");
            continue;
        }

        // A connected UDP socket reports ICMP port unreachable as ECONNREFUSED
        if (::connect(sock.get(), reinterpret_cast<const sockaddr*>(&candidate.storage), candidate.length) < 0) {
            lastError = Error(ErrorCode::CONNECTION_FAILED, strerror(errno), "Client");
            continue;
        }

        UdpPath path;
        path.localLength = sizeof(path.local);
        if (getsockname(sock.get(), reinterpret_cast<sockaddr*>(&path.local), &path.localLength) < 0) {
            lastError = Error(ErrorCode::CONNECTION_FAILED, "getsockname: " + std::string(strerror(errno)), "Client");
            continue;
        }
        path.remote = candidate.storage;
        path.remoteLength = candidate.length;
        enlargeBuffers(sock.get());

        auto started = SecureSession::startClient(std::move(sock), path, context, serverName, options);
        if (!started) {
            return started.error();
        }
        std::shared_ptr<SecureSession> session = started.value();

        auto ready = session->waitForHandshake(HANDSHAKE_TIMEOUT);
        if (!ready) {
            session->abort();
            // Certificate and handshake errors are final; try the next address otherwise
            if (ready.error().code != ErrorCode::CONNECTION_FAILED) {
                return ready.error();
            }
            lastError = ready.error();
            continue;
        }

        logger.log(LogLevel::DEBUG, "Connected to " + address.toString(), "Client");
        return session;
    }

    return Err(ErrorCode::CONNECTION_FAILED,
               "Cannot connect to " + address.toString() + ": " +
                   (lastError ? lastError->message : std::string("no address")), "Client");
}

} // namespace Ferry
