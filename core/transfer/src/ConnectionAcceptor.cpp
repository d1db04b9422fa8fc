#include "ConnectionAcceptor.h"
#include "CertificateProvider.h"
#include "FileSink.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <system_error>
#include <thread>
#include <vector>

namespace Ferry {

namespace {
    constexpr std::chrono::milliseconds ACCEPT_POLL_INTERVAL{500};
}

ConnectionAcceptor::ConnectionAcceptor(Settings settings)
    : settings_(std::move(settings))
    , framer_(settings_.chunkSize) {}

ConnectionAcceptor::~ConnectionAcceptor() {
    stop();
}

VoidResult ConnectionAcceptor::start() {
    auto& logger = Logger::instance();

    if (settings_.maxTransfers == 0) {
        return Err(ErrorCode::INVALID_CONFIGURATION, "max transfers must be at least 1", "Acceptor");
    }

    auto credentials = CertificateProvider::ensureSelfSigned(settings_.certPath, settings_.keyPath,
                                                             {"localhost", "127.0.0.1"});
    if (!credentials) {
        return credentials.error();
    }

    tls_ = std::make_unique<TLSContext>(TLSContext::Mode::SERVER);
    auto initialized = tls_->initialize();
    if (!initialized) {
        return initialized;
    }
    auto loaded = tls_->loadCertificate(settings_.certPath, settings_.keyPath);
    if (!loaded) {
        return loaded;
    }

    auto fingerprint = CertificateProvider::certificateFingerprint(settings_.certPath);
    if (fingerprint) {
        logger.info("Server certificate SHA-256 fingerprint: " + fingerprint.value(), "Acceptor");
    }

    allocator_ = std::make_unique<OutputAllocator>(settings_.outputDir, nameGenerator_);
    auto prepared = allocator_->prepare();
    if (!prepared) {
        return prepared;
    }

    pool_ = std::make_unique<ThreadPool>(settings_.maxTransfers);

    listener_ = std::make_unique<SecureListener>(*tls_, settings_.session);
    auto bound = listener_->bind(settings_.listenAddress);
    if (!bound) {
        return bound;
    }

    logger.info("Writing received files to " + settings_.outputDir + " (" +
                std::to_string(settings_.maxTransfers) + " concurrent transfers)", "Acceptor");
    return Ok();
}

VoidResult ConnectionAcceptor::run(const std::function<bool()>& stopRequested) {
    auto& logger = Logger::instance();

    if (!listener_) {
        return Err(ErrorCode::INTERNAL_ERROR, "Acceptor was not started", "Acceptor");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = true;
    }

    VoidResult outcome = Ok();
    while (!stopping_ && !(stopRequested && stopRequested())) {
        auto accepted = listener_->accept(ACCEPT_POLL_INTERVAL);
        if (!accepted) {
            logger.error("Listener failed: " + accepted.error().toString(), "Acceptor");
            outcome = accepted.error();
            break;
        }
        if (!accepted.value()) {
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++liveConnections_;
        }
        PendingConnection pending = std::move(*accepted.value());
        try {
            std::thread(&ConnectionAcceptor::handleConnection, this, std::move(pending)).detach();
        } catch (const std::system_error& e) {
            logger.error("Cannot start connection thread: " + std::string(e.what()), "Acceptor");
            connectionFinished();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        cv_.notify_all();
    }

    stop();
    return outcome;
}

void ConnectionAcceptor::handleConnection(PendingConnection pending) {
    auto& logger = Logger::instance();

    {
        std::string peer = pending.peerAddress;
        auto handshaken = listener_->handshake(std::move(pending));
        if (!handshaken) {
            logger.warn("Handshake with " + peer + " failed: " + handshaken.error().toString(), "Acceptor");
        } else {
            auto session = std::make_shared<TransferSession>();
            session->id = nextSessionId_++;
            session->peerAddress = peer;
            session->transport = handshaken.value();
            session->openedAt = std::chrono::steady_clock::now();

            bool admitted = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                admitted = !stopping_;
                if (admitted) {
                    sessions_[session->id] = session;
                }
            }

            if (!admitted) {
                session->transport->close(ConnectionCloseCode::SHUTTING_DOWN, "server shutting down");
            } else {
                logger.info("Session " + std::to_string(session->id) + " established with " + peer, "Acceptor");
                serveSession(session);

                std::lock_guard<std::mutex> lock(mutex_);
                sessions_.erase(session->id);
            }
        }
    }

    connectionFinished();
}

void ConnectionAcceptor::serveSession(const std::shared_ptr<TransferSession>& session) {
    auto& logger = Logger::instance();

    for (;;) {
        auto accepted = session->transport->acceptStream();
        if (!accepted) {
            break;
        }
        dispatch(session, std::move(accepted.value()));
    }

    auto lifetime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - session->openedAt);
    std::string summary = "Session " + std::to_string(session->id) + " with " + session->peerAddress +
                          " ended after " + std::to_string(lifetime.count()) + "ms";

    auto reason = session->transport->terminalError();
    if (!reason || reason->code == ErrorCode::CONNECTION_CLOSED) {
        logger.info(summary, "Acceptor");
    } else {
        logger.warn(summary + ": " + reason->toString(), "Acceptor");
    }
}

void ConnectionAcceptor::dispatch(const std::shared_ptr<TransferSession>& session, std::unique_ptr<Stream> stream) {
    std::shared_ptr<Stream> shared(std::move(stream));

    bool admitted = pool_->tryEnqueue([this, session, shared]() {
        handleStream(session, shared);
    });

    if (!admitted) {
        shared->reset(StreamResetCode::SERVER_BUSY);
        ++rejected_;
        LOG_WARN_COMP("Rejected stream " + std::to_string(shared->id()) + " of session " +
                      std::to_string(session->id) + " from " + session->peerAddress + ": all " +
                      std::to_string(pool_->capacity()) + " transfer slots busy", "Acceptor");
    }
}

void ConnectionAcceptor::handleStream(const std::shared_ptr<TransferSession>& session,
                                      const std::shared_ptr<Stream>& stream) {
    ++session->activeStreams;

    try {
        FileSink sink(*allocator_, framer_, session->id, session->peerAddress);
        auto result = sink.run(*stream);
        if (result) {
            ++completed_;
            bytesReceived_ += result.value();
        } else {
            ++failed_;
        }
    } catch (const std::exception& e) {
        ++failed_;
        stream->reset(StreamResetCode::SINK_FAILED);
        LOG_ERROR_COMP("Handler for stream " + std::to_string(stream->id()) + " of session " +
                       std::to_string(session->id) + " from " + session->peerAddress + " threw: " + e.what(),
                       "Acceptor");
    }

    --session->activeStreams;
}

void ConnectionAcceptor::connectionFinished() {
    std::lock_guard<std::mutex> lock(mutex_);
    --liveConnections_;
    cv_.notify_all();
}

void ConnectionAcceptor::stop() {
    auto& logger = Logger::instance();
    stopping_ = true;

    std::vector<std::shared_ptr<TransferSession>> open;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !running_; });
        if (stopped_) {
            return;
        }
        stopped_ = true;
        for (const auto& entry : sessions_) {
            open.push_back(entry.second);
        }
    }

    // Sessions drain through the listener socket, so it closes last
    for (const auto& session : open) {
        session->transport->close(ConnectionCloseCode::SHUTTING_DOWN, "server shutting down");
    }
    open.clear();

    if (listener_) {
        listener_->close();
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return liveConnections_ == 0; });
    }

    if (pool_) {
        pool_->shutdown();
    }

    if (listener_) {
        auto totals = stats();
        logger.info("Stopped: " + std::to_string(totals.completed) + " completed, " +
                    std::to_string(totals.failed) + " failed, " + std::to_string(totals.rejected) +
                    " rejected, " + std::to_string(totals.bytesReceived) + " bytes received", "Acceptor");
    }
}

NetAddress ConnectionAcceptor::localAddress() const {
    return listener_ ? listener_->localAddress() : settings_.listenAddress;
}

ConnectionAcceptor::Stats ConnectionAcceptor::stats() const {
    Stats totals;
    totals.completed = completed_.load();
    totals.failed = failed_.load();
    totals.rejected = rejected_.load();
    totals.bytesReceived = bytesReceived_.load();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        totals.activeSessions = sessions_.size();
    }
    return totals;
}

} // namespace Ferry
