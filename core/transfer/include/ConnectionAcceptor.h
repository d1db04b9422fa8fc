#pragma once

#include "NetAddress.h"
#include "OutputAllocator.h"
#include "SecureEndpoint.h"
#include "SecureSession.h"
#include "StreamFramer.h"
#include "TLSContext.h"
#include "ThreadPool.h"
#include "Result.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace Ferry {

/**
 * @brief One accepted transport session and its bookkeeping
 */
struct TransferSession {
    uint64_t id{0};
    std::string peerAddress;
    std::shared_ptr<SecureSession> transport;
    std::atomic<std::size_t> activeStreams{0};
    std::chrono::steady_clock::time_point openedAt;
};

/**
 * @brief Server: accepts sessions and dispatches each stream to a FileSink
 *
 * Manages:
 * - Server credentials and the listening endpoint
 * - One thread per connection for the handshake and its stream loop
 * - A bounded worker pool; streams beyond its capacity are reset with SERVER_BUSY
 * - Orderly shutdown that discards interrupted transfers
 */
class ConnectionAcceptor {
public:
    struct Settings {
        NetAddress listenAddress;
        std::string certPath;
        std::string keyPath;
        std::string outputDir;
        std::size_t maxTransfers{16};
        std::size_t chunkSize{StreamFramer::DEFAULT_CHUNK_SIZE};
        SessionOptions session;
    };

    struct Stats {
        uint64_t completed{0};
        uint64_t failed{0};
        uint64_t rejected{0};
        uint64_t bytesReceived{0};
        std::size_t activeSessions{0};
    };

    explicit ConnectionAcceptor(Settings settings);
    ~ConnectionAcceptor();

    ConnectionAcceptor(const ConnectionAcceptor&) = delete;
    ConnectionAcceptor& operator=(const ConnectionAcceptor&) = delete;

    /**
     * @brief Load or generate credentials, prepare the output directory and bind
     */
    VoidResult start();

    /**
     * @brief Accept loop; returns after a stop request or a listener failure
     * @param stopRequested Polled between accept waits
     */
    VoidResult run(const std::function<bool()>& stopRequested = nullptr);

    /**
     * @brief Ask run() to return at its next poll
     */
    void requestStop() { stopping_ = true; }

    /**
     * @brief Stop accepting, close every session with SHUTTING_DOWN and wait
     *        for all handlers
     */
    void stop();

    NetAddress localAddress() const;
    Stats stats() const;

    /// Used to override the output name generator (tests)
    void setNameGenerator(OutputAllocator::NameGenerator generator) { nameGenerator_ = std::move(generator); }

private:
    void handleConnection(PendingConnection pending);
    void serveSession(const std::shared_ptr<TransferSession>& session);
    void dispatch(const std::shared_ptr<TransferSession>& session, std::unique_ptr<Stream> stream);
    void handleStream(const std::shared_ptr<TransferSession>& session, const std::shared_ptr<Stream>& stream);
    void connectionFinished();

    Settings settings_;
    StreamFramer framer_;
    OutputAllocator::NameGenerator nameGenerator_;
    std::unique_ptr<TLSContext> tls_;
    std::unique_ptr<OutputAllocator> allocator_;
    std::unique_ptr<ThreadPool> pool_;
    std::unique_ptr<SecureListener> listener_;

    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> nextSessionId_{1};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<uint64_t, std::shared_ptr<TransferSession>> sessions_;
    std::size_t liveConnections_{0};
    bool running_{false};
    bool stopped_{false};

    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> bytesReceived_{0};
};

} // namespace Ferry
