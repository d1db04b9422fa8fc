#pragma once

#include "ITransferStream.h"
#include "FdGuard.h"
#include "Result.h"
#include "TLSContext.h"

#include <ngtcp2/ngtcp2.h>
#include <ngtcp2/ngtcp2_crypto.h>
#include <gnutls/gnutls.h>

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <sys/socket.h>

namespace Ferry {

/// Largest UDP payload either endpoint sends
constexpr std::size_t MAX_DATAGRAM_SIZE = 1452;

/// Per-stream receive window advertised to the peer
constexpr uint64_t STREAM_RECEIVE_WINDOW = 1024 * 1024;

/// Unacknowledged bytes a writer may queue on one stream before blocking
constexpr std::size_t STREAM_SEND_BUFFER = 1024 * 1024;

/// Limit for the QUIC handshake, client and server side
constexpr std::chrono::milliseconds HANDSHAKE_TIMEOUT{10000};

/// Longest reason text carried by CONNECTION_CLOSE
constexpr std::size_t MAX_CLOSE_REASON = 1024;

/**
 * @brief Application error codes carried by CONNECTION_CLOSE
 */
enum class ConnectionCloseCode : uint64_t {
    NO_ERROR = 0,
    SHUTTING_DOWN = 1,
    TRANSFER_FAILED = 2
};

std::string closeCodeName(uint64_t code);

struct SessionOptions {
    /// Advertised QUIC max_idle_timeout; the session fails with IDLE_TIMEOUT (0 disables)
    std::chrono::milliseconds idleTimeout{30000};
    /// PING after this long without traffic (0 disables)
    std::chrono::milliseconds keepAlive{10000};
    /// Concurrently open peer-initiated streams, advertised as initial_max_streams_bidi
    std::size_t maxIncomingStreams{16};
    /// How long a graceful close may wait for queued stream data to be acknowledged
    std::chrono::milliseconds closeTimeout{2000};
};

/**
 * @brief Local and remote socket address of one QUIC connection
 */
struct UdpPath {
    sockaddr_storage local{};
    socklen_t localLength{0};
    sockaddr_storage remote{};
    socklen_t remoteLength{0};
};

class SecureSession;
struct StreamState;

/**
 * @brief Handle to one stream of a SecureSession
 *
 * Destroying a handle whose stream is not closed in both directions resets
 * it with CANCELLED.
 */
class Stream : public ITransferStream {
public:
    ~Stream() override;

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    uint64_t id() const override;
    VoidResult write(const uint8_t* data, std::size_t size) override;
    Result<std::size_t> read(uint8_t* buffer, std::size_t maxSize) override;
    VoidResult finish() override;
    void reset(StreamResetCode code) override;

private:
    friend class SecureSession;
    Stream(std::shared_ptr<SecureSession> session, std::shared_ptr<StreamState> state);

    std::shared_ptr<SecureSession> session_;
    std::shared_ptr<StreamState> state_;
};

/**
 * @brief One QUIC connection (ngtcp2) secured by a GnuTLS session
 *
 * A single I/O thread feeds received datagrams to ngtcp2, drives its timers
 * and writes outgoing packets. Application threads block on a condition
 * variable inside Stream calls; every ngtcp2 call, and therefore every
 * ngtcp2 callback, runs with mutex_ held.
 *
 * A client session owns its connected UDP socket. Server sessions share the
 * listener's socket and receive their datagrams through deliver().
 *
 * Session end is reported to every pending call as one of:
 * - CONNECTION_CLOSED: close() here, or an application CONNECTION_CLOSE from the peer
 * - CONNECTION_LOST: abort or transport error close from the peer, socket failure
 * - IDLE_TIMEOUT: nothing received within the negotiated idle timeout
 * - PROTOCOL_VIOLATION: the QUIC stack rejected the peer's packets
 */
class SecureSession : public std::enable_shared_from_this<SecureSession> {
public:
    enum class Role {
        CLIENT,     // Opens stream ids 0, 4, 8, ...
        SERVER      // Opens stream ids 1, 5, 9, ...
    };

    /**
     * @brief Start the client handshake on a connected UDP socket
     * @param serverName Name the server certificate must carry
     */
    static Result<std::shared_ptr<SecureSession>> startClient(FdGuard socket,
                                                              const UdpPath& path,
                                                              TLSContext& tls,
                                                              const std::string& serverName,
                                                              const SessionOptions& options);

    /**
     * @brief Start the server side of a connection from its first Initial packet
     * @param socket Listener socket, shared by every server session
     * @param initial Header of the Initial packet, as decoded by ngtcp2_accept()
     */
    static Result<std::shared_ptr<SecureSession>> startServer(std::shared_ptr<FdGuard> socket,
                                                              const UdpPath& path,
                                                              const ngtcp2_pkt_hd& initial,
                                                              TLSContext& tls,
                                                              const SessionOptions& options);

    ~SecureSession();

    SecureSession(const SecureSession&) = delete;
    SecureSession& operator=(const SecureSession&) = delete;

    /**
     * @brief Block until the TLS handshake has completed
     * @return The error that ended the session, or HANDSHAKE_FAILED on timeout
     */
    VoidResult waitForHandshake(std::chrono::milliseconds timeout);

    /**
     * @brief Queue a datagram received on the shared server socket
     */
    void deliver(const uint8_t* data, std::size_t size);

    /**
     * @brief Open a stream
     * @return STREAM_LIMIT when the peer allows no further concurrent streams
     */
    Result<std::unique_ptr<Stream>> openBidirectionalStream();

    /**
     * @brief Wait for the next peer-initiated stream
     * @return CONNECTION_CLOSED once the session has ended
     */
    Result<std::unique_ptr<Stream>> acceptStream();

    /**
     * @brief Wait until queued stream data is acknowledged (bounded by
     *        closeTimeout), then send an application CONNECTION_CLOSE;
     *        waits for the I/O thread
     */
    void close(ConnectionCloseCode code, const std::string& reason = "");

    /**
     * @brief Drop the connection at once with a transport error close
     */
    void abort();

    bool isOpen() const;
    std::optional<Error> terminalError() const;

    /// True once the I/O thread has stopped
    bool hasEnded() const;

    Role role() const { return role_; }
    const std::string& peerAddress() const { return peerAddress_; }

private:
    friend class Stream;

    enum class State {
        OPEN,
        DRAINING,   // Waiting for queued data to be acknowledged before closing
        ABORTED,
        FINISHED
    };

    SecureSession(Role role, const SessionOptions& options, TLSContext& tls,
                  std::shared_ptr<FdGuard> socket, const UdpPath& path, FdGuard wakeFd);

    VoidResult setupClient(const std::string& serverName);
    VoidResult setupServer(const ngtcp2_pkt_hd& initial);
    VoidResult attachTls(gnutls_session_t tlsSession);
    void fillCallbacks(ngtcp2_callbacks& callbacks) const;
    void fillSettings(ngtcp2_settings& settings, ngtcp2_transport_params& params) const;

    // Stream operations, called through Stream
    VoidResult streamWrite(StreamState& stream, const uint8_t* data, std::size_t size);
    Result<std::size_t> streamRead(StreamState& stream, uint8_t* buffer, std::size_t maxSize);
    VoidResult streamFinish(StreamState& stream);
    void streamReset(StreamState& stream, StreamResetCode code);
    void releaseStream(const std::shared_ptr<StreamState>& stream);

    // Called with mutex_ held
    std::shared_ptr<StreamState> createStreamLocked(int64_t id);
    std::shared_ptr<StreamState> findStreamLocked(int64_t id) const;
    std::shared_ptr<StreamState> nextSendableLocked(const std::set<int64_t>& skipped);
    void returnCreditLocked(int64_t id, std::size_t consumed);
    void readPacketLocked(const uint8_t* data, std::size_t size);
    bool receiveFromSocketLocked();
    bool writePacketsLocked();
    bool sendDatagramLocked(const uint8_t* data, std::size_t size);
    void sendConnectionCloseLocked(const ngtcp2_ccerr& ccerr);
    void handleLibraryErrorLocked(int rv);
    bool sendQueuesDrainedLocked() const;
    Error peerCloseError() const;
    Error unreachableError(const std::string& detail) const;
    void failLocked(Error error);
    void finishLocked(Error error);
    static Error peerResetError(const StreamState& stream);
    void wake();

    // I/O thread
    void ioLoop();
    int pollTimeoutMs(uint64_t now, bool sendPending) const;
    void join();

    // ngtcp2 callbacks; user_data is the session
    static ngtcp2_conn* getConnCallback(ngtcp2_crypto_conn_ref* ref);
    static void randCallback(uint8_t* dest, size_t destlen, const ngtcp2_rand_ctx* rand_ctx);
    static int getNewConnectionIdCallback(ngtcp2_conn* conn, ngtcp2_cid* cid, uint8_t* token,
                                          size_t cidlen, void* user_data);
    static int removeConnectionIdCallback(ngtcp2_conn* conn, const ngtcp2_cid* cid, void* user_data);
    static int handshakeCompletedCallback(ngtcp2_conn* conn, void* user_data);
    static int recvStreamDataCallback(ngtcp2_conn* conn, uint32_t flags, int64_t stream_id,
                                      uint64_t offset, const uint8_t* data, size_t datalen,
                                      void* user_data, void* stream_user_data);
    static int streamOpenCallback(ngtcp2_conn* conn, int64_t stream_id, void* user_data);
    static int streamCloseCallback(ngtcp2_conn* conn, uint32_t flags, int64_t stream_id,
                                   uint64_t app_error_code, void* user_data, void* stream_user_data);
    static int streamResetCallback(ngtcp2_conn* conn, int64_t stream_id, uint64_t final_size,
                                   uint64_t app_error_code, void* user_data, void* stream_user_data);
    static int streamStopSendingCallback(ngtcp2_conn* conn, int64_t stream_id, uint64_t app_error_code,
                                         void* user_data, void* stream_user_data);
    static int ackedStreamDataOffsetCallback(ngtcp2_conn* conn, int64_t stream_id, uint64_t offset,
                                             uint64_t datalen, void* user_data, void* stream_user_data);

    Role role_;
    SessionOptions options_;
    TLSContext& tls_;
    std::string peerAddress_;
    std::shared_ptr<FdGuard> socket_;
    UdpPath path_;
    ngtcp2_path_storage pathStorage_;
    FdGuard wakeFd_;
    std::thread ioThread_;
    std::mutex joinMutex_;

    ngtcp2_conn* conn_{nullptr};
    gnutls_session_t tlsSession_{nullptr};
    ngtcp2_crypto_conn_ref connRef_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_{State::OPEN};
    bool ended_{false};
    bool handshakeDone_{false};
    bool packetReceived_{false};
    std::optional<Error> terminalError_;
    std::map<int64_t, std::shared_ptr<StreamState>> streams_;
    std::deque<std::shared_ptr<StreamState>> acceptQueue_;
    std::deque<std::vector<uint8_t>> inbox_;
    int64_t lastSentStream_{-1};
    ConnectionCloseCode closeCode_{ConnectionCloseCode::NO_ERROR};
    std::string closeReason_;
    std::chrono::steady_clock::time_point closeDeadline_;

    // Owned by the I/O thread
    std::array<uint8_t, MAX_DATAGRAM_SIZE> sendBuf_;
    std::vector<uint8_t> recvBuf_;
};

} // namespace Ferry
