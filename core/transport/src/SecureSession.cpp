#include "SecureSession.h"
#include "NetAddress.h"
#include "Logger.h"
#include "LoggerMacros.h"

#include <ngtcp2/ngtcp2_crypto_gnutls.h>
#include <gnutls/crypto.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

namespace Ferry {

using Clock = std::chrono::steady_clock;

namespace {
    constexpr std::size_t CID_LENGTH = 16;
    constexpr std::size_t MAX_WRITE_VECS = 16;
    /// Packets written before inbound datagrams are looked at again
    constexpr std::size_t MAX_PACKETS_PER_WRITE = 64;
    constexpr std::size_t MAX_READS_PER_WAKE = 256;
    constexpr std::size_t MAX_INBOX = 4096;
    constexpr std::size_t RECV_BUFFER_SIZE = 64 * 1024;

    uint64_t timestamp() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            Clock::now().time_since_epoch()).count());
    }

    uint64_t toDuration(std::chrono::milliseconds ms) {
        return static_cast<uint64_t>(ms.count()) * NGTCP2_MILLISECONDS;
    }
}

std::string resetCodeName(uint64_t code) {
    switch (static_cast<StreamResetCode>(code)) {
        case StreamResetCode::NONE: return "NONE";
        case StreamResetCode::CANCELLED: return "CANCELLED";
        case StreamResetCode::SINK_FAILED: return "SINK_FAILED";
        case StreamResetCode::SOURCE_FAILED: return "SOURCE_FAILED";
        case StreamResetCode::SERVER_BUSY: return "SERVER_BUSY";
    }
    return "UNKNOWN(" + std::to_string(code) + ")";
}

std::string closeCodeName(uint64_t code) {
    switch (static_cast<ConnectionCloseCode>(code)) {
        case ConnectionCloseCode::NO_ERROR: return "NO_ERROR";
        case ConnectionCloseCode::SHUTTING_DOWN: return "SHUTTING_DOWN";
        case ConnectionCloseCode::TRANSFER_FAILED: return "TRANSFER_FAILED";
    }
    return "UNKNOWN(" + std::to_string(code) + ")";
}

struct StreamState {
    int64_t id{0};

    // Receive side
    std::deque<std::vector<uint8_t>> chunks;
    std::size_t frontOffset{0};
    std::size_t buffered{0};
    bool peerFinished{false};

    // Send side. ngtcp2 retransmits straight from sendChunks, so a chunk
    // stays until every byte of it has been acknowledged.
    std::deque<std::vector<uint8_t>> sendChunks;
    uint64_t sendBase{0};       // Stream offset of sendChunks.front()
    uint64_t sentOffset{0};     // Handed to ngtcp2 so far
    uint64_t queuedEnd{0};
    uint64_t ackedOffset{0};
    bool localFinished{false};
    bool finSent{false};
    bool sendClosed{false};

    bool localReset{false};
    bool peerReset{false};
    uint64_t peerResetCode{0};
    bool released{false};
    bool transportClosed{false};

    bool fullyClosed() const { return localFinished && peerFinished; }

    bool hasPendingSend() const {
        if (localReset || peerReset || sendClosed || transportClosed) {
            return false;
        }
        return sentOffset < queuedEnd || (localFinished && !finSent);
    }

    std::size_t unacknowledged() const {
        return static_cast<std::size_t>(queuedEnd - ackedOffset);
    }

    bool drained() const {
        if (localReset || peerReset || sendClosed || transportClosed) {
            return true;
        }
        return ackedOffset >= queuedEnd && (!localFinished || finSent);
    }

    void discardReceived() {
        chunks.clear();
        frontOffset = 0;
        buffered = 0;
    }

    /// Unsent bytes as a vector list; fin is set when the list reaches the queued end
    std::size_t pendingVecs(ngtcp2_vec* vecs, std::size_t max, bool& fin) {
        std::size_t count = 0;
        uint64_t offset = sendBase;
        uint64_t covered = sentOffset;
        for (auto& chunk : sendChunks) {
            uint64_t end = offset + chunk.size();
            if (end > sentOffset) {
                std::size_t skip = sentOffset > offset ? static_cast<std::size_t>(sentOffset - offset) : 0;
                vecs[count].base = chunk.data() + skip;
                vecs[count].len = chunk.size() - skip;
                covered = end;
                if (++count == max) {
                    break;
                }
            }
            offset = end;
        }
        fin = localFinished && !finSent && covered == queuedEnd;
        return count;
    }

    /// Account for what ngtcp2 took; false if nothing moved
    bool consumed(ngtcp2_ssize accepted, bool fin) {
        if (accepted < 0) {
            return false;
        }
        sentOffset += static_cast<uint64_t>(accepted);
        bool finWritten = fin && sentOffset == queuedEnd;
        if (finWritten) {
            finSent = true;
        }
        return accepted > 0 || finWritten;
    }

    void acknowledge(uint64_t end) {
        ackedOffset = std::max(ackedOffset, end);
        while (!sendChunks.empty() && sendBase + sendChunks.front().size() <= ackedOffset) {
            sendBase += sendChunks.front().size();
            sendChunks.pop_front();
        }
    }
};

// Stream handle

Stream::Stream(std::shared_ptr<SecureSession> session, std::shared_ptr<StreamState> state)
    : session_(std::move(session)), state_(std::move(state)) {}

Stream::~Stream() {
    session_->releaseStream(state_);
}

uint64_t Stream::id() const {
    return static_cast<uint64_t>(state_->id);
}

VoidResult Stream::write(const uint8_t* data, std::size_t size) {
    return session_->streamWrite(*state_, data, size);
}

Result<std::size_t> Stream::read(uint8_t* buffer, std::size_t maxSize) {
    return session_->streamRead(*state_, buffer, maxSize);
}

VoidResult Stream::finish() {
    return session_->streamFinish(*state_);
}

void Stream::reset(StreamResetCode code) {
    session_->streamReset(*state_, code);
}

// Session lifecycle

Result<std::shared_ptr<SecureSession>> SecureSession::startClient(FdGuard socket,
                                                                  const UdpPath& path,
                                                                  TLSContext& tls,
                                                                  const std::string& serverName,
                                                                  const SessionOptions& options) {
    FdGuard wakeFd(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
    if (!wakeFd) {
        return Err(ErrorCode::INTERNAL_ERROR, "eventfd failed: " + std::string(strerror(errno)), "Session");
    }

    std::shared_ptr<SecureSession> session(
        new SecureSession(Role::CLIENT, options, tls, std::make_shared<FdGuard>(std::move(socket)),
                          path, std::move(wakeFd)));
    auto ready = session->setupClient(serverName);
    if (!ready) {
        return ready.error();
    }
    session->ioThread_ = std::thread(&SecureSession::ioLoop, session.get());
    return session;
}

Result<std::shared_ptr<SecureSession>> SecureSession::startServer(std::shared_ptr<FdGuard> socket,
                                                                  const UdpPath& path,
                                                                  const ngtcp2_pkt_hd& initial,
                                                                  TLSContext& tls,
                                                                  const SessionOptions& options) {
    FdGuard wakeFd(eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
    if (!wakeFd) {
        return Err(ErrorCode::INTERNAL_ERROR, "eventfd failed: " + std::string(strerror(errno)), "Session");
    }

    std::shared_ptr<SecureSession> session(
        new SecureSession(Role::SERVER, options, tls, std::move(socket), path, std::move(wakeFd)));
    auto ready = session->setupServer(initial);
    if (!ready) {
        return ready.error();
    }
    session->ioThread_ = std::thread(&SecureSession::ioLoop, session.get());
    return session;
}

SecureSession::SecureSession(Role role, const SessionOptions& options, TLSContext& tls,
                             std::shared_ptr<FdGuard> socket, const UdpPath& path, FdGuard wakeFd)
    : role_(role)
    , options_(options)
    , tls_(tls)
    , peerAddress_(NetAddress::describe(reinterpret_cast<const sockaddr*>(&path.remote), path.remoteLength))
    , socket_(std::move(socket))
    , path_(path)
    , wakeFd_(std::move(wakeFd))
    , recvBuf_(RECV_BUFFER_SIZE)
{
    ngtcp2_path_storage_init(&pathStorage_,
                             reinterpret_cast<const ngtcp2_sockaddr*>(&path_.local), path_.localLength,
                             reinterpret_cast<const ngtcp2_sockaddr*>(&path_.remote), path_.remoteLength,
                             nullptr);
    connRef_.get_conn = &SecureSession::getConnCallback;
    connRef_.user_data = this;
}

SecureSession::~SecureSession() {
    abort();
    // Only left over when setup failed before the I/O thread started
    if (conn_) {
        ngtcp2_conn_del(conn_);
        conn_ = nullptr;
    }
    if (tlsSession_) {
        gnutls_deinit(tlsSession_);
        tlsSession_ = nullptr;
    }
}

void SecureSession::fillCallbacks(ngtcp2_callbacks& callbacks) const {
    std::memset(&callbacks, 0, sizeof(callbacks));

    // Use ngtcp2_crypto_gnutls callbacks
    if (role_ == Role::CLIENT) {
        callbacks.client_initial = ngtcp2_crypto_client_initial_cb;
        callbacks.recv_retry = ngtcp2_crypto_recv_retry_cb;
    } else {
        callbacks.recv_client_initial = ngtcp2_crypto_recv_client_initial_cb;
    }
    callbacks.recv_crypto_data = ngtcp2_crypto_recv_crypto_data_cb;
    callbacks.encrypt = ngtcp2_crypto_encrypt_cb;
    callbacks.decrypt = ngtcp2_crypto_decrypt_cb;
    callbacks.hp_mask = ngtcp2_crypto_hp_mask_cb;
    callbacks.update_key = ngtcp2_crypto_update_key_cb;
    callbacks.delete_crypto_aead_ctx = ngtcp2_crypto_delete_crypto_aead_ctx_cb;
    callbacks.delete_crypto_cipher_ctx = ngtcp2_crypto_delete_crypto_cipher_ctx_cb;
    callbacks.get_path_challenge_data = ngtcp2_crypto_get_path_challenge_data_cb;
    callbacks.version_negotiation = ngtcp2_crypto_version_negotiation_cb;

    callbacks.rand = randCallback;
    callbacks.get_new_connection_id = getNewConnectionIdCallback;
    callbacks.remove_connection_id = removeConnectionIdCallback;
    callbacks.handshake_completed = handshakeCompletedCallback;
    callbacks.recv_stream_data = recvStreamDataCallback;
    callbacks.stream_open = streamOpenCallback;
    callbacks.stream_close = streamCloseCallback;
    callbacks.stream_reset = streamResetCallback;
    callbacks.stream_stop_sending = streamStopSendingCallback;
    callbacks.acked_stream_data_offset = ackedStreamDataOffsetCallback;
}

void SecureSession::fillSettings(ngtcp2_settings& settings, ngtcp2_transport_params& params) const {
    uint64_t streams = std::max<uint64_t>(options_.maxIncomingStreams, 1);

    ngtcp2_settings_default(&settings);
    settings.initial_ts = timestamp();
    settings.handshake_timeout = toDuration(HANDSHAKE_TIMEOUT);
    settings.max_tx_udp_payload_size = MAX_DATAGRAM_SIZE;
    settings.max_stream_window = 4 * STREAM_RECEIVE_WINDOW;
    settings.max_window = 4 * STREAM_RECEIVE_WINDOW * streams;

    ngtcp2_transport_params_default(&params);
    params.initial_max_stream_data_bidi_local = STREAM_RECEIVE_WINDOW;
    params.initial_max_stream_data_bidi_remote = STREAM_RECEIVE_WINDOW;
    params.initial_max_stream_data_uni = 0;
    params.initial_max_data = STREAM_RECEIVE_WINDOW * streams;
    params.initial_max_streams_bidi = options_.maxIncomingStreams;
    params.initial_max_streams_uni = 0;
    params.max_idle_timeout = toDuration(options_.idleTimeout);
}

VoidResult SecureSession::setupClient(const std::string& serverName) {
    ngtcp2_cid dcid;
    ngtcp2_cid scid;
    dcid.datalen = CID_LENGTH;
    scid.datalen = CID_LENGTH;
    if (gnutls_rnd(GNUTLS_RND_RANDOM, dcid.data, dcid.datalen) != 0 ||
        gnutls_rnd(GNUTLS_RND_RANDOM, scid.data, scid.datalen) != 0) {
        return Err(ErrorCode::HANDSHAKE_FAILED, "Cannot generate connection ids", "Session");
    }

    ngtcp2_callbacks callbacks;
    fillCallbacks(callbacks);
    ngtcp2_settings settings;
    ngtcp2_transport_params params;
    fillSettings(settings, params);

    int rv = ngtcp2_conn_client_new(&conn_, &dcid, &scid, &pathStorage_.path, NGTCP2_PROTO_VER_V1,
                                    &callbacks, &settings, &params, nullptr, this);
    if (rv != 0) {
        conn_ = nullptr;
        return Err(ErrorCode::HANDSHAKE_FAILED,
                   "Failed to create QUIC connection: " + std::string(ngtcp2_strerror(rv)), "Session");
    }

    auto created = tls_.createSession(serverName);
    if (!created) {
        return created.error();
    }
    return attachTls(created.value());
}

VoidResult SecureSession::setupServer(const ngtcp2_pkt_hd& initial) {
    ngtcp2_cid scid;
    scid.datalen = CID_LENGTH;
    if (gnutls_rnd(GNUTLS_RND_RANDOM, scid.data, scid.datalen) != 0) {
        return Err(ErrorCode::HANDSHAKE_FAILED, "Cannot generate connection id", "Session");
    }

    ngtcp2_callbacks callbacks;
    fillCallbacks(callbacks);
    ngtcp2_settings settings;
    ngtcp2_transport_params params;
    fillSettings(settings, params);
    params.original_dcid = initial.dcid;
    params.original_dcid_present = 1;

    int rv = ngtcp2_conn_server_new(&conn_, &initial.scid, &scid, &pathStorage_.path, initial.version,
                                    &callbacks, &settings, &params, nullptr, this);
    if (rv != 0) {
        conn_ = nullptr;
        return Err(ErrorCode::HANDSHAKE_FAILED,
                   "Failed to create QUIC connection: " + std::string(ngtcp2_strerror(rv)), "Session");
    }

    auto created = tls_.createSession();
    if (!created) {
        return created.error();
    }
    return attachTls(created.value());
}

VoidResult SecureSession::attachTls(gnutls_session_t tlsSession) {
    tlsSession_ = tlsSession;

    int rv = (role_ == Role::CLIENT)
        ? ngtcp2_crypto_gnutls_configure_client_session(tlsSession_)
        : ngtcp2_crypto_gnutls_configure_server_session(tlsSession_);
    if (rv != 0) {
        return Err(ErrorCode::HANDSHAKE_FAILED, "Cannot prepare TLS session for QUIC", "Session");
    }

    gnutls_session_set_ptr(tlsSession_, &connRef_);
    ngtcp2_conn_set_tls_native_handle(conn_, tlsSession_);

    if (options_.keepAlive.count() > 0) {
        ngtcp2_conn_set_keep_alive_timeout(conn_, toDuration(options_.keepAlive));
    }
    return Ok();
}

VoidResult SecureSession::waitForHandshake(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = cv_.wait_for(lock, timeout, [this]() {
        return handshakeDone_ || terminalError_.has_value();
    });

    if (terminalError_) {
        return *terminalError_;
    }
    if (!settled) {
        if (packetReceived_) {
            return Err(ErrorCode::HANDSHAKE_FAILED,
                       "Handshake with " + peerAddress_ + " timed out", "Session");
        }
        return unreachableError("no response");
    }
    return Ok();
}

void SecureSession::deliver(const uint8_t* data, std::size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_ || state_ == State::FINISHED || inbox_.size() >= MAX_INBOX) {
        return;
    }
    inbox_.emplace_back(data, data + size);
    wake();
}

void SecureSession::close(ConnectionCloseCode code, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::OPEN) {
            std::string description = closeCodeName(static_cast<uint64_t>(code));
            if (!reason.empty()) description += ": " + reason;
            terminalError_ = Error(ErrorCode::CONNECTION_CLOSED,
                                   "Connection closed locally (" + description + ")", "Session");
            closeCode_ = code;
            closeReason_ = reason.substr(0, MAX_CLOSE_REASON);
            state_ = State::DRAINING;
            closeDeadline_ = Clock::now() + options_.closeTimeout;
            cv_.notify_all();
            wake();
        }
    }
    join();
}

void SecureSession::abort() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::OPEN || state_ == State::DRAINING) {
            if (!terminalError_) {
                terminalError_ = Error(ErrorCode::CONNECTION_CLOSED, "Connection aborted locally", "Session");
            }
            state_ = State::ABORTED;
            cv_.notify_all();
            wake();
        }
    }
    join();
}

void SecureSession::join() {
    std::lock_guard<std::mutex> lock(joinMutex_);
    if (ioThread_.joinable() && ioThread_.get_id() != std::this_thread::get_id()) {
        ioThread_.join();
    }
}

bool SecureSession::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == State::OPEN;
}

std::optional<Error> SecureSession::terminalError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminalError_;
}

bool SecureSession::hasEnded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ended_;
}

void SecureSession::wake() {
    uint64_t one = 1;
    ssize_t rc = ::write(wakeFd_.get(), &one, sizeof(one));
    (void)rc;  // EAGAIN means a wake-up is already pending
}

// Streams

Result<std::unique_ptr<Stream>> SecureSession::openBidirectionalStream() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminalError_) {
        return *terminalError_;
    }
    if (!conn_ || !handshakeDone_) {
        return Err(ErrorCode::INTERNAL_ERROR, "Handshake with " + peerAddress_ + " not complete", "Session");
    }

    int64_t id = -1;
    int rv = ngtcp2_conn_open_bidi_stream(conn_, &id, nullptr);
    if (rv == NGTCP2_ERR_STREAM_ID_BLOCKED) {
        return Err(ErrorCode::STREAM_LIMIT,
                   "Peer " + peerAddress_ + " allows no more concurrent streams", "Session");
    }
    if (rv != 0) {
        return Err(ErrorCode::INTERNAL_ERROR,
                   "Cannot open stream: " + std::string(ngtcp2_strerror(rv)), "Session");
    }

    auto state = createStreamLocked(id);
    LOG_DEBUG_COMP_IF("Opened stream " + std::to_string(id) + " to " + peerAddress_, "Session");
    return std::unique_ptr<Stream>(new Stream(shared_from_this(), state));
}

Result<std::unique_ptr<Stream>> SecureSession::acceptStream() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !acceptQueue_.empty() || terminalError_.has_value(); });

    if (terminalError_) {
        return Err(ErrorCode::CONNECTION_CLOSED,
                   "Session ended: " + terminalError_->message, "Session");
    }

    auto state = acceptQueue_.front();
    acceptQueue_.pop_front();
    return std::unique_ptr<Stream>(new Stream(shared_from_this(), state));
}

std::shared_ptr<StreamState> SecureSession::createStreamLocked(int64_t id) {
    auto state = std::make_shared<StreamState>();
    state->id = id;
    streams_[id] = state;
    return state;
}

std::shared_ptr<StreamState> SecureSession::findStreamLocked(int64_t id) const {
    auto it = streams_.find(id);
    return it == streams_.end() ? nullptr : it->second;
}

std::shared_ptr<StreamState> SecureSession::nextSendableLocked(const std::set<int64_t>& skipped) {
    // Round robin, starting after the stream that last got data into a packet
    auto start = streams_.upper_bound(lastSentStream_);
    for (auto it = start; it != streams_.end(); ++it) {
        if (it->second->hasPendingSend() && skipped.count(it->first) == 0) {
            return it->second;
        }
    }
    for (auto it = streams_.begin(); it != start; ++it) {
        if (it->second->hasPendingSend() && skipped.count(it->first) == 0) {
            return it->second;
        }
    }
    return nullptr;
}

void SecureSession::returnCreditLocked(int64_t id, std::size_t consumed) {
    if (!conn_ || consumed == 0) {
        return;
    }
    if (id >= 0) {
        int rv = ngtcp2_conn_extend_max_stream_offset(conn_, id, consumed);
        if (rv != 0) {
            LOG_DEBUG_COMP_IF("Cannot extend window of stream " + std::to_string(id) + ": " +
                              ngtcp2_strerror(rv), "Session");
        }
    }
    ngtcp2_conn_extend_max_offset(conn_, consumed);
}

Error SecureSession::peerResetError(const StreamState& stream) {
    return Error(ErrorCode::PEER_RESET, "Stream " + std::to_string(stream.id) + " reset by peer (" +
                 resetCodeName(stream.peerResetCode) + ")", "Session");
}

VoidResult SecureSession::streamWrite(StreamState& stream, const uint8_t* data, std::size_t size) {
    std::unique_lock<std::mutex> lock(mutex_);
    std::size_t offset = 0;

    while (offset < size) {
        cv_.wait(lock, [&]() {
            return stream.unacknowledged() < STREAM_SEND_BUFFER || stream.peerReset || stream.localReset ||
                   stream.localFinished || stream.sendClosed || terminalError_.has_value();
        });

        if (stream.localReset) {
            return Err(ErrorCode::INTERNAL_ERROR, "Write on a reset stream", "Session");
        }
        if (stream.peerReset) {
            return peerResetError(stream);
        }
        if (terminalError_) {
            return *terminalError_;
        }
        if (stream.localFinished) {
            return Err(ErrorCode::INTERNAL_ERROR, "Write after finish", "Session");
        }
        if (stream.sendClosed) {
            return Err(ErrorCode::PEER_RESET,
                       "Stream " + std::to_string(stream.id) + " no longer accepts data", "Session");
        }

        std::size_t n = std::min(size - offset, STREAM_SEND_BUFFER - stream.unacknowledged());
        stream.sendChunks.emplace_back(data + offset, data + offset + n);
        stream.queuedEnd += n;
        offset += n;
        wake();
    }
    return Ok();
}

Result<std::size_t> SecureSession::streamRead(StreamState& stream, uint8_t* buffer, std::size_t maxSize) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]() {
        return stream.buffered > 0 || stream.peerFinished || stream.peerReset ||
               stream.localReset || terminalError_.has_value();
    });

    if (stream.localReset) {
        return Err(ErrorCode::INTERNAL_ERROR, "Read on a reset stream", "Session");
    }
    if (stream.peerReset) {
        return peerResetError(stream);
    }

    if (stream.buffered > 0) {
        std::size_t copied = 0;
        while (copied < maxSize && !stream.chunks.empty()) {
            auto& front = stream.chunks.front();
            std::size_t n = std::min(maxSize - copied, front.size() - stream.frontOffset);
            std::memcpy(buffer + copied, front.data() + stream.frontOffset, n);
            copied += n;
            stream.frontOffset += n;
            if (stream.frontOffset == front.size()) {
                stream.chunks.pop_front();
                stream.frontOffset = 0;
            }
        }
        stream.buffered -= copied;

        // ngtcp2 decides when the grown window is worth a MAX_STREAM_DATA
        if (!stream.peerFinished && state_ == State::OPEN) {
            returnCreditLocked(stream.id, copied);
            wake();
        }
        return copied;
    }

    if (stream.peerFinished) {
        return std::size_t{0};
    }
    return *terminalError_;
}

VoidResult SecureSession::streamFinish(StreamState& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream.localReset) {
        return Err(ErrorCode::INTERNAL_ERROR, "Finish on a reset stream", "Session");
    }
    if (stream.peerReset) {
        return peerResetError(stream);
    }
    if (stream.localFinished) {
        return Ok();
    }
    if (terminalError_) {
        return *terminalError_;
    }
    stream.localFinished = true;
    wake();
    return Ok();
}

void SecureSession::streamReset(StreamState& stream, StreamResetCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream.localReset || stream.peerReset || stream.fullyClosed()) {
        return;
    }
    stream.localReset = true;
    if (conn_ && state_ == State::OPEN) {
        // RESET_STREAM and STOP_SENDING carrying the same code
        int rv = ngtcp2_conn_shutdown_stream(conn_, 0, stream.id, static_cast<uint64_t>(code));
        if (rv != 0) {
            LOG_DEBUG_COMP_IF("Stream " + std::to_string(stream.id) + " already closed: " +
                              ngtcp2_strerror(rv), "Session");
        }
        returnCreditLocked(-1, stream.buffered);
        wake();
    }
    stream.discardReceived();
    LOG_DEBUG_COMP_IF("Reset stream " + std::to_string(stream.id) + " (" +
                      resetCodeName(static_cast<uint64_t>(code)) + ")", "Session");
    cv_.notify_all();
}

void SecureSession::releaseStream(const std::shared_ptr<StreamState>& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream->released = true;
    if (!stream->fullyClosed() && !stream->localReset && !stream->peerReset &&
        conn_ && state_ == State::OPEN) {
        int rv = ngtcp2_conn_shutdown_stream(conn_, 0, stream->id,
                                             static_cast<uint64_t>(StreamResetCode::CANCELLED));
        if (rv != 0) {
            LOG_DEBUG_COMP_IF("Stream " + std::to_string(stream->id) + " already closed: " +
                              ngtcp2_strerror(rv), "Session");
        }
        stream->localReset = true;
        wake();
    }
    if (stream->buffered > 0 && state_ == State::OPEN) {
        returnCreditLocked(-1, stream->buffered);
    }
    stream->discardReceived();

    // ngtcp2 may still retransmit from the send buffer until it closes the stream
    if (stream->transportClosed || !conn_) {
        streams_.erase(stream->id);
    }
    cv_.notify_all();
}

bool SecureSession::sendQueuesDrainedLocked() const {
    return std::all_of(streams_.begin(), streams_.end(),
                       [](const auto& entry) { return entry.second->drained(); });
}

// ngtcp2 callbacks

ngtcp2_conn* SecureSession::getConnCallback(ngtcp2_crypto_conn_ref* ref) {
    return static_cast<SecureSession*>(ref->user_data)->conn_;
}

void SecureSession::randCallback(uint8_t* dest, size_t destlen, const ngtcp2_rand_ctx* rand_ctx) {
    (void)rand_ctx;
    if (gnutls_rnd(GNUTLS_RND_RANDOM, dest, destlen) != 0) {
        Logger::instance().error("gnutls_rnd failed", "Session");
    }
}

int SecureSession::getNewConnectionIdCallback(ngtcp2_conn* conn, ngtcp2_cid* cid, uint8_t* token,
                                              size_t cidlen, void* user_data) {
    (void)conn;
    (void)user_data;

    cid->datalen = cidlen;
    if (gnutls_rnd(GNUTLS_RND_RANDOM, cid->data, cidlen) != 0 ||
        gnutls_rnd(GNUTLS_RND_RANDOM, token, NGTCP2_STATELESS_RESET_TOKENLEN) != 0) {
        return NGTCP2_ERR_CALLBACK_FAILURE;
    }
    return 0;
}

int SecureSession::removeConnectionIdCallback(ngtcp2_conn* conn, const ngtcp2_cid* cid, void* user_data) {
    (void)conn;
    (void)cid;
    (void)user_data;
    return 0;
}

int SecureSession::handshakeCompletedCallback(ngtcp2_conn* conn, void* user_data) {
    (void)conn;
    auto* session = static_cast<SecureSession*>(user_data);

    session->handshakeDone_ = true;
    LOG_DEBUG_COMP_IF("QUIC handshake with " + session->peerAddress_ + " complete (" +
                      TLSContext::describeSession(session->tlsSession_) + ")", "Session");
    session->cv_.notify_all();
    return 0;
}

int SecureSession::recvStreamDataCallback(ngtcp2_conn* conn, uint32_t flags, int64_t stream_id,
                                          uint64_t offset, const uint8_t* data, size_t datalen,
                                          void* user_data, void* stream_user_data) {
    (void)conn;
    (void)offset;
    (void)stream_user_data;
    auto* session = static_cast<SecureSession*>(user_data);

    auto stream = session->findStreamLocked(stream_id);
    if (!stream || stream->released || stream->localReset || stream->peerReset) {
        // Nobody will read it; hand the credit straight back
        session->returnCreditLocked(stream_id, datalen);
        return 0;
    }

    if (datalen > 0) {
        stream->chunks.emplace_back(data, data + datalen);
        stream->buffered += datalen;
    }
    if (flags & NGTCP2_STREAM_DATA_FLAG_FIN) {
        stream->peerFinished = true;
    }
    session->cv_.notify_all();
    return 0;
}

int SecureSession::streamOpenCallback(ngtcp2_conn* conn, int64_t stream_id, void* user_data) {
    (void)conn;
    auto* session = static_cast<SecureSession*>(user_data);

    auto state = session->createStreamLocked(stream_id);
    session->acceptQueue_.push_back(state);
    LOG_DEBUG_COMP_IF("Peer " + session->peerAddress_ + " opened stream " + std::to_string(stream_id),
                      "Session");
    session->cv_.notify_all();
    return 0;
}

int SecureSession::streamCloseCallback(ngtcp2_conn* conn, uint32_t flags, int64_t stream_id,
                                       uint64_t app_error_code, void* user_data, void* stream_user_data) {
    (void)flags;
    (void)app_error_code;
    (void)stream_user_data;
    auto* session = static_cast<SecureSession*>(user_data);

    // Credit for streams the peer opened is only returned on request
    if (!ngtcp2_conn_is_local_stream(conn, stream_id)) {
        ngtcp2_conn_extend_max_streams_bidi(conn, 1);
    }

    auto stream = session->findStreamLocked(stream_id);
    if (stream) {
        stream->transportClosed = true;
        if (stream->released) {
            session->streams_.erase(stream_id);
        }
        session->cv_.notify_all();
    }
    return 0;
}

int SecureSession::streamResetCallback(ngtcp2_conn* conn, int64_t stream_id, uint64_t final_size,
                                       uint64_t app_error_code, void* user_data, void* stream_user_data) {
    (void)final_size;
    return streamStopSendingCallback(conn, stream_id, app_error_code, user_data, stream_user_data);
}

int SecureSession::streamStopSendingCallback(ngtcp2_conn* conn, int64_t stream_id, uint64_t app_error_code,
                                             void* user_data, void* stream_user_data) {
    (void)conn;
    (void)stream_user_data;
    auto* session = static_cast<SecureSession*>(user_data);

    // Either half of the peer's reset ends both directions here
    auto stream = session->findStreamLocked(stream_id);
    if (stream && !stream->peerReset && !stream->localReset) {
        stream->peerReset = true;
        stream->peerResetCode = app_error_code;
        session->returnCreditLocked(-1, stream->buffered);
        stream->discardReceived();
        session->cv_.notify_all();
    }
    return 0;
}

int SecureSession::ackedStreamDataOffsetCallback(ngtcp2_conn* conn, int64_t stream_id, uint64_t offset,
                                                 uint64_t datalen, void* user_data, void* stream_user_data) {
    (void)conn;
    (void)stream_user_data;
    auto* session = static_cast<SecureSession*>(user_data);

    // ngtcp2 reports the contiguously acknowledged prefix
    auto stream = session->findStreamLocked(stream_id);
    if (stream) {
        stream->acknowledge(offset + datalen);
        session->cv_.notify_all();
    }
    return 0;
}

// Packet I/O, called with mutex_ held

void SecureSession::readPacketLocked(const uint8_t* data, std::size_t size) {
    if (!conn_ || state_ == State::FINISHED) {
        return;
    }

    ngtcp2_pkt_info pi;
    std::memset(&pi, 0, sizeof(pi));
    int rv = ngtcp2_conn_read_pkt(conn_, &pathStorage_.path, &pi, data, size, timestamp());
    if (rv == 0 || rv == NGTCP2_ERR_DRAINING) {
        packetReceived_ = true;
    }
    if (rv != 0) {
        handleLibraryErrorLocked(rv);
    }
}

bool SecureSession::receiveFromSocketLocked() {
    for (std::size_t i = 0; i < MAX_READS_PER_WAKE && state_ != State::FINISHED; ++i) {
        ssize_t n = ::recv(socket_->get(), recvBuf_.data(), recvBuf_.size(), 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return true;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECONNREFUSED) {
                failLocked(unreachableError("connection refused"));
                return false;
            }
            failLocked(Error(ErrorCode::CONNECTION_LOST,
                             "Receive from " + peerAddress_ + " failed: " + strerror(errno), "Session"));
            return false;
        }
        readPacketLocked(recvBuf_.data(), static_cast<std::size_t>(n));
    }
    return state_ != State::FINISHED;
}

bool SecureSession::sendDatagramLocked(const uint8_t* data, std::size_t size) {
    ssize_t sent;
    do {
        if (role_ == Role::CLIENT) {
            sent = ::send(socket_->get(), data, size, 0);
        } else {
            sent = ::sendto(socket_->get(), data, size, 0,
                            reinterpret_cast<const sockaddr*>(&path_.remote), path_.remoteLength);
        }
    } while (sent < 0 && errno == EINTR);

    if (sent >= 0) {
        return true;
    }
    // A dropped datagram is recovered by QUIC loss detection
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS) {
        return true;
    }
    if (errno == ECONNREFUSED) {
        failLocked(unreachableError("connection refused"));
        return false;
    }
    failLocked(Error(ErrorCode::CONNECTION_LOST,
                     "Send to " + peerAddress_ + " failed: " + strerror(errno), "Session"));
    return false;
}

bool SecureSession::writePacketsLocked() {
    if (!conn_) {
        return false;
    }

    ngtcp2_path_storage ps;
    ngtcp2_path_storage_zero(&ps);
    ngtcp2_pkt_info pi;
    std::array<ngtcp2_vec, MAX_WRITE_VECS> vecs;
    std::set<int64_t> skipped;
    uint64_t ts = timestamp();

    for (std::size_t packets = 0; packets < MAX_PACKETS_PER_WRITE;) {
        auto stream = nextSendableLocked(skipped);
        int64_t streamId = -1;
        std::size_t vecCount = 0;
        bool fin = false;
        uint32_t flags = NGTCP2_WRITE_STREAM_FLAG_MORE;
        if (stream) {
            streamId = stream->id;
            vecCount = stream->pendingVecs(vecs.data(), vecs.size(), fin);
            if (fin) {
                flags |= NGTCP2_WRITE_STREAM_FLAG_FIN;
            }
        }

        ngtcp2_ssize accepted = -1;
        ngtcp2_ssize n = ngtcp2_conn_writev_stream(conn_, &ps.path, &pi, sendBuf_.data(), sendBuf_.size(),
                                                   &accepted, flags, streamId, vecs.data(), vecCount, ts);
        if (n < 0) {
            switch (n) {
                case NGTCP2_ERR_WRITE_MORE:
                    // Packet has room left; keep filling it
                    if (!stream) {
                        return false;
                    }
                    if (stream->consumed(accepted, fin)) {
                        lastSentStream_ = streamId;
                    } else {
                        skipped.insert(streamId);
                    }
                    continue;
                case NGTCP2_ERR_STREAM_DATA_BLOCKED:
                    skipped.insert(streamId);
                    continue;
                case NGTCP2_ERR_STREAM_SHUT_WR:
                case NGTCP2_ERR_STREAM_NOT_FOUND:
                    stream->sendClosed = true;
                    cv_.notify_all();
                    continue;
                default:
                    handleLibraryErrorLocked(static_cast<int>(n));
                    return false;
            }
        }

        if (stream && stream->consumed(accepted, fin)) {
            lastSentStream_ = streamId;
        }
        if (n == 0) {
            ngtcp2_conn_update_pkt_tx_time(conn_, ts);
            // Congestion or pacing limited while stream data waits
            return stream != nullptr;
        }
        if (!sendDatagramLocked(sendBuf_.data(), static_cast<std::size_t>(n))) {
            return false;
        }
        ++packets;
    }

    ngtcp2_conn_update_pkt_tx_time(conn_, ts);
    return true;
}

void SecureSession::sendConnectionCloseLocked(const ngtcp2_ccerr& ccerr) {
    if (!conn_ || ngtcp2_conn_in_closing_period(conn_) || ngtcp2_conn_in_draining_period(conn_)) {
        return;
    }

    ngtcp2_path_storage ps;
    ngtcp2_path_storage_zero(&ps);
    ngtcp2_pkt_info pi;
    ngtcp2_ssize n = ngtcp2_conn_write_connection_close(conn_, &ps.path, &pi, sendBuf_.data(), sendBuf_.size(),
                                                        &ccerr, timestamp());
    if (n < 0) {
        LOG_DEBUG_COMP_IF("Cannot write CONNECTION_CLOSE: " + std::string(ngtcp2_strerror(static_cast<int>(n))),
                          "Session");
        return;
    }
    if (n > 0) {
        sendDatagramLocked(sendBuf_.data(), static_cast<std::size_t>(n));
    }
}

void SecureSession::handleLibraryErrorLocked(int rv) {
    switch (rv) {
        case NGTCP2_ERR_DRAINING:
            finishLocked(peerCloseError());
            return;

        case NGTCP2_ERR_IDLE_CLOSE:
            if (!handshakeDone_) {
                finishLocked(packetReceived_
                    ? Error(ErrorCode::HANDSHAKE_FAILED, "Handshake with " + peerAddress_ + " stalled", "Session")
                    : unreachableError("no response"));
                return;
            }
            Logger::instance().warn("Session with " + peerAddress_ + " idle for " +
                                    std::to_string(options_.idleTimeout.count()) + "ms", "Session");
            finishLocked(Error(ErrorCode::IDLE_TIMEOUT,
                               "No packets from peer within the idle timeout", "Session"));
            return;

        case NGTCP2_ERR_HANDSHAKE_TIMEOUT:
            finishLocked(packetReceived_
                ? Error(ErrorCode::HANDSHAKE_FAILED, "Handshake with " + peerAddress_ + " timed out", "Session")
                : unreachableError("no response"));
            return;

        case NGTCP2_ERR_CLOSING:
        case NGTCP2_ERR_DROP_CONN:
            finishLocked(Error(ErrorCode::CONNECTION_LOST,
                               "Connection to " + peerAddress_ + " dropped: " + ngtcp2_strerror(rv), "Session"));
            return;

        default:
            break;
    }

    ngtcp2_ccerr ccerr;
    ngtcp2_ccerr_default(&ccerr);
    Error error;
    if (rv == NGTCP2_ERR_CRYPTO) {
        uint8_t alert = ngtcp2_conn_get_tls_alert(conn_);
        ngtcp2_ccerr_set_tls_alert(&ccerr, alert, nullptr, 0);
        const char* alertName = gnutls_alert_get_name(static_cast<gnutls_alert_description_t>(alert));
        error = tls_.handshakeFailure(tlsSession_, alertName ? alertName : ngtcp2_strerror(rv));
    } else {
        ngtcp2_ccerr_set_liberr(&ccerr, rv, nullptr, 0);
        error = Error(handshakeDone_ ? ErrorCode::PROTOCOL_VIOLATION : ErrorCode::HANDSHAKE_FAILED,
                      "QUIC error from " + peerAddress_ + ": " + ngtcp2_strerror(rv), "Session");
    }
    sendConnectionCloseLocked(ccerr);
    failLocked(error);
}

Error SecureSession::peerCloseError() const {
    const ngtcp2_ccerr* ccerr = ngtcp2_conn_get_ccerr(conn_);
    std::string reason;
    if (ccerr->reason && ccerr->reasonlen > 0) {
        reason.assign(reinterpret_cast<const char*>(ccerr->reason), ccerr->reasonlen);
    }

    if (ccerr->type == NGTCP2_CCERR_TYPE_APPLICATION && handshakeDone_) {
        std::string description = closeCodeName(ccerr->error_code);
        if (!reason.empty()) description += ": " + reason;
        LOG_DEBUG_COMP_IF("Peer " + peerAddress_ + " closed connection (" + description + ")", "Session");
        return Error(ErrorCode::CONNECTION_CLOSED, "Peer closed connection (" + description + ")", "Session");
    }

    std::string description = "transport error " + std::to_string(ccerr->error_code);
    if (!reason.empty()) description += ": " + reason;
    if (!handshakeDone_) {
        return Error(ErrorCode::HANDSHAKE_FAILED,
                     "Peer " + peerAddress_ + " closed during handshake (" + description + ")", "Session");
    }
    return Error(ErrorCode::CONNECTION_LOST, "Peer dropped connection (" + description + ")", "Session");
}

Error SecureSession::unreachableError(const std::string& detail) const {
    if (handshakeDone_) {
        return Error(ErrorCode::CONNECTION_LOST, "Lost connection to " + peerAddress_ + ": " + detail, "Session");
    }
    return Error(ErrorCode::CONNECTION_FAILED, "Cannot reach " + peerAddress_ + ": " + detail, "Session");
}

void SecureSession::failLocked(Error error) {
    if (state_ == State::FINISHED) {
        return;
    }
    Logger::instance().warn("Session with " + peerAddress_ + " failed: " + error.message, "Session");
    finishLocked(std::move(error));
}

void SecureSession::finishLocked(Error error) {
    if (!terminalError_) {
        terminalError_ = std::move(error);
    }
    state_ = State::FINISHED;
    cv_.notify_all();
}

// I/O thread

int SecureSession::pollTimeoutMs(uint64_t now, bool sendPending) const {
    if (sendPending) {
        return 1;
    }

    int timeout = 1000;
    uint64_t expiry = ngtcp2_conn_get_expiry(conn_);
    if (expiry <= now) {
        return 0;
    }
    uint64_t wait = (expiry - now + NGTCP2_MILLISECONDS - 1) / NGTCP2_MILLISECONDS;
    timeout = static_cast<int>(std::min<uint64_t>(wait, static_cast<uint64_t>(timeout)));

    if (state_ == State::DRAINING) {
        timeout = std::min(timeout, 50);
    }
    return timeout;
}

void SecureSession::ioLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    for (;;) {
        if (state_ == State::FINISHED) {
            break;
        }
        if (state_ == State::ABORTED) {
            ngtcp2_ccerr ccerr;
            ngtcp2_ccerr_default(&ccerr);
            static const char ABORTED[] = "aborted";
            ngtcp2_ccerr_set_transport_error(&ccerr, NGTCP2_INTERNAL_ERROR,
                                             reinterpret_cast<const uint8_t*>(ABORTED), sizeof(ABORTED) - 1);
            sendConnectionCloseLocked(ccerr);
            finishLocked(Error(ErrorCode::CONNECTION_CLOSED, "Connection aborted locally", "Session"));
            break;
        }

        if (role_ == Role::CLIENT) {
            receiveFromSocketLocked();
        } else {
            while (!inbox_.empty() && state_ != State::FINISHED) {
                std::vector<uint8_t> datagram = std::move(inbox_.front());
                inbox_.pop_front();
                readPacketLocked(datagram.data(), datagram.size());
            }
        }
        if (state_ == State::FINISHED) {
            break;
        }

        uint64_t now = timestamp();
        if (ngtcp2_conn_get_expiry(conn_) <= now) {
            int rv = ngtcp2_conn_handle_expiry(conn_, now);
            if (rv != 0) {
                handleLibraryErrorLocked(rv);
                continue;
            }
        }

        if (state_ == State::DRAINING &&
            (!handshakeDone_ || sendQueuesDrainedLocked() || Clock::now() >= closeDeadline_)) {
            if (handshakeDone_) {
                ngtcp2_ccerr ccerr;
                ngtcp2_ccerr_default(&ccerr);
                ngtcp2_ccerr_set_application_error(&ccerr, static_cast<uint64_t>(closeCode_),
                                                   reinterpret_cast<const uint8_t*>(closeReason_.data()),
                                                   closeReason_.size());
                sendConnectionCloseLocked(ccerr);
            }
            finishLocked(Error(ErrorCode::CONNECTION_CLOSED, "Connection closed", "Session"));
            break;
        }

        bool sendPending = writePacketsLocked();
        if (state_ == State::FINISHED) {
            break;
        }

        struct pollfd fds[2];
        fds[0].fd = wakeFd_.get();
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = socket_->get();
        fds[1].events = POLLIN;
        fds[1].revents = 0;
        // Server sessions get their datagrams through deliver()
        nfds_t count = role_ == Role::CLIENT ? 2 : 1;

        int timeout = pollTimeoutMs(timestamp(), sendPending);
        lock.unlock();
        int ready = ::poll(fds, count, timeout);
        int pollErrno = errno;
        if (ready > 0 && (fds[0].revents & POLLIN)) {
            uint64_t counter;
            ssize_t drained = ::read(wakeFd_.get(), &counter, sizeof(counter));
            (void)drained;
        }
        lock.lock();

        if (ready < 0 && pollErrno != EINTR) {
            finishLocked(Error(ErrorCode::CONNECTION_LOST,
                               "poll failed: " + std::string(strerror(pollErrno)), "Session"));
            break;
        }
    }

    if (conn_) {
        ngtcp2_conn_del(conn_);
        conn_ = nullptr;
    }
    if (tlsSession_) {
        gnutls_deinit(tlsSession_);
        tlsSession_ = nullptr;
    }
    inbox_.clear();
    acceptQueue_.clear();
    ended_ = true;
    std::optional<Error> reason = terminalError_;
    cv_.notify_all();
    lock.unlock();

    if (reason) {
        LOG_DEBUG_COMP_IF("Session with " + peerAddress_ + " ended: " + reason->toString(), "Session");
    }
}

} // namespace Ferry
