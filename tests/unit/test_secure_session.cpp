#include <gtest/gtest.h>

#include "CertificateProvider.h"
#include "SecureEndpoint.h"
#include "SecureSession.h"
#include "TestDoubles.h"

#include <atomic>
#include <map>
#include <thread>

using namespace Ferry;
using namespace Ferry::Testing;

namespace {
    /// Read until end of data; returns the error of the first failed read
    Result<std::vector<uint8_t>> readAll(ITransferStream& stream) {
        std::vector<uint8_t> data;
        uint8_t buffer[32 * 1024];
        for (;;) {
            auto n = stream.read(buffer, sizeof(buffer));
            if (!n) {
                return n.error();
            }
            if (n.value() == 0) {
                return data;
            }
            data.insert(data.end(), buffer, buffer + n.value());
        }
    }

    bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds limit) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }
}

class SecureSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        certPath_ = (dir_ / "cert.pem").string();
        keyPath_ = (dir_ / "key.pem").string();
        ASSERT_TRUE(CertificateProvider::generateSelfSigned(certPath_, keyPath_, {"localhost", "127.0.0.1"}));

        ASSERT_TRUE(serverTls_.initialize());
        ASSERT_TRUE(serverTls_.loadCertificate(certPath_, keyPath_));
        ASSERT_TRUE(clientTls_.initialize());
        ASSERT_TRUE(clientTls_.loadTrustAnchor(certPath_));
    }

    void TearDown() override {
        if (client_) client_->abort();
        if (server_) server_->abort();
        listener_.reset();
    }

    // Server sessions receive through the listener, so it lives as long as the test
    void connectPair(SessionOptions serverOptions = {}, SessionOptions clientOptions = {}) {
        listener_ = std::make_unique<SecureListener>(serverTls_, serverOptions);
        ASSERT_TRUE(listener_->bind(NetAddress::parse("127.0.0.1:0").value()));
        NetAddress local = listener_->localAddress();

        std::shared_ptr<SecureSession> serverSide;
        std::thread acceptor([&]() {
            auto pending = listener_->accept(std::chrono::milliseconds(5000));
            if (!pending || !pending.value()) return;
            auto session = listener_->handshake(std::move(*pending.value()));
            if (session) serverSide = session.value();
        });

        auto client = connectSecure(local, "localhost", clientTls_, clientOptions);
        acceptor.join();

        ASSERT_TRUE(client) << client.error().toString();
        ASSERT_TRUE(serverSide);
        client_ = client.value();
        server_ = serverSide;
    }

    TempDir dir_{"session"};
    std::string certPath_;
    std::string keyPath_;
    TLSContext serverTls_{TLSContext::Mode::SERVER};
    TLSContext clientTls_{TLSContext::Mode::CLIENT};
    std::unique_ptr<SecureListener> listener_;
    std::shared_ptr<SecureSession> client_;
    std::shared_ptr<SecureSession> server_;
};

TEST_F(SecureSessionTest, HalfCloseEndsEachDirectionIndependently) {
    connectPair();
    EXPECT_EQ(client_->role(), SecureSession::Role::CLIENT);
    EXPECT_EQ(server_->role(), SecureSession::Role::SERVER);

    auto opened = client_->openBidirectionalStream();
    ASSERT_TRUE(opened);
    auto& outgoing = *opened.value();
    EXPECT_EQ(outgoing.id() % 4, 0u);

    const std::string request = "hello";
    ASSERT_TRUE(outgoing.write(reinterpret_cast<const uint8_t*>(request.data()), request.size()));
    ASSERT_TRUE(outgoing.finish());

    auto accepted = server_->acceptStream();
    ASSERT_TRUE(accepted);
    auto& incoming = *accepted.value();
    EXPECT_EQ(incoming.id(), outgoing.id());

    auto received = readAll(incoming);
    ASSERT_TRUE(received) << received.error().toString();
    EXPECT_EQ(std::string(received.value().begin(), received.value().end()), request);

    // The server can still answer after the client half-closed
    const std::string reply = "stored";
    ASSERT_TRUE(incoming.write(reinterpret_cast<const uint8_t*>(reply.data()), reply.size()));
    ASSERT_TRUE(incoming.finish());

    auto answer = readAll(outgoing);
    ASSERT_TRUE(answer) << answer.error().toString();
    EXPECT_EQ(std::string(answer.value().begin(), answer.value().end()), reply);
}

TEST_F(SecureSessionTest, ServerInitiatedStreamsUseServerIds) {
    connectPair();

    auto opened = server_->openBidirectionalStream();
    ASSERT_TRUE(opened);
    EXPECT_EQ(opened.value()->id() % 4, 1u);
    ASSERT_TRUE(opened.value()->finish());

    auto accepted = client_->acceptStream();
    ASSERT_TRUE(accepted);
    EXPECT_EQ(accepted.value()->id(), opened.value()->id());
}

TEST_F(SecureSessionTest, ConcurrentStreamsAreMultiplexed) {
    connectPair();
    const std::size_t streamCount = 3;
    const std::size_t size = 2 * 1024 * 1024 + 123;

    std::map<uint64_t, std::vector<uint8_t>> received;
    std::mutex receivedMutex;
    std::vector<std::thread> readers;
    std::thread serverLoop([&]() {
        for (std::size_t i = 0; i < streamCount; ++i) {
            auto accepted = server_->acceptStream();
            if (!accepted) return;
            std::shared_ptr<Stream> stream(std::move(accepted.value()));
            readers.emplace_back([stream, &received, &receivedMutex]() {
                auto data = readAll(*stream);
                if (data && stream->finish()) {
                    std::lock_guard<std::mutex> lock(receivedMutex);
                    received[stream->id()] = std::move(data.value());
                }
            });
        }
    });

    std::map<uint64_t, std::vector<uint8_t>> sent;
    std::vector<std::thread> writers;
    std::vector<std::unique_ptr<Stream>> streams;
    for (std::size_t i = 0; i < streamCount; ++i) {
        auto opened = client_->openBidirectionalStream();
        ASSERT_TRUE(opened);
        streams.push_back(std::move(opened.value()));
        sent[streams.back()->id()] = randomBytes(size, static_cast<uint32_t>(i + 1));
    }
    std::atomic<int> failures{0};
    for (auto& stream : streams) {
        Stream* raw = stream.get();
        const auto& payload = sent[raw->id()];
        writers.emplace_back([raw, &payload, &failures]() {
            if (!raw->write(payload.data(), payload.size()) || !raw->finish()) {
                ++failures;
                return;
            }
            uint8_t byte;
            auto ack = raw->read(&byte, 1);
            if (!ack || ack.value() != 0) ++failures;
        });
    }

    for (auto& t : writers) t.join();
    serverLoop.join();
    for (auto& t : readers) t.join();

    EXPECT_EQ(failures.load(), 0);
    ASSERT_EQ(received.size(), streamCount);
    for (const auto& entry : sent) {
        EXPECT_EQ(received[entry.first], entry.second) << "stream " << entry.first;
    }
}

TEST_F(SecureSessionTest, WriterBlocksWhileReceiverDoesNotRead) {
    connectPair();
    auto opened = client_->openBidirectionalStream();
    ASSERT_TRUE(opened);
    auto& outgoing = *opened.value();

    auto payload = randomBytes(3 * STREAM_RECEIVE_WINDOW);
    std::atomic<bool> done{false};
    std::thread writer([&]() {
        EXPECT_TRUE(outgoing.write(payload.data(), payload.size()));
        EXPECT_TRUE(outgoing.finish());
        done = true;
    });

    auto accepted = server_->acceptStream();
    ASSERT_TRUE(accepted);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_FALSE(done.load());

    auto received = readAll(*accepted.value());
    writer.join();
    ASSERT_TRUE(received) << received.error().toString();
    EXPECT_EQ(received.value(), payload);
    EXPECT_TRUE(done.load());
}

TEST_F(SecureSessionTest, PeerResetIsReportedWithItsCode) {
    connectPair();
    auto opened = client_->openBidirectionalStream();
    ASSERT_TRUE(opened);
    auto& outgoing = *opened.value();
    const uint8_t byte = 1;
    ASSERT_TRUE(outgoing.write(&byte, 1));

    auto accepted = server_->acceptStream();
    ASSERT_TRUE(accepted);
    accepted.value()->reset(StreamResetCode::SINK_FAILED);

    auto read = readAll(outgoing);
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().code, ErrorCode::PEER_RESET);
    EXPECT_NE(read.error().message.find("SINK_FAILED"), std::string::npos);

    // The session itself survives a stream reset
    EXPECT_TRUE(client_->isOpen());
    EXPECT_TRUE(client_->openBidirectionalStream());
}

TEST_F(SecureSessionTest, DroppedHandleCancelsStream) {
    connectPair();
    auto opened = client_->openBidirectionalStream();
    ASSERT_TRUE(opened);
    const uint8_t byte = 1;
    ASSERT_TRUE(opened.value()->write(&byte, 1));

    auto accepted = server_->acceptStream();
    ASSERT_TRUE(accepted);
    opened.value().reset();

    auto read = readAll(*accepted.value());
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().code, ErrorCode::PEER_RESET);
    EXPECT_NE(read.error().message.find("CANCELLED"), std::string::npos);
}

TEST_F(SecureSessionTest, StreamsBeyondLimitAreRefused) {
    SessionOptions serverOptions;
    serverOptions.maxIncomingStreams = 1;
    connectPair(serverOptions);

    const uint8_t byte = 1;
    auto first = client_->openBidirectionalStream();
    ASSERT_TRUE(first);
    ASSERT_TRUE(first.value()->write(&byte, 1));
    auto accepted = server_->acceptStream();
    ASSERT_TRUE(accepted);

    auto second = client_->openBidirectionalStream();
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, ErrorCode::STREAM_LIMIT);
    EXPECT_TRUE(client_->isOpen());

    // The first stream is unaffected
    ASSERT_TRUE(first.value()->finish());
    auto received = readAll(*accepted.value());
    ASSERT_TRUE(received) << received.error().toString();
    EXPECT_EQ(received.value(), std::vector<uint8_t>{byte});
}

TEST_F(SecureSessionTest, StreamCreditReturnsOnceStreamsClose) {
    SessionOptions serverOptions;
    serverOptions.maxIncomingStreams = 1;
    connectPair(serverOptions);

    for (int round = 0; round < 3; ++round) {
        std::unique_ptr<Stream> outgoing;
        ASSERT_TRUE(waitUntil([&]() {
            auto opened = client_->openBidirectionalStream();
            if (!opened) return false;
            outgoing = std::move(opened.value());
            return true;
        }, std::chrono::seconds(5))) << "round " << round;

        const uint8_t byte = static_cast<uint8_t>(round);
        ASSERT_TRUE(outgoing->write(&byte, 1));
        ASSERT_TRUE(outgoing->finish());

        auto accepted = server_->acceptStream();
        ASSERT_TRUE(accepted);
        auto received = readAll(*accepted.value());
        ASSERT_TRUE(received);
        ASSERT_TRUE(accepted.value()->finish());
        auto answer = readAll(*outgoing);
        ASSERT_TRUE(answer) << answer.error().toString();
    }
}

TEST_F(SecureSessionTest, GracefulCloseDeliversQueuedDataFirst) {
    connectPair();
    auto opened = client_->openBidirectionalStream();
    ASSERT_TRUE(opened);
    auto payload = randomBytes(512 * 1024);
    ASSERT_TRUE(opened.value()->write(payload.data(), payload.size()));
    ASSERT_TRUE(opened.value()->finish());

    auto accepted = server_->acceptStream();
    ASSERT_TRUE(accepted);

    client_->close(ConnectionCloseCode::NO_ERROR, "done");
    EXPECT_FALSE(client_->isOpen());
    ASSERT_TRUE(client_->terminalError().has_value());
    EXPECT_EQ(client_->terminalError()->code, ErrorCode::CONNECTION_CLOSED);

    auto received = readAll(*accepted.value());
    ASSERT_TRUE(received) << received.error().toString();
    EXPECT_EQ(received.value(), payload);

    ASSERT_TRUE(waitUntil([this]() { return !server_->isOpen(); }, std::chrono::seconds(5)));
    auto reason = server_->terminalError();
    ASSERT_TRUE(reason.has_value());
    EXPECT_EQ(reason->code, ErrorCode::CONNECTION_CLOSED);
    EXPECT_NE(reason->message.find("done"), std::string::npos);

    auto next = server_->acceptStream();
    ASSERT_FALSE(next);
    EXPECT_EQ(next.error().code, ErrorCode::CONNECTION_CLOSED);
}

TEST_F(SecureSessionTest, AbortIsSeenAsConnectionLost) {
    connectPair();
    auto opened = client_->openBidirectionalStream();
    ASSERT_TRUE(opened);
    const std::string partial = "partial";
    ASSERT_TRUE(opened.value()->write(reinterpret_cast<const uint8_t*>(partial.data()), partial.size()));

    auto accepted = server_->acceptStream();
    ASSERT_TRUE(accepted);
    uint8_t buffer[64];
    std::size_t got = 0;
    while (got < partial.size()) {
        auto n = accepted.value()->read(buffer, sizeof(buffer));
        ASSERT_TRUE(n);
        ASSERT_GT(n.value(), 0u);
        got += n.value();
    }

    client_->abort();

    auto read = accepted.value()->read(buffer, sizeof(buffer));
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().code, ErrorCode::CONNECTION_LOST);
    EXPECT_FALSE(server_->isOpen());

    auto write = opened.value()->write(buffer, 1);
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().code, ErrorCode::CONNECTION_CLOSED);
}

TEST_F(SecureSessionTest, SilentPeerHitsIdleTimeout) {
    SessionOptions serverOptions;
    serverOptions.idleTimeout = std::chrono::milliseconds(300);
    serverOptions.keepAlive = std::chrono::milliseconds(0);
    SessionOptions clientOptions;
    clientOptions.idleTimeout = std::chrono::milliseconds(0);
    clientOptions.keepAlive = std::chrono::milliseconds(0);
    connectPair(serverOptions, clientOptions);

    ASSERT_TRUE(waitUntil([this]() { return !server_->isOpen(); }, std::chrono::seconds(5)));
    auto reason = server_->terminalError();
    ASSERT_TRUE(reason.has_value());
    EXPECT_EQ(reason->code, ErrorCode::IDLE_TIMEOUT);
}

TEST_F(SecureSessionTest, KeepAliveHoldsIdleSessionOpen) {
    SessionOptions options;
    options.idleTimeout = std::chrono::milliseconds(400);
    options.keepAlive = std::chrono::milliseconds(100);
    connectPair(options, options);

    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_TRUE(server_->isOpen());
    EXPECT_TRUE(client_->isOpen());
}

TEST_F(SecureSessionTest, WrongServerNameIsRejected) {
    SecureListener listener(serverTls_, SessionOptions{});
    ASSERT_TRUE(listener.bind(NetAddress::parse("127.0.0.1:0").value()));
    NetAddress local = listener.localAddress();

    std::thread acceptor([&]() {
        auto pending = listener.accept(std::chrono::milliseconds(5000));
        if (pending && pending.value()) {
            auto session = listener.handshake(std::move(*pending.value()));
            EXPECT_FALSE(session);
        }
    });

    auto client = connectSecure(local, "files.example", clientTls_, SessionOptions{});
    acceptor.join();
    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, ErrorCode::CERTIFICATE_REJECTED);
}

TEST_F(SecureSessionTest, ConnectToClosedPortFails) {
    NetAddress closed;
    {
        SecureListener listener(serverTls_, SessionOptions{});
        ASSERT_TRUE(listener.bind(NetAddress::parse("127.0.0.1:0").value()));
        closed = listener.localAddress();
    }

    auto client = connectSecure(closed, "localhost", clientTls_, SessionOptions{});
    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, ErrorCode::CONNECTION_FAILED);
}
