#include <gtest/gtest.h>

#include "Options.h"
#include "TestDoubles.h"

#include <fstream>

using namespace Ferry;
using Ferry::Testing::TempDir;

TEST(OptionsTest, ServerDefaults) {
    auto parsed = Options::parseServer({});
    ASSERT_TRUE(parsed) << parsed.error().toString();
    const auto& options = parsed.value();
    EXPECT_FALSE(options.showHelp);
    EXPECT_EQ(options.acceptor.listenAddress.toString(), "0.0.0.0:4433");
    EXPECT_EQ(options.acceptor.certPath, "certs/server-cert.pem");
    EXPECT_EQ(options.acceptor.keyPath, "certs/server-key.pem");
    EXPECT_EQ(options.acceptor.outputDir, "received");
    EXPECT_EQ(options.acceptor.maxTransfers, 16u);
    EXPECT_EQ(options.acceptor.chunkSize, StreamFramer::DEFAULT_CHUNK_SIZE);
    EXPECT_EQ(options.acceptor.session.idleTimeout.count(), 30000);
    EXPECT_EQ(options.acceptor.session.keepAlive.count(), 10000);
    EXPECT_EQ(options.logLevel, LogLevel::INFO);
    EXPECT_TRUE(options.logFile.empty());
    EXPECT_EQ(options.logMaxMb, DEFAULT_LOG_MAX_MB);
}

TEST(OptionsTest, ServerFlags) {
    auto parsed = Options::parseServer({"--addr", "127.0.0.1:0", "--output", "/tmp/in",
                                        "--max-transfers", "4", "--chunk-size", "1024",
                                        "--idle-timeout", "600", "--log-level", "debug",
                                        "--log-file", "server.log", "--log-max-mb", "5"});
    ASSERT_TRUE(parsed) << parsed.error().toString();
    const auto& options = parsed.value();
    EXPECT_EQ(options.acceptor.listenAddress.port, 0);
    EXPECT_EQ(options.acceptor.outputDir, "/tmp/in");
    EXPECT_EQ(options.acceptor.maxTransfers, 4u);
    EXPECT_EQ(options.acceptor.chunkSize, 1024u);
    EXPECT_EQ(options.acceptor.session.idleTimeout.count(), 600);
    EXPECT_EQ(options.acceptor.session.keepAlive.count(), 200);
    EXPECT_EQ(options.logLevel, LogLevel::DEBUG);
    EXPECT_EQ(options.logFile, "server.log");
    EXPECT_EQ(options.logMaxMb, 5u);
}

TEST(OptionsTest, FlagsOverrideConfigFileOverridesDefaults) {
    TempDir dir("options");
    auto path = dir / "server.conf";
    {
        std::ofstream out(path);
        out << "output_dir = from-file\n"
            << "max_transfers = 8\n"
            << "keepalive_ms = 1234\n"
            << "max_streams_per_session = 3\n";
    }

    auto parsed = Options::parseServer({"--max-transfers", "2", "--config", path.string()});
    ASSERT_TRUE(parsed) << parsed.error().toString();
    const auto& options = parsed.value();
    EXPECT_EQ(options.acceptor.outputDir, "from-file");
    EXPECT_EQ(options.acceptor.maxTransfers, 2u);
    EXPECT_EQ(options.acceptor.session.keepAlive.count(), 1234);
    EXPECT_EQ(options.acceptor.session.maxIncomingStreams, 3u);
    EXPECT_EQ(options.acceptor.certPath, "certs/server-cert.pem");
}

TEST(OptionsTest, HelpShortCircuitsValidation) {
    auto parsed = Options::parseServer({"--max-transfers", "0", "--help"});
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(parsed.value().showHelp);

    auto client = Options::parseClient({"--help"});
    ASSERT_TRUE(client);
    EXPECT_TRUE(client.value().showHelp);
}

TEST(OptionsTest, InvalidServerValues) {
    const std::vector<std::vector<std::string>> cases = {
        {"--max-transfers", "0"},
        {"--max-transfers", "abc"},
        {"--chunk-size", "0"},
        {"--chunk-size", "99999999"},
        {"--idle-timeout", "-1"},
        {"--log-level", "loud"},
        {"--log-max-mb", "0"},
        {"--log-max-mb", "99999"},
        {"--output", ""},
        {"--bogus"},
        {"--addr"},
        {"--config", "/nonexistent/ferry.conf"},
    };
    for (const auto& args : cases) {
        auto parsed = Options::parseServer(args);
        ASSERT_FALSE(parsed) << args[0];
        EXPECT_EQ(parsed.error().code, ErrorCode::INVALID_CONFIGURATION) << args[0];
    }
}

TEST(OptionsTest, InvalidAddressKeepsItsCode) {
    auto server = Options::parseServer({"--addr", "nowhere"});
    ASSERT_FALSE(server);
    EXPECT_EQ(server.error().code, ErrorCode::INVALID_ADDRESS);

    auto client = Options::parseClient({"--file", "a.bin", "--server", "host:99999"});
    ASSERT_FALSE(client);
    EXPECT_EQ(client.error().code, ErrorCode::INVALID_ADDRESS);
}

TEST(OptionsTest, ClientDefaultsAndFlags) {
    auto parsed = Options::parseClient({"--file", "data.bin"});
    ASSERT_TRUE(parsed) << parsed.error().toString();
    EXPECT_EQ(parsed.value().source.filePath, "data.bin");
    EXPECT_EQ(parsed.value().source.server.toString(), "127.0.0.1:4433");
    EXPECT_EQ(parsed.value().source.serverName, "localhost");
    EXPECT_EQ(parsed.value().source.caCertPath, "certs/server-cert.pem");

    auto custom = Options::parseClient({"--file", "data.bin", "--server", "[::1]:5000",
                                        "--server-name", "files.example", "--ca-cert", "ca.pem",
                                        "--chunk-size", "512", "--log-level", "warn"});
    ASSERT_TRUE(custom) << custom.error().toString();
    EXPECT_EQ(custom.value().source.server.host, "::1");
    EXPECT_EQ(custom.value().source.server.port, 5000);
    EXPECT_EQ(custom.value().source.serverName, "files.example");
    EXPECT_EQ(custom.value().source.caCertPath, "ca.pem");
    EXPECT_EQ(custom.value().source.chunkSize, 512u);
    EXPECT_EQ(custom.value().logLevel, LogLevel::WARN);
}

TEST(OptionsTest, ClientRequiresFile) {
    auto parsed = Options::parseClient({});
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::INVALID_CONFIGURATION);
}

TEST(OptionsTest, ClientRejectsServerOnlyFlags) {
    auto parsed = Options::parseClient({"--file", "a", "--output", "dir"});
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::INVALID_CONFIGURATION);
}

TEST(OptionsTest, UsageListsEveryFlag) {
    std::string server = Options::serverUsage("ferry_server");
    for (const char* flag : {"--config", "--addr", "--cert", "--key", "--output", "--max-transfers",
                             "--chunk-size", "--idle-timeout", "--log-level", "--log-file", "--log-max-mb",
                             "--help"}) {
        EXPECT_NE(server.find(flag), std::string::npos) << flag;
    }
    std::string client = Options::clientUsage("ferry_client");
    for (const char* flag : {"--file", "--config", "--server", "--server-name", "--ca-cert",
                             "--chunk-size", "--idle-timeout", "--log-level", "--help"}) {
        EXPECT_NE(client.find(flag), std::string::npos) << flag;
    }
}

TEST(OptionsTest, CollectArgsSkipsProgramName) {
    char program[] = "ferry_client";
    char flag[] = "--file";
    char value[] = "x";
    char* argv[] = {program, flag, value};
    auto args = Options::collectArgs(3, argv);
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "--file");
    EXPECT_EQ(args[1], "x");
}
