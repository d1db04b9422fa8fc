#include <gtest/gtest.h>

#include "NetAddress.h"

#include <netinet/in.h>

using namespace Ferry;

TEST(NetAddressTest, ParsesHostAndPort) {
    auto parsed = NetAddress::parse("127.0.0.1:4433");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().host, "127.0.0.1");
    EXPECT_EQ(parsed.value().port, 4433);
    EXPECT_EQ(parsed.value().toString(), "127.0.0.1:4433");

    auto named = NetAddress::parse("localhost:0");
    ASSERT_TRUE(named);
    EXPECT_EQ(named.value().host, "localhost");
    EXPECT_EQ(named.value().port, 0);
}

TEST(NetAddressTest, ParsesBracketedIPv6) {
    auto parsed = NetAddress::parse("[::1]:9000");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed.value().host, "::1");
    EXPECT_EQ(parsed.value().port, 9000);
    EXPECT_EQ(parsed.value().toString(), "[::1]:9000");
}

TEST(NetAddressTest, RejectsMalformedAddresses) {
    for (const char* text : {"", "localhost", ":4433", "host:", "host:port", "host:65536",
                             "host:-1", "::1:4433", "[::1]4433", "[::1"}) {
        auto parsed = NetAddress::parse(text);
        ASSERT_FALSE(parsed) << text;
        EXPECT_EQ(parsed.error().code, ErrorCode::INVALID_ADDRESS) << text;
    }
}

TEST(NetAddressTest, ResolvesNumericAddress) {
    auto parsed = NetAddress::parse("127.0.0.1:4433");
    ASSERT_TRUE(parsed);
    auto resolved = parsed.value().resolve(false);
    ASSERT_TRUE(resolved);
    ASSERT_FALSE(resolved.value().empty());
    EXPECT_EQ(resolved.value().front().family, AF_INET);

    const auto& first = resolved.value().front();
    EXPECT_EQ(NetAddress::describe(reinterpret_cast<const sockaddr*>(&first.storage), first.length),
              "127.0.0.1:4433");
}
