#include <gtest/gtest.h>

#include "Config.h"
#include "TestDoubles.h"

#include <fstream>

using namespace Ferry;
using Ferry::Testing::TempDir;

namespace {
    std::string writeConfig(const TempDir& dir, const std::string& text) {
        auto path = dir / "ferry.conf";
        std::ofstream out(path);
        out << text;
        return path.string();
    }
}

TEST(ConfigTest, GetAndSet) {
    Config config;
    config.set("output_dir", "received");
    EXPECT_EQ(config.get("output_dir"), "received");
    EXPECT_EQ(config.get("missing", "fallback"), "fallback");

    config.set("max_transfers", "42");
    EXPECT_EQ(config.getSize("max_transfers"), 42u);
    EXPECT_EQ(config.getSize("missing", 9), 9u);
}

TEST(ConfigTest, GetSizeRejectsNonNumeric) {
    Config config;
    config.set("a", "-5");
    config.set("b", "12abc");
    config.set("c", "");
    EXPECT_EQ(config.getSize("a", 7), 7u);
    EXPECT_EQ(config.getSize("b", 7), 7u);
    EXPECT_EQ(config.getSize("c", 7), 7u);
}

TEST(ConfigTest, LoadFromFileSkipsCommentsAndTrims) {
    TempDir dir("config");
    auto path = writeConfig(dir,
        "# comment\n"
        "\n"
        "  listen_address = 127.0.0.1:5000  \n"
        "output_dir=/tmp/out\n"
        "log_file =\n");

    Config config;
    config.set("output_dir", "received");
    auto loaded = config.loadFromFile(path);
    ASSERT_TRUE(loaded) << loaded.error().toString();
    EXPECT_EQ(config.get("listen_address"), "127.0.0.1:5000");
    EXPECT_EQ(config.get("output_dir"), "/tmp/out");
    EXPECT_EQ(config.get("log_file", "unset"), "");
}

TEST(ConfigTest, MalformedLineRejectsWholeFile) {
    TempDir dir("config");
    auto path = writeConfig(dir, "output_dir = /tmp/out\nnot a setting\n");

    Config config;
    auto loaded = config.loadFromFile(path);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::INVALID_CONFIGURATION);
    EXPECT_NE(loaded.error().message.find(":2:"), std::string::npos);
    EXPECT_EQ(config.get("output_dir", "untouched"), "untouched");
}

TEST(ConfigTest, EmptyKeyIsRejected) {
    TempDir dir("config");
    auto path = writeConfig(dir, " = value\n");

    Config config;
    auto loaded = config.loadFromFile(path);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::INVALID_CONFIGURATION);
}

TEST(ConfigTest, MissingFileReportsFailure) {
    Config config;
    auto loaded = config.loadFromFile("/nonexistent/ferry.conf");
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::INVALID_CONFIGURATION);
}

TEST(ConfigTest, ValidateReturnsRejectedKey) {
    Config config;
    config.set("port", "8080");
    config.set("host", "localhost");

    std::unordered_map<std::string, Config::Validator> schema;
    schema["port"] = [](const std::string&, const std::string& v) {
        return Config::isUnsignedInteger(v) && std::stoul(v) < 65536;
    };
    schema["absent"] = [](const std::string&, const std::string&) { return false; };

    EXPECT_EQ(config.validate(schema), "");

    config.set("port", "70000");
    EXPECT_EQ(config.validate(schema), "port");
}

TEST(ConfigTest, IsUnsignedInteger) {
    EXPECT_TRUE(Config::isUnsignedInteger("0"));
    EXPECT_TRUE(Config::isUnsignedInteger("65536"));
    EXPECT_FALSE(Config::isUnsignedInteger(""));
    EXPECT_FALSE(Config::isUnsignedInteger("-1"));
    EXPECT_FALSE(Config::isUnsignedInteger("1.5"));
    EXPECT_FALSE(Config::isUnsignedInteger("12345678901234567890"));
}
