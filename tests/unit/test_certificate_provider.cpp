#include <gtest/gtest.h>

#include "CertificateProvider.h"
#include "TLSContext.h"
#include "TestDoubles.h"

#include <sys/stat.h>

using namespace Ferry;
using Ferry::Testing::TempDir;

class CertificateProviderTest : public ::testing::Test {
protected:
    TempDir dir_{"certs"};
    std::string certPath_ = (dir_ / "nested" / "server-cert.pem").string();
    std::string keyPath_ = (dir_ / "nested" / "server-key.pem").string();
};

TEST_F(CertificateProviderTest, GeneratesLoadablePairWhenMissing) {
    auto credentials = CertificateProvider::ensureSelfSigned(certPath_, keyPath_, {"localhost", "127.0.0.1"});
    ASSERT_TRUE(credentials) << credentials.error().toString();
    EXPECT_TRUE(credentials.value().generated);
    EXPECT_TRUE(std::filesystem::exists(certPath_));
    EXPECT_TRUE(std::filesystem::exists(keyPath_));

    struct stat keyStat;
    ASSERT_EQ(::stat(keyPath_.c_str(), &keyStat), 0);
    EXPECT_EQ(keyStat.st_mode & 0777, 0600u);

    TLSContext server(TLSContext::Mode::SERVER);
    ASSERT_TRUE(server.initialize());
    EXPECT_TRUE(server.loadCertificate(certPath_, keyPath_));

    TLSContext client(TLSContext::Mode::CLIENT);
    ASSERT_TRUE(client.initialize());
    EXPECT_TRUE(client.loadTrustAnchor(certPath_));
}

TEST_F(CertificateProviderTest, ExistingPairIsReused) {
    ASSERT_TRUE(CertificateProvider::generateSelfSigned(certPath_, keyPath_, {"localhost"}));
    auto before = CertificateProvider::certificateFingerprint(certPath_);
    ASSERT_TRUE(before);

    auto credentials = CertificateProvider::ensureSelfSigned(certPath_, keyPath_, {"localhost"});
    ASSERT_TRUE(credentials);
    EXPECT_FALSE(credentials.value().generated);

    auto after = CertificateProvider::certificateFingerprint(certPath_);
    ASSERT_TRUE(after);
    EXPECT_EQ(before.value(), after.value());
}

TEST_F(CertificateProviderTest, EachGenerationIsUnique) {
    std::string otherCert = (dir_ / "other-cert.pem").string();
    std::string otherKey = (dir_ / "other-key.pem").string();
    ASSERT_TRUE(CertificateProvider::generateSelfSigned(certPath_, keyPath_, {"localhost"}));
    ASSERT_TRUE(CertificateProvider::generateSelfSigned(otherCert, otherKey, {"localhost"}));

    auto first = CertificateProvider::certificateFingerprint(certPath_);
    auto second = CertificateProvider::certificateFingerprint(otherCert);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(first.value().size(), 95u);  // 32 colon-separated hex bytes
}

TEST_F(CertificateProviderTest, UnreadableCertificateIsReported) {
    auto fingerprint = CertificateProvider::certificateFingerprint((dir_ / "missing.pem").string());
    ASSERT_FALSE(fingerprint);
    EXPECT_EQ(fingerprint.error().code, ErrorCode::CREDENTIALS_UNREADABLE);

    TLSContext client(TLSContext::Mode::CLIENT);
    ASSERT_TRUE(client.initialize());
    auto loaded = client.loadTrustAnchor((dir_ / "missing.pem").string());
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::CREDENTIALS_UNREADABLE);
}
