#include "CertificateProvider.h"
#include "FdGuard.h"
#include "Logger.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>

namespace Ferry {

namespace fs = std::filesystem;

namespace {
    using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
    using ExtPtr = std::unique_ptr<X509_EXTENSION, decltype(&X509_EXTENSION_free)>;

    std::string getOpenSSLError() {
        unsigned long err = ERR_get_error();
        if (err == 0) return "Unknown error";

        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        ERR_clear_error();
        return std::string(buf);
    }

    bool isIpAddress(const std::string& name) {
        unsigned char buf[sizeof(struct in6_addr)];
        return inet_pton(AF_INET, name.c_str(), buf) == 1 ||
               inet_pton(AF_INET6, name.c_str(), buf) == 1;
    }

    bool addExtension(X509* cert, int nid, const std::string& value) {
        X509V3_CTX ctx;
        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
        ExtPtr ext(X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str()), &X509_EXTENSION_free);
        if (!ext) {
            return false;
        }
        return X509_add_ext(cert, ext.get(), -1) == 1;
    }

    VoidResult ensureParent(const std::string& path) {
        fs::path parent = fs::path(path).parent_path();
        if (parent.empty()) {
            return Ok();
        }
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                       "Cannot create directory " + parent.string() + ": " + ec.message(),
                       "CertificateProvider");
        }
        return Ok();
    }

    // File is created with its final mode
    template<typename WriteFn>
    VoidResult writePem(const std::string& path, mode_t mode, WriteFn&& write) {
        FdGuard fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
        if (!fd) {
            return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                       "Cannot create " + path + ": " + std::string(strerror(errno)),
                       "CertificateProvider");
        }
        FILE* fp = fdopen(fd.get(), "w");
        if (!fp) {
            return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                       "Cannot open stream for " + path, "CertificateProvider");
        }
        fd.release();
        bool written = write(fp) == 1;
        bool closed = std::fclose(fp) == 0;
        if (!written || !closed) {
            return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                       "Failed to write " + path + ": " + getOpenSSLError(), "CertificateProvider");
        }
        return Ok();
    }
}

Result<CertificateProvider::Credentials> CertificateProvider::ensureSelfSigned(
        const std::string& certPath,
        const std::string& keyPath,
        const std::vector<std::string>& subjectAltNames,
        int validityDays) {
    auto& logger = Logger::instance();

    std::error_code ec;
    bool certExists = fs::exists(certPath, ec);
    bool keyExists = fs::exists(keyPath, ec);

    Credentials credentials{certPath, keyPath, false};
    if (certExists && keyExists) {
        return credentials;
    }

    if (certExists != keyExists) {
        logger.warn("Only one of " + certPath + " and " + keyPath +
                    " exists; generating a new pair", "CertificateProvider");
    }

    auto generated = generateSelfSigned(certPath, keyPath, subjectAltNames, validityDays);
    if (!generated) {
        return generated.error();
    }

    credentials.generated = true;
    logger.info("Generated self-signed certificate " + certPath, "CertificateProvider");
    return credentials;
}

VoidResult CertificateProvider::generateSelfSigned(const std::string& certPath,
                                                   const std::string& keyPath,
                                                   const std::vector<std::string>& subjectAltNames,
                                                   int validityDays) {
    if (subjectAltNames.empty()) {
        return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                   "At least one subject alternative name is required", "CertificateProvider");
    }

    PkeyPtr key(EVP_EC_gen("P-256"), &EVP_PKEY_free);
    if (!key) {
        return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                   "Key generation failed: " + getOpenSSLError(), "CertificateProvider");
    }

    X509Ptr cert(X509_new(), &X509_free);
    if (!cert) {
        return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                   "X509_new failed: " + getOpenSSLError(), "CertificateProvider");
    }

    X509_set_version(cert.get(), 2);

    unsigned char serial[16];
    if (RAND_bytes(serial, sizeof(serial)) != 1) {
        return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                   "RAND_bytes failed: " + getOpenSSLError(), "CertificateProvider");
    }
    serial[0] &= 0x7f;  // positive
    BIGNUM* serialBn = BN_bin2bn(serial, sizeof(serial), nullptr);
    if (!serialBn || !BN_to_ASN1_INTEGER(serialBn, X509_get_serialNumber(cert.get()))) {
        BN_free(serialBn);
        return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                   "Failed to set serial number", "CertificateProvider");
    }
    BN_free(serialBn);

    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -60);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), static_cast<long>(validityDays) * 24 * 3600);

    if (X509_set_pubkey(cert.get(), key.get()) != 1) {
        return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                   "Failed to set public key: " + getOpenSSLError(), "CertificateProvider");
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                               reinterpret_cast<const unsigned char*>(subjectAltNames.front().c_str()),
                               -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);

    std::string san;
    for (const auto& entry : subjectAltNames) {
        if (!san.empty()) san += ",";
        san += (isIpAddress(entry) ? "IP:" : "DNS:") + entry;
    }

    if (!addExtension(cert.get(), NID_basic_constraints, "critical,CA:TRUE") ||
        !addExtension(cert.get(), NID_key_usage, "critical,digitalSignature,keyCertSign") ||
        !addExtension(cert.get(), NID_ext_key_usage, "serverAuth") ||
        !addExtension(cert.get(), NID_subject_key_identifier, "hash") ||
        !addExtension(cert.get(), NID_subject_alt_name, san)) {
        return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                   "Failed to add certificate extensions: " + getOpenSSLError(), "CertificateProvider");
    }

    if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) {
        return Err(ErrorCode::CREDENTIAL_GENERATION_FAILED,
                   "Failed to sign certificate: " + getOpenSSLError(), "CertificateProvider");
    }

    auto certDir = ensureParent(certPath);
    if (!certDir) return certDir;
    auto keyDir = ensureParent(keyPath);
    if (!keyDir) return keyDir;

    auto keyWritten = writePem(keyPath, 0600, [&](FILE* fp) {
        return PEM_write_PrivateKey(fp, key.get(), nullptr, nullptr, 0, nullptr, nullptr);
    });
    if (!keyWritten) return keyWritten;

    return writePem(certPath, 0644, [&](FILE* fp) {
        return PEM_write_X509(fp, cert.get());
    });
}

Result<std::string> CertificateProvider::certificateFingerprint(const std::string& certPath) {
    std::unique_ptr<FILE, decltype(&std::fclose)> fp(std::fopen(certPath.c_str(), "r"), &std::fclose);
    if (!fp) {
        return Err(ErrorCode::CREDENTIALS_UNREADABLE,
                   "Cannot open certificate " + certPath + ": " + std::string(strerror(errno)),
                   "CertificateProvider");
    }

    X509Ptr cert(PEM_read_X509(fp.get(), nullptr, nullptr, nullptr), &X509_free);
    if (!cert) {
        return Err(ErrorCode::CREDENTIALS_UNREADABLE,
                   "Cannot parse certificate " + certPath + ": " + getOpenSSLError(), "CertificateProvider");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (X509_digest(cert.get(), EVP_sha256(), digest, &length) != 1) {
        return Err(ErrorCode::CREDENTIALS_UNREADABLE,
                   "Failed to hash certificate " + certPath + ": " + getOpenSSLError(), "CertificateProvider");
    }

    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        if (i > 0) oss << ':';
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace Ferry
