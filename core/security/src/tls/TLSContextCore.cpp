/**
 * @file TLSContextCore.cpp
 * @brief TLSContext initialization, credential loading and session creation
 */

#include "TLSContext.h"
#include "Logger.h"

#include <cstring>

namespace Ferry {

namespace {
    // QUIC forbids the TLS 1.3 middlebox compatibility mode
    constexpr const char* PRIORITY =
        "NORMAL:-VERS-ALL:+VERS-TLS1.3:-CIPHER-ALL:+AES-128-GCM:+AES-256-GCM:+CHACHA20-POLY1305:"
        "%DISABLE_TLS13_COMPAT_MODE";

    std::string gnutlsError(int code) {
        return std::string(gnutls_strerror(code));
    }
}

TLSContext::TLSContext(Mode mode) : mode_(mode) {}

TLSContext::~TLSContext() {
    if (credentials_) {
        gnutls_certificate_free_credentials(credentials_);
        credentials_ = nullptr;
    }
    if (globalInit_) {
        gnutls_global_deinit();
    }
}

VoidResult TLSContext::initialize() {
    auto& logger = Logger::instance();

    if (credentials_) {
        return Ok();
    }

    int ret = gnutls_global_init();
    if (ret < 0) {
        return Err(ErrorCode::HANDSHAKE_FAILED,
                   "Failed to initialize GnuTLS: " + gnutlsError(ret), "TLSContext");
    }
    globalInit_ = true;

    ret = gnutls_certificate_allocate_credentials(&credentials_);
    if (ret < 0) {
        credentials_ = nullptr;
        return Err(ErrorCode::HANDSHAKE_FAILED,
                   "Failed to allocate GnuTLS credentials: " + gnutlsError(ret), "TLSContext");
    }

    logger.log(LogLevel::DEBUG, std::string("TLS credentials initialized (GnuTLS ") +
               gnutls_check_version(nullptr) + ")", "TLSContext");
    return Ok();
}

VoidResult TLSContext::loadCertificate(const std::string& certPath, const std::string& keyPath) {
    auto& logger = Logger::instance();

    if (!credentials_) {
        return Err(ErrorCode::INVALID_CONFIGURATION, "TLS context not initialized", "TLSContext");
    }

    // Also rejects a key that does not belong to the certificate
    int ret = gnutls_certificate_set_x509_key_file(credentials_, certPath.c_str(), keyPath.c_str(),
                                                   GNUTLS_X509_FMT_PEM);
    if (ret < 0) {
        return Err(ErrorCode::CREDENTIALS_UNREADABLE,
                   "Failed to load certificate " + certPath + " with key " + keyPath + ": " +
                       gnutlsError(ret), "TLSContext");
    }

    logger.log(LogLevel::INFO, "Loaded TLS certificate: " + certPath, "TLSContext");
    return Ok();
}

Result<gnutls_session_t> TLSContext::createSession(const std::string& serverName) {
    if (!credentials_) {
        return Err(ErrorCode::INVALID_CONFIGURATION, "TLS context not initialized", "TLSContext");
    }

    gnutls_session_t session = nullptr;
    unsigned int flags = (mode_ == Mode::SERVER) ? GNUTLS_SERVER : GNUTLS_CLIENT;
    int ret = gnutls_init(&session, flags | GNUTLS_NONBLOCK);
    if (ret < 0) {
        return Err(ErrorCode::HANDSHAKE_FAILED, "gnutls_init failed: " + gnutlsError(ret), "TLSContext");
    }

    ret = gnutls_priority_set_direct(session, PRIORITY, nullptr);
    if (ret < 0) {
        gnutls_deinit(session);
        return Err(ErrorCode::HANDSHAKE_FAILED, "Failed to set TLS priority: " + gnutlsError(ret), "TLSContext");
    }

    ret = gnutls_credentials_set(session, GNUTLS_CRD_CERTIFICATE, credentials_);
    if (ret < 0) {
        gnutls_deinit(session);
        return Err(ErrorCode::HANDSHAKE_FAILED, "Failed to attach credentials: " + gnutlsError(ret), "TLSContext");
    }

    gnutls_datum_t alpn;
    alpn.data = reinterpret_cast<unsigned char*>(const_cast<char*>(ALPN));
    alpn.size = static_cast<unsigned int>(std::strlen(ALPN));
    ret = gnutls_alpn_set_protocols(session, &alpn, 1, GNUTLS_ALPN_MANDATORY);
    if (ret < 0) {
        gnutls_deinit(session);
        return Err(ErrorCode::HANDSHAKE_FAILED, "Failed to set ALPN: " + gnutlsError(ret), "TLSContext");
    }

    if (mode_ == Mode::CLIENT) {
        auto verified = applyVerification(session, serverName);
        if (!verified) {
            gnutls_deinit(session);
            return verified.error();
        }
    }

    return session;
}

std::string TLSContext::describeSession(gnutls_session_t session) {
    const char* version = gnutls_protocol_get_name(gnutls_protocol_get_version(session));
    const char* cipher = gnutls_cipher_get_name(gnutls_cipher_get(session));
    return std::string(version ? version : "unknown") + "/" + (cipher ? cipher : "unknown");
}

} // namespace Ferry
