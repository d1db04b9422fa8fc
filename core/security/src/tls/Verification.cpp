/**
 * @file Verification.cpp
 * @brief Trust anchors, server name verification and handshake failure classification
 */

#include "TLSContext.h"
#include "Logger.h"

#include <sys/stat.h>

namespace Ferry {

VoidResult TLSContext::loadTrustAnchor(const std::string& caPath) {
    auto& logger = Logger::instance();

    if (!credentials_) {
        return Err(ErrorCode::INVALID_CONFIGURATION, "TLS context not initialized", "TLSContext");
    }

    struct stat st;
    if (stat(caPath.c_str(), &st) != 0) {
        return Err(ErrorCode::CREDENTIALS_UNREADABLE,
                   "CA certificate not found at " + caPath, "TLSContext");
    }

    // Both return the number of certificates added
    int loaded = S_ISDIR(st.st_mode)
        ? gnutls_certificate_set_x509_trust_dir(credentials_, caPath.c_str(), GNUTLS_X509_FMT_PEM)
        : gnutls_certificate_set_x509_trust_file(credentials_, caPath.c_str(), GNUTLS_X509_FMT_PEM);

    if (loaded < 0) {
        return Err(ErrorCode::CREDENTIALS_UNREADABLE,
                   "Failed to load CA certificates from " + caPath + ": " + gnutls_strerror(loaded),
                   "TLSContext");
    }
    if (loaded == 0) {
        return Err(ErrorCode::CREDENTIALS_UNREADABLE,
                   "No CA certificates found in " + caPath, "TLSContext");
    }

    logger.log(LogLevel::DEBUG, "Loaded " + std::to_string(loaded) + " trust anchor(s) from: " + caPath,
               "TLSContext");
    return Ok();
}

VoidResult TLSContext::applyVerification(gnutls_session_t session, const std::string& serverName) {
    if (serverName.empty()) {
        return Err(ErrorCode::INVALID_CONFIGURATION, "Client sessions need a server name", "TLSContext");
    }

    int ret = gnutls_server_name_set(session, GNUTLS_NAME_DNS, serverName.data(), serverName.size());
    if (ret < 0) {
        return Err(ErrorCode::HANDSHAKE_FAILED,
                   "Failed to set server name " + serverName + ": " + gnutls_strerror(ret), "TLSContext");
    }

    // Chain and name are checked during the handshake, which aborts on mismatch
    gnutls_session_set_verify_cert(session, serverName.c_str(), 0);
    return Ok();
}

Error TLSContext::handshakeFailure(gnutls_session_t session, const std::string& detail) const {
    if (mode_ == Mode::CLIENT && session) {
        unsigned int status = gnutls_session_get_verify_cert_status(session);
        // (unsigned)-1 means verification never ran
        if (status != 0 && status != static_cast<unsigned int>(-1)) {
            gnutls_datum_t printed{nullptr, 0};
            std::string reason = "verification failed";
            if (gnutls_certificate_verification_status_print(status, GNUTLS_CRT_X509, &printed, 0) == 0) {
                reason.assign(reinterpret_cast<const char*>(printed.data), printed.size);
                gnutls_free(printed.data);
            }
            return Error(ErrorCode::CERTIFICATE_REJECTED, "Server certificate rejected: " + reason, "TLSContext");
        }
    }
    return Error(ErrorCode::HANDSHAKE_FAILED, "TLS handshake failed: " + detail, "TLSContext");
}

} // namespace Ferry
