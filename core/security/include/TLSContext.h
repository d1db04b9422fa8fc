#pragma once

#include "Result.h"

#include <string>
#include <gnutls/gnutls.h>

namespace Ferry {

/**
 * @brief TLS 1.3 credentials for the QUIC client or server
 *
 * Provides:
 * - GnuTLS certificate credentials shared by every session of an endpoint
 * - Server identity loading (certificate + private key)
 * - Client trust anchor loading and server name verification
 * - Per-connection session creation and classified handshake failures
 *
 * The QUIC layer takes the session returned by createSession() and wires
 * it to its connection; the context must outlive every such session.
 */
class TLSContext {
public:
    enum class Mode {
        CLIENT,
        SERVER
    };

    /// ALPN token both endpoints must agree on
    static constexpr const char* ALPN = "ferry";

    explicit TLSContext(Mode mode);
    ~TLSContext();

    TLSContext(const TLSContext&) = delete;
    TLSContext& operator=(const TLSContext&) = delete;

    /**
     * @brief Allocate the credentials
     */
    VoidResult initialize();

    /**
     * @brief Load certificate and private key for server mode
     * @param certPath Path to PEM certificate file
     * @param keyPath Path to PEM private key file
     */
    VoidResult loadCertificate(const std::string& certPath, const std::string& keyPath);

    /**
     * @brief Load the certificate(s) the server must chain to
     * @param caPath PEM file or certificate directory
     */
    VoidResult loadTrustAnchor(const std::string& caPath);

    /**
     * @brief New TLS 1.3 session using these credentials
     * @param serverName Expected server name (client mode, SNI + verification)
     *
     * The caller owns the session and releases it with gnutls_deinit().
     */
    Result<gnutls_session_t> createSession(const std::string& serverName = "");

    /**
     * @brief Classify a handshake the TLS stack aborted
     *
     * CERTIFICATE_REJECTED when the peer certificate does not chain to the
     * trust anchor or does not match the expected name, HANDSHAKE_FAILED
     * for every other failure.
     */
    Error handshakeFailure(gnutls_session_t session, const std::string& detail) const;

    /**
     * @brief "TLS1.3/AES-128-GCM" style summary of an established session
     */
    static std::string describeSession(gnutls_session_t session);

    Mode mode() const { return mode_; }

private:
    VoidResult applyVerification(gnutls_session_t session, const std::string& serverName);

    Mode mode_;
    gnutls_certificate_credentials_t credentials_{nullptr};
    bool globalInit_{false};
};

} // namespace Ferry
