#pragma once

#include "Result.h"

#include <string>
#include <vector>

namespace Ferry {

/**
 * @brief Server identity provisioning
 *
 * Resolves the certificate/key pair the server presents. When neither file
 * exists a self-signed EC P-256 certificate is generated so a fresh install
 * can serve immediately; clients then use the generated certificate as
 * their trust anchor.
 */
class CertificateProvider {
public:
    struct Credentials {
        std::string certPath;
        std::string keyPath;
        bool generated{false};
    };

    static constexpr int DEFAULT_VALIDITY_DAYS = 365;

    /**
     * @brief Return existing credentials or generate a self-signed pair
     * @param subjectAltNames DNS names or IP addresses; the first one is also the CN
     */
    static Result<Credentials> ensureSelfSigned(const std::string& certPath,
                                                const std::string& keyPath,
                                                const std::vector<std::string>& subjectAltNames,
                                                int validityDays = DEFAULT_VALIDITY_DAYS);

    /**
     * @brief Unconditionally write a new self-signed certificate and key
     */
    static VoidResult generateSelfSigned(const std::string& certPath,
                                         const std::string& keyPath,
                                         const std::vector<std::string>& subjectAltNames,
                                         int validityDays = DEFAULT_VALIDITY_DAYS);

    /**
     * @brief SHA-256 fingerprint of a PEM certificate as colon separated hex
     */
    static Result<std::string> certificateFingerprint(const std::string& certPath);
};

} // namespace Ferry
