#pragma once

#include "core/core_export.hpp"
#include "core/securityconfig.hpp"
#include "audit/securitylog.hpp"
#include "certs/certificate.hpp"
#include "certs/certificatestore.hpp"
#include <securemail/smime/mailmessage.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace securemail::smime {

/**
 * @brief Signs and encrypts outgoing mail with stored S/MIME certificates
 *
 * Each call is independent. Failures are written to the security log with
 * the operation name and outcome "failed", then rethrown unchanged.
 */
class SECUREMAIL_CORE_EXPORT Outgoing {
public:
    static constexpr const char* TYPE = "S/MIME";

    /**
     * @param store Certificate store used for all lookups
     * @param config Expiry policy and cipher
     * @param log Sink for operation outcomes
     */
    Outgoing(const certs::CertificateStore& store,
             core::SecurityConfig config,
             audit::SecurityLog& log);

    // Prevent copying
    Outgoing(const Outgoing&) = delete;
    Outgoing& operator=(const Outgoing&) = delete;

    /**
     * @brief Create a detached signature over mail.encoded
     * @return multipart/signed entity with an application/x-pkcs7-signature part
     * @throws core::SignerCertificateNotFound if the sender has no certificate
     * @throws core::ExpiredCertificate if expired use is not allowed
     * @throws core::KeyDecryptionError if the stored key cannot be read
     * @throws core::CryptoError if OpenSSL fails to sign
     */
    std::string sign(const MailMessage& mail);

    /**
     * @brief Encrypt data for all to and cc recipients of mail
     * @param mail Source of the recipient addresses
     * @param data MIME entity to encrypt
     * @return application/x-pkcs7-mime enveloped-data entity
     * @throws core::CertificatesNotFound naming unresolved recipients
     * @throws core::ExpiredCertificate if expired use is not allowed
     * @throws core::CryptoError if OpenSSL fails to encrypt
     */
    std::string encrypt(const MailMessage& mail, std::string_view data);

    /**
     * @brief Sign, then encrypt the signed entity, as requested
     * @return Protected entity, or mail.encoded if nothing was requested
     */
    std::string protect(const MailMessage& mail, const SecurityOptions& options);

    /**
     * @brief Issuer certificates embedded in signatures made with cert
     */
    std::vector<certs::Certificate> chain(const certs::Certificate& cert) const;

    const core::SecurityConfig& config() const { return config_; }

private:
    const certs::CertificateStore& store_;
    core::SecurityConfig config_;
    audit::SecurityLog& log_;

    std::vector<certs::Certificate> recipientCertificates(const MailMessage& mail) const;
    std::string signMessage(const MailMessage& mail) const;
    std::string encryptData(const MailMessage& mail, std::string_view data) const;
};

} // namespace securemail::smime
