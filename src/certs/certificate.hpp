#pragma once

#include "core/core_export.hpp"
#include "core/securememory.hpp"
#include "certs/keyusage.hpp"
#include <openssl/x509.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace securemail::certs {

/**
 * @brief Stored S/MIME certificate, optionally with its private key
 *
 * Identity fields are derived from the PEM material when the record is
 * created. The parsed X.509 handle and the subjectAltName email addresses
 * are computed on first use and cached for the lifetime of the instance.
 */
class SECUREMAIL_CORE_EXPORT Certificate {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Persisted columns of a certificate record
     */
    struct Attributes {
        int64_t id = 0;
        std::string subject;
        std::string docHash;
        std::string fingerprint;
        std::string modulus;
        TimePoint notBefore;
        TimePoint notAfter;
        std::string raw;
    };

    /**
     * @brief Private key PEM and the secret it is encrypted with
     */
    struct PrivateKey {
        std::string pem;
        core::SecureMemory::SecureString secret;
    };

    Certificate() = default;

    /**
     * @brief Restore a record loaded from storage
     */
    explicit Certificate(Attributes attributes,
                         std::shared_ptr<const PrivateKey> privateKey = nullptr);

    /**
     * @brief Build an unsaved record from a PEM certificate
     * @throws core::MalformedCertificate if the PEM does not decode or
     *         carries no RSA public key
     */
    static Certificate fromPem(std::string_view pem);

    /**
     * @brief Replace the certificate material and re-derive identity fields
     *
     * Resets the cached parsed handle and email addresses.
     */
    void setPublicKey(std::string_view pem);

    int64_t id() const { return attributes_.id; }
    void setId(int64_t id) { attributes_.id = id; }

    const std::string& subject() const { return attributes_.subject; }
    const std::string& docHash() const { return attributes_.docHash; }
    const std::string& fingerprint() const { return attributes_.fingerprint; }
    const std::string& modulus() const { return attributes_.modulus; }
    TimePoint notBefore() const { return attributes_.notBefore; }
    TimePoint notAfter() const { return attributes_.notAfter; }
    const std::string& raw() const { return attributes_.raw; }
    const Attributes& attributes() const { return attributes_; }

    bool hasPrivateKey() const { return privateKey_ != nullptr; }
    const std::shared_ptr<const PrivateKey>& privateKey() const { return privateKey_; }
    void setPrivateKey(std::string pem, std::string_view secret);

    /**
     * @brief Parsed certificate, decoded from raw() on first access
     * @throws core::MalformedCertificate if the stored material is corrupt
     */
    X509* parsed() const;

    // One-line issuer name in the same form as subject()
    std::string issuer() const;

    /**
     * @brief Lowercase email addresses from the subjectAltName extension
     *
     * Certificates without subjectAltName, and malformed addresses, are
     * reported on stderr and contribute no addresses.
     */
    const std::vector<std::string>& emailAddresses() const;

    bool keyUsageProhibits(KeyUsage usage) const;

    /**
     * @brief Check if now lies outside the validity window
     */
    bool expired(TimePoint now = std::chrono::system_clock::now()) const;

    bool selfSigned() const { return subject() == issuer(); }

private:
    Attributes attributes_;
    std::shared_ptr<const PrivateKey> privateKey_;

    mutable std::shared_ptr<X509> parsed_;
    mutable std::optional<std::vector<std::string>> emailAddresses_;

    std::vector<std::string> emailAddressesFromSubjectAltName() const;
};

/**
 * @brief Syntactic email address check (local@domain.tld)
 */
SECUREMAIL_CORE_EXPORT bool isValidEmailAddress(std::string_view address);

SECUREMAIL_CORE_EXPORT std::string toLower(std::string_view text);

} // namespace securemail::certs
