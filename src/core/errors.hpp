#pragma once

#include "core/core_export.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace securemail::core {

/**
 * @brief Base class of all errors raised by the certificate store and
 *        the S/MIME engine
 */
class SECUREMAIL_CORE_EXPORT Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Input could not be decoded as an X.509 certificate
 */
class SECUREMAIL_CORE_EXPORT MalformedCertificate : public Error {
public:
    using Error::Error;
};

/**
 * @brief A certificate with the same fingerprint is already stored
 */
class SECUREMAIL_CORE_EXPORT DuplicateCertificate : public Error {
public:
    explicit DuplicateCertificate(const std::string& fingerprint);

    const std::string& fingerprint() const { return fingerprint_; }

private:
    std::string fingerprint_;
};

/**
 * @brief No stored certificate matches the modulus of a private key
 */
class SECUREMAIL_CORE_EXPORT CertificateNotFound : public Error {
public:
    CertificateNotFound();
};

/**
 * @brief Private key material could not be decrypted
 */
class SECUREMAIL_CORE_EXPORT KeyDecryptionError : public Error {
public:
    using Error::Error;
};

/**
 * @brief One or more recipients have no usable encryption certificate
 *
 * Carries exactly the addresses that could not be resolved.
 */
class SECUREMAIL_CORE_EXPORT CertificatesNotFound : public Error {
public:
    explicit CertificatesNotFound(std::vector<std::string> addresses);

    const std::vector<std::string>& addresses() const { return addresses_; }

private:
    std::vector<std::string> addresses_;
};

/**
 * @brief No usable signing certificate for the sender address
 */
class SECUREMAIL_CORE_EXPORT SignerCertificateNotFound : public Error {
public:
    explicit SignerCertificateNotFound(const std::string& address);
};

/**
 * @brief A resolved certificate is outside its validity window
 */
class SECUREMAIL_CORE_EXPORT ExpiredCertificate : public Error {
public:
    using Error::Error;
};

class SECUREMAIL_CORE_EXPORT StoreError : public Error {
public:
    using Error::Error;
};

class SECUREMAIL_CORE_EXPORT ConfigurationError : public Error {
public:
    using Error::Error;
};

/**
 * @brief OpenSSL failure while building a PKCS#7 structure
 */
class SECUREMAIL_CORE_EXPORT CryptoError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Drain the OpenSSL error queue into a single line
 * @return Last queued error or "unknown error"
 */
SECUREMAIL_CORE_EXPORT std::string openSSLError();

} // namespace securemail::core
