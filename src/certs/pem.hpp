#pragma once

#include "core/core_export.hpp"
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace securemail::certs {

using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using EVP_PKEYPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

/**
 * @brief Find all PEM armored blocks in arbitrary text
 *
 * Returns every non-overlapping "-----BEGIN <label>----- ... -----END <label>-----"
 * region in input order. Text between blocks is ignored.
 */
SECUREMAIL_CORE_EXPORT std::vector<std::string> extractPemBlocks(std::string_view raw);

/**
 * @brief Decode a PEM encoded certificate
 *
 * "TRUSTED CERTIFICATE" markers are accepted and read as plain certificates.
 * @throws core::MalformedCertificate if the text does not decode
 */
SECUREMAIL_CORE_EXPORT X509Ptr parseCertificate(std::string_view pem);

/**
 * @brief Decrypt a PEM encoded private key
 * @param pem Key in PKCS#1, PKCS#8 or encrypted PKCS#8 form
 * @param secret Passphrase, ignored for unencrypted keys
 * @throws core::KeyDecryptionError on wrong secret or corrupt material
 */
SECUREMAIL_CORE_EXPORT EVP_PKEYPtr readPrivateKey(std::string_view pem, const char* secret);

/**
 * @brief One-line form of a distinguished name ("/C=DE/O=Example/CN=...")
 */
SECUREMAIL_CORE_EXPORT std::string nameToString(const X509_NAME* name);

// Lowercase hex SHA-1 over the DER encoding
SECUREMAIL_CORE_EXPORT std::string fingerprint(X509* cert);

/**
 * @brief Uppercase hex RSA modulus of a key
 * @return Empty string for non-RSA keys
 */
SECUREMAIL_CORE_EXPORT std::string rsaModulus(const EVP_PKEY* key);

// Hex of the OpenSSL subject name hash
SECUREMAIL_CORE_EXPORT std::string subjectHash(X509* cert);

SECUREMAIL_CORE_EXPORT std::chrono::system_clock::time_point toTimePoint(const ASN1_TIME* time);

// PEM re-encoding of the certificate
SECUREMAIL_CORE_EXPORT std::string toPem(X509* cert);

} // namespace securemail::certs
