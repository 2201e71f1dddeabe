#pragma once

#include "core/core_export.hpp"
#include <openssl/x509.h>
#include <string_view>
#include <vector>

namespace securemail::certs {

/**
 * @brief Usages of the X.509 keyUsage extension (RFC 5280, 4.2.1.3)
 */
enum class KeyUsage {
    DigitalSignature,
    NonRepudiation,
    KeyEncipherment,
    DataEncipherment,
    KeyAgreement,
    KeyCertSign,
    CRLSign,
    EncipherOnly,
    DecipherOnly
};

// Display name as printed by OpenSSL, e.g. "Digital Signature"
SECUREMAIL_CORE_EXPORT std::string_view keyUsageName(KeyUsage usage);

/**
 * @brief Check whether the keyUsage extension rules out an operation
 *
 * A certificate without keyUsage extension is not restricted.
 * @param cert Certificate to inspect
 * @param usage Intended use of the certificate key
 * @return true if the extension is present and does not declare usage
 */
SECUREMAIL_CORE_EXPORT bool keyUsageProhibits(X509* cert, KeyUsage usage);

/**
 * @brief Usages declared by the keyUsage extension
 * @return Empty if the extension is absent
 */
SECUREMAIL_CORE_EXPORT std::vector<KeyUsage> declaredKeyUsages(X509* cert);

} // namespace securemail::certs
