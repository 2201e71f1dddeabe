#pragma once

#include "core/core_export.hpp"
#include "certs/certificate.hpp"
#include "certs/certificatestore.hpp"
#include <cstddef>
#include <vector>

namespace securemail::certs {

/**
 * @brief Collects issuer certificates to embed in a signature
 *
 * Follows issuer names through the store up to a self-signed root. This
 * is not a trust check: a missing issuer simply ends the chain.
 */
class SECUREMAIL_CORE_EXPORT ChainBuilder {
public:
    static constexpr size_t MAX_CHAIN_LENGTH = 16;

    explicit ChainBuilder(const CertificateStore& store);

    /**
     * @brief Build the issuer chain of a certificate
     * @param cert Certificate whose issuers are collected
     * @return Issuers ordered from the direct issuer towards the root,
     *         the certificate itself is not included unless self-signed
     */
    std::vector<Certificate> buildChain(const Certificate& cert) const;

private:
    const CertificateStore& store_;
};

} // namespace securemail::certs
