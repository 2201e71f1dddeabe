#pragma once

#include "core/core_export.hpp"
#include "certs/certificate.hpp"
#include "certs/certificatestore.hpp"
#include <string_view>
#include <vector>

namespace securemail::certs {

/**
 * @brief Imports PEM certificates and private keys into a CertificateStore
 *
 * Blocks are processed in input order and errors are raised for the first
 * failing block. Blocks stored before the failure remain stored.
 */
class SECUREMAIL_CORE_EXPORT CertificateImporter {
public:
    explicit CertificateImporter(CertificateStore& store);

    /**
     * @brief Store every certificate block found in raw
     * @param raw Text containing one or more PEM blocks
     * @return Stored records in input order
     * @throws core::MalformedCertificate for undecodable blocks
     * @throws core::DuplicateCertificate for already stored certificates
     */
    std::vector<Certificate> importCertificates(std::string_view raw);

    /**
     * @brief Attach every private key block found in raw to its certificate
     * @param raw Text containing one or more PEM blocks
     * @param secret Passphrase of the keys, stored alongside them
     * @throws core::KeyDecryptionError if a key cannot be decrypted
     * @throws core::CertificateNotFound if no certificate matches a key
     */
    void importPrivateKeys(std::string_view raw, std::string_view secret);

private:
    CertificateStore& store_;
};

} // namespace securemail::certs
