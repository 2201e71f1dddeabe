#pragma once

#include "core/core_export.hpp"
#include "certs/certificate.hpp"
#include "certs/certificatestore.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace securemail::certs {

/**
 * @brief Selects S/MIME certificates for senders and recipients
 *
 * Both lookups walk the store in its default order, so the newest usable
 * certificate for an address always wins over older or expired ones.
 * Address comparison is case-insensitive.
 */
class SECUREMAIL_CORE_EXPORT CertificateResolver {
public:
    explicit CertificateResolver(const CertificateStore& store,
                                 size_t batchSize = CertificateStore::DEFAULT_BATCH_SIZE);

    /**
     * @brief Find the signing certificate of a sender
     *
     * Only certificates with a private key whose keyUsage allows digital
     * signatures are considered.
     * @param address Sender email address
     * @return Newest matching certificate, or nullopt
     */
    std::optional<Certificate> forSenderEmailAddress(std::string_view address) const;

    /**
     * @brief Find encryption certificates covering all recipients
     *
     * A certificate is used when it matches at least one still unresolved
     * address and its keyUsage allows key encipherment.
     * @param addresses Recipient email addresses
     * @return Selected certificates in store order
     * @throws core::CertificatesNotFound naming only the unresolved addresses
     */
    std::vector<Certificate> forRecipientEmailAddresses(
        const std::vector<std::string>& addresses) const;

private:
    const CertificateStore& store_;
    size_t batchSize_;
};

} // namespace securemail::certs
