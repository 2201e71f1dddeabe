#include "certs/certificateresolver.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace securemail::certs {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

std::vector<std::string> normalize(const std::vector<std::string>& addresses) {
    std::vector<std::string> result;
    result.reserve(addresses.size());
    for (const auto& address : addresses) {
        std::string lowered = toLower(address);
        if (!contains(result, lowered)) {
            result.push_back(std::move(lowered));
        }
    }
    return result;
}

} // namespace

CertificateResolver::CertificateResolver(const CertificateStore& store, size_t batchSize)
    : store_(store), batchSize_(batchSize) {}

std::optional<Certificate> CertificateResolver::forSenderEmailAddress(std::string_view address) const {
    const std::string lookup = toLower(address);

    std::optional<Certificate> found;
    store_.scan({true, batchSize_}, [&](const Certificate& cert) {
        if (cert.keyUsageProhibits(KeyUsage::DigitalSignature)) {
            return CertificateStore::ScanControl::Continue;
        }
        if (!contains(cert.emailAddresses(), lookup)) {
            return CertificateStore::ScanControl::Continue;
        }

        found = cert;
        return CertificateStore::ScanControl::Stop;
    });
    return found;
}

std::vector<Certificate> CertificateResolver::forRecipientEmailAddresses(
    const std::vector<std::string>& addresses) const {

    std::vector<Certificate> certificates;
    std::vector<std::string> remaining = normalize(addresses);
    if (remaining.empty()) {
        return certificates;
    }

    store_.scan({false, batchSize_}, [&](const Certificate& cert) {
        // intersection of both lists
        std::vector<std::string> matched;
        for (const auto& address : remaining) {
            if (contains(cert.emailAddresses(), address)) {
                matched.push_back(address);
            }
        }
        if (matched.empty()) {
            return CertificateStore::ScanControl::Continue;
        }

        // a restricted certificate leaves its addresses unresolved
        if (cert.keyUsageProhibits(KeyUsage::KeyEncipherment)) {
            return CertificateStore::ScanControl::Continue;
        }

        certificates.push_back(cert);
        remaining.erase(std::remove_if(remaining.begin(), remaining.end(),
                                       [&matched](const std::string& address) {
                                           return contains(matched, address);
                                       }),
                        remaining.end());

        return remaining.empty() ? CertificateStore::ScanControl::Stop
                                 : CertificateStore::ScanControl::Continue;
    });

    if (!remaining.empty()) {
        throw core::CertificatesNotFound(std::move(remaining));
    }
    return certificates;
}

} // namespace securemail::certs
