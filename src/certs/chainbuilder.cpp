#include "certs/chainbuilder.hpp"
#include <set>
#include <string>

namespace securemail::certs {

ChainBuilder::ChainBuilder(const CertificateStore& store)
    : store_(store) {}

std::vector<Certificate> ChainBuilder::buildChain(const Certificate& cert) const {
    std::vector<Certificate> chain;
    std::set<std::string> visitedSubjects;  // Track visited certificates to prevent loops

    std::string lookupIssuer = cert.issuer();
    while (chain.size() < MAX_CHAIN_LENGTH) {
        auto found = store_.findBySubject(lookupIssuer);
        if (!found) {
            break;
        }

        std::string subject = found->subject();
        if (!visitedSubjects.insert(subject).second) {
            break;
        }

        lookupIssuer = found->issuer();
        chain.push_back(std::move(*found));

        // we've reached the root CA
        if (subject == lookupIssuer) {
            break;
        }
    }
    return chain;
}

} // namespace securemail::certs
