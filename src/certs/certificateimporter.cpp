#include "certs/certificateimporter.hpp"
#include "certs/pem.hpp"
#include "core/errors.hpp"
#include "core/securememory.hpp"

namespace securemail::certs {

namespace {

constexpr std::string_view CERTIFICATE_LABEL = "CERTIFICATE";
constexpr std::string_view PRIVATE_KEY_LABEL = "PRIVATE KEY";

} // namespace

CertificateImporter::CertificateImporter(CertificateStore& store)
    : store_(store) {}

std::vector<Certificate> CertificateImporter::importCertificates(std::string_view raw) {
    std::vector<Certificate> created;
    for (const auto& block : extractPemBlocks(raw)) {
        if (block.find(CERTIFICATE_LABEL) == std::string::npos) {
            continue;
        }
        created.push_back(store_.insert(Certificate::fromPem(block)));
    }
    return created;
}

void CertificateImporter::importPrivateKeys(std::string_view raw, std::string_view secret) {
    core::SecureMemory::SecureString passphrase(secret);

    for (const auto& block : extractPemBlocks(raw)) {
        if (block.find(PRIVATE_KEY_LABEL) == std::string::npos) {
            continue;
        }

        auto key = readPrivateKey(block, passphrase.c_str());
        std::string modulus = rsaModulus(key.get());

        // Non-RSA keys have no modulus and can never match a stored certificate
        std::optional<Certificate> certificate;
        if (!modulus.empty()) {
            certificate = store_.findByModulus(modulus);
        }
        if (!certificate) {
            throw core::CertificateNotFound();
        }

        store_.attachPrivateKey(certificate->id(), block, secret);
    }
}

} // namespace securemail::certs
