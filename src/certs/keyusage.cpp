#include "certs/keyusage.hpp"
#include <openssl/x509v3.h>
#include <array>
#include <cstdint>

namespace securemail::certs {

namespace {

struct UsageInfo {
    KeyUsage usage;
    uint32_t bit;
    const char* name;
};

const std::array<UsageInfo, 9> USAGES = {{
    {KeyUsage::DigitalSignature, KU_DIGITAL_SIGNATURE, "Digital Signature"},
    {KeyUsage::NonRepudiation, KU_NON_REPUDIATION, "Non Repudiation"},
    {KeyUsage::KeyEncipherment, KU_KEY_ENCIPHERMENT, "Key Encipherment"},
    {KeyUsage::DataEncipherment, KU_DATA_ENCIPHERMENT, "Data Encipherment"},
    {KeyUsage::KeyAgreement, KU_KEY_AGREEMENT, "Key Agreement"},
    {KeyUsage::KeyCertSign, KU_KEY_CERT_SIGN, "Certificate Sign"},
    {KeyUsage::CRLSign, KU_CRL_SIGN, "CRL Sign"},
    {KeyUsage::EncipherOnly, KU_ENCIPHER_ONLY, "Encipher Only"},
    {KeyUsage::DecipherOnly, KU_DECIPHER_ONLY, "Decipher Only"},
}};

const UsageInfo& infoFor(KeyUsage usage) {
    for (const auto& info : USAGES) {
        if (info.usage == usage) {
            return info;
        }
    }
    return USAGES.front();
}

bool hasKeyUsageExtension(X509* cert) {
    return (X509_get_extension_flags(cert) & EXFLAG_KUSAGE) != 0;
}

} // namespace

std::string_view keyUsageName(KeyUsage usage) {
    return infoFor(usage).name;
}

bool keyUsageProhibits(X509* cert, KeyUsage usage) {
    if (!cert || !hasKeyUsageExtension(cert)) {
        return false;
    }
    return (X509_get_key_usage(cert) & infoFor(usage).bit) == 0;
}

std::vector<KeyUsage> declaredKeyUsages(X509* cert) {
    std::vector<KeyUsage> usages;
    if (!cert || !hasKeyUsageExtension(cert)) {
        return usages;
    }

    uint32_t bits = X509_get_key_usage(cert);
    for (const auto& info : USAGES) {
        if (bits & info.bit) {
            usages.push_back(info.usage);
        }
    }
    return usages;
}

} // namespace securemail::certs
