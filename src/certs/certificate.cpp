#include "certs/certificate.hpp"
#include "certs/pem.hpp"
#include "core/errors.hpp"
#include <openssl/x509v3.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace securemail::certs {

namespace {

using GeneralNamesPtr = std::unique_ptr<GENERAL_NAMES, decltype(&GENERAL_NAMES_free)>;

} // namespace

std::string toLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool isValidEmailAddress(std::string_view address) {
    if (address.empty()) {
        return false;
    }
    if (std::any_of(address.begin(), address.end(),
                    [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
        return false;
    }

    size_t at = address.find('@');
    if (at == std::string_view::npos || at == 0 ||
        address.find('@', at + 1) != std::string_view::npos) {
        return false;
    }

    std::string_view domain = address.substr(at + 1);
    size_t dot = domain.rfind('.');
    return dot != std::string_view::npos && dot > 0 && dot + 1 < domain.size();
}

Certificate::Certificate(Attributes attributes, std::shared_ptr<const PrivateKey> privateKey)
    : attributes_(std::move(attributes)), privateKey_(std::move(privateKey)) {}

Certificate Certificate::fromPem(std::string_view pem) {
    Certificate cert;
    cert.setPublicKey(pem);
    return cert;
}

void Certificate::setPublicKey(std::string_view pem) {
    X509Ptr cert = parseCertificate(pem);

    std::string modulus = rsaModulus(X509_get0_pubkey(cert.get()));
    if (modulus.empty()) {
        throw core::MalformedCertificate("Only certificates with RSA public keys are supported");
    }

    attributes_.subject = nameToString(X509_get_subject_name(cert.get()));
    attributes_.docHash = subjectHash(cert.get());
    attributes_.fingerprint = certs::fingerprint(cert.get());
    attributes_.modulus = std::move(modulus);
    attributes_.notBefore = toTimePoint(X509_get0_notBefore(cert.get()));
    attributes_.notAfter = toTimePoint(X509_get0_notAfter(cert.get()));
    attributes_.raw = toPem(cert.get());

    parsed_ = std::shared_ptr<X509>(cert.release(), X509_free);
    emailAddresses_.reset();
}

void Certificate::setPrivateKey(std::string pem, std::string_view secret) {
    auto key = std::make_shared<PrivateKey>();
    key->pem = std::move(pem);
    key->secret = core::SecureMemory::SecureString(secret);
    privateKey_ = std::move(key);
}

X509* Certificate::parsed() const {
    if (!parsed_) {
        parsed_ = std::shared_ptr<X509>(parseCertificate(attributes_.raw).release(), X509_free);
    }
    return parsed_.get();
}

std::string Certificate::issuer() const {
    return nameToString(X509_get_issuer_name(parsed()));
}

const std::vector<std::string>& Certificate::emailAddresses() const {
    if (!emailAddresses_) {
        emailAddresses_ = emailAddressesFromSubjectAltName();
    }
    return *emailAddresses_;
}

bool Certificate::keyUsageProhibits(KeyUsage usage) const {
    return certs::keyUsageProhibits(parsed(), usage);
}

bool Certificate::expired(TimePoint now) const {
    return now < attributes_.notBefore || now > attributes_.notAfter;
}

std::vector<std::string> Certificate::emailAddressesFromSubjectAltName() const {
    GeneralNamesPtr names(static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(parsed(), NID_subject_alt_name, nullptr, nullptr)),
        GENERAL_NAMES_free);

    if (!names) {
        std::cerr << "SMIMECertificate with ID " << id()
                  << " has no subjectAltName extension and therefore no email addresses"
                  << " assigned. This makes it useless in terms of S/MIME. Please check."
                  << std::endl;
        return {};
    }

    std::vector<std::string> addresses;
    for (int i = 0; i < sk_GENERAL_NAME_num(names.get()); ++i) {
        const GENERAL_NAME* name = sk_GENERAL_NAME_value(names.get(), i);
        if (name->type != GEN_EMAIL) {
            continue;
        }

        const ASN1_IA5STRING* value = name->d.rfc822Name;
        std::string address = toLower(std::string_view(
            reinterpret_cast<const char*>(ASN1_STRING_get0_data(value)),
            static_cast<size_t>(ASN1_STRING_length(value))));

        if (!isValidEmailAddress(address)) {
            std::cerr << "SMIMECertificate with ID " << id()
                      << " has the malformed email address \"" << address
                      << "\" stored in the subjectAltName extension."
                      << " This makes it useless in terms of S/MIME. Please check."
                      << std::endl;
            continue;
        }

        addresses.push_back(std::move(address));
    }
    return addresses;
}

} // namespace securemail::certs
