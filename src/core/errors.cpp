#include "core/errors.hpp"
#include <openssl/err.h>
#include <sstream>

namespace securemail::core {

namespace {

std::string joinAddresses(const std::vector<std::string>& addresses) {
    std::ostringstream out;
    for (size_t i = 0; i < addresses.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << addresses[i];
    }
    return out.str();
}

} // namespace

DuplicateCertificate::DuplicateCertificate(const std::string& fingerprint)
    : Error("Validation failed: a certificate with fingerprint " + fingerprint +
            " already exists"),
      fingerprint_(fingerprint) {}

CertificateNotFound::CertificateNotFound()
    : Error("The certificate for this private key could not be found.") {}

CertificatesNotFound::CertificatesNotFound(std::vector<std::string> addresses)
    : Error("Can't find S/MIME encryption certificates for: " + joinAddresses(addresses)),
      addresses_(std::move(addresses)) {}

SignerCertificateNotFound::SignerCertificateNotFound(const std::string& address)
    : Error("Unable to find ssl private key for '" + address + "'") {}

std::string openSSLError() {
    unsigned long code = 0;
    unsigned long last = 0;
    while ((code = ERR_get_error()) != 0) {
        last = code;
    }
    if (last == 0) {
        return "unknown error";
    }

    char buf[256];
    ERR_error_string_n(last, buf, sizeof(buf));
    return buf;
}

} // namespace securemail::core
