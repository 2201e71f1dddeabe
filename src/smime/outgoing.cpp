#include <securemail/smime/outgoing.hpp>
#include "certs/certificateresolver.hpp"
#include "certs/chainbuilder.hpp"
#include "certs/pem.hpp"
#include "core/errors.hpp"
#include <openssl/bio.h>
#include <openssl/pkcs7.h>
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>

namespace securemail::smime {

namespace {

constexpr const char* OPERATION_SIGN = "sign";
constexpr const char* OPERATION_ENCRYPTION = "encryption";
constexpr const char* OUTCOME_SUCCESS = "success";
constexpr const char* OUTCOME_FAILED = "failed";

struct X509StackDeleter {
    void operator()(STACK_OF(X509)* stack) const {
        sk_X509_pop_free(stack, X509_free);
    }
};

using X509StackPtr = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;
using PKCS7Ptr = std::unique_ptr<PKCS7, decltype(&PKCS7_free)>;
using BIOPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;

BIOPtr memoryBio(std::string_view data) {
    BIOPtr bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())), BIO_free);
    if (!bio) {
        throw core::CryptoError("Failed to create memory BIO: " + core::openSSLError());
    }
    return bio;
}

std::string readBio(BIO* bio) {
    char* data = nullptr;
    long length = BIO_get_mem_data(bio, &data);
    return length > 0 ? std::string(data, static_cast<size_t>(length)) : std::string();
}

// Certificates stay owned by their records, the stack holds extra references
X509StackPtr toStack(const std::vector<certs::Certificate>& certificates) {
    X509StackPtr stack(sk_X509_new_null());
    if (!stack) {
        throw core::CryptoError("Failed to allocate certificate stack: " + core::openSSLError());
    }

    for (const auto& cert : certificates) {
        X509* x509 = cert.parsed();
        if (X509_up_ref(x509) != 1) {
            throw core::CryptoError("Failed to reference certificate: " + core::openSSLError());
        }
        if (sk_X509_push(stack.get(), x509) <= 0) {
            X509_free(x509);
            throw core::CryptoError("Failed to build certificate stack: " + core::openSSLError());
        }
    }
    return stack;
}

std::string formatTime(std::chrono::system_clock::time_point tp) {
    std::time_t time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
    return out.str();
}

} // namespace

Outgoing::Outgoing(const certs::CertificateStore& store,
                   core::SecurityConfig config,
                   audit::SecurityLog& log)
    : store_(store), config_(std::move(config)), log_(log) {}

std::string Outgoing::sign(const MailMessage& mail) {
    std::string signedEntity;
    try {
        signedEntity = signMessage(mail);
    } catch (const std::exception& e) {
        log_.logEvent(OPERATION_SIGN, OUTCOME_FAILED, e.what());
        throw;
    }

    log_.logEvent(OPERATION_SIGN, OUTCOME_SUCCESS, "");
    return signedEntity;
}

std::string Outgoing::encrypt(const MailMessage& mail, std::string_view data) {
    std::string encryptedEntity;
    try {
        encryptedEntity = encryptData(mail, data);
    } catch (const std::exception& e) {
        log_.logEvent(OPERATION_ENCRYPTION, OUTCOME_FAILED, e.what());
        throw;
    }

    log_.logEvent(OPERATION_ENCRYPTION, OUTCOME_SUCCESS, "");
    return encryptedEntity;
}

std::string Outgoing::protect(const MailMessage& mail, const SecurityOptions& options) {
    std::string entity = mail.encoded;
    if (options.sign) {
        entity = sign(mail);
    }
    if (options.encrypt) {
        entity = encrypt(mail, entity);
    }
    return entity;
}

std::vector<certs::Certificate> Outgoing::chain(const certs::Certificate& cert) const {
    return certs::ChainBuilder(store_).buildChain(cert);
}

std::string Outgoing::signMessage(const MailMessage& mail) const {
    certs::CertificateResolver resolver(store_);
    auto cert = resolver.forSenderEmailAddress(mail.from);
    if (!cert) {
        throw core::SignerCertificateNotFound(mail.from);
    }

    if (!config_.allowExpiredForSigning && cert->expired()) {
        throw core::ExpiredCertificate(
            "Expired certificate for " + mail.from + " (fingerprint " + cert->fingerprint() +
            ") with " + formatTime(cert->notBefore()) + " to " + formatTime(cert->notAfter()));
    }

    const auto& privateKey = cert->privateKey();
    auto key = certs::readPrivateKey(privateKey->pem, privateKey->secret.c_str());
    auto chainCerts = toStack(chain(*cert));

    auto content = memoryBio(mail.encoded);
    PKCS7Ptr p7(PKCS7_sign(cert->parsed(), key.get(), chainCerts.get(), content.get(),
                           PKCS7_DETACHED),
                PKCS7_free);
    if (!p7) {
        throw core::CryptoError("Unable to sign message: " + core::openSSLError());
    }

    BIOPtr out(BIO_new(BIO_s_mem()), BIO_free);
    auto detachedContent = memoryBio(mail.encoded);
    if (!out || SMIME_write_PKCS7(out.get(), p7.get(), detachedContent.get(), PKCS7_DETACHED) != 1) {
        throw core::CryptoError("Unable to write S/MIME signature: " + core::openSSLError());
    }
    return readBio(out.get());
}

std::string Outgoing::encryptData(const MailMessage& mail, std::string_view data) const {
    auto certificates = recipientCertificates(mail);
    if (certificates.empty()) {
        throw core::CertificatesNotFound({});
    }

    auto expired = std::find_if(certificates.begin(), certificates.end(),
                                [](const certs::Certificate& cert) { return cert.expired(); });
    if (!config_.allowExpiredForEncryption && expired != certificates.end()) {
        throw core::ExpiredCertificate(
            "Expired certificates for cert with " + formatTime(expired->notBefore()) +
            " to " + formatTime(expired->notAfter()));
    }

    const EVP_CIPHER* cipher = config_.resolveCipher();
    auto recipients = toStack(certificates);
    auto content = memoryBio(data);

    PKCS7Ptr p7(PKCS7_encrypt(recipients.get(), content.get(), cipher, 0), PKCS7_free);
    if (!p7) {
        throw core::CryptoError("Unable to encrypt message: " + core::openSSLError());
    }

    BIOPtr out(BIO_new(BIO_s_mem()), BIO_free);
    if (!out || SMIME_write_PKCS7(out.get(), p7.get(), nullptr, 0) != 1) {
        throw core::CryptoError("Unable to write S/MIME envelope: " + core::openSSLError());
    }
    return readBio(out.get());
}

std::vector<certs::Certificate> Outgoing::recipientCertificates(const MailMessage& mail) const {
    certs::CertificateResolver resolver(store_);

    std::vector<certs::Certificate> certificates;
    for (const auto* addresses : {&mail.to, &mail.cc}) {
        if (addresses->empty()) {
            continue;
        }
        auto found = resolver.forRecipientEmailAddresses(*addresses);
        certificates.insert(certificates.end(), found.begin(), found.end());
    }
    return certificates;
}

} // namespace securemail::smime
