#include "certs/pem.hpp"
#include "core/errors.hpp"
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/pem.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace securemail::certs {

namespace {

constexpr std::string_view PEM_BEGIN = "-----BEGIN";
constexpr std::string_view PEM_END = "-----END";
constexpr std::string_view PEM_DASHES = "-----";
constexpr std::string_view TRUSTED_MARKER = "TRUSTED";
constexpr std::string_view CERTIFICATE_MARKER = "CERTIFICATE---";

using BIOPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;

BIOPtr memoryBio(std::string_view data) {
    BIOPtr bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())), BIO_free);
    if (!bio) {
        throw core::CryptoError("Failed to create memory BIO: " + core::openSSLError());
    }
    return bio;
}

// Position just past "<label>-----" when a dash-free, non-empty label starts at pos
size_t matchLabel(std::string_view raw, size_t pos) {
    size_t labelEnd = raw.find('-', pos);
    if (labelEnd == std::string_view::npos || labelEnd == pos ||
        raw.compare(labelEnd, PEM_DASHES.size(), PEM_DASHES) != 0) {
        return std::string_view::npos;
    }
    return labelEnd + PEM_DASHES.size();
}

// Removes "TRUSTED " in front of every "CERTIFICATE---" marker
std::string normalizeTrustedMarkers(std::string_view pem) {
    std::string result;
    result.reserve(pem.size());

    size_t pos = 0;
    while (pos < pem.size()) {
        size_t marker = pem.find(CERTIFICATE_MARKER, pos);
        if (marker == std::string_view::npos) {
            result.append(pem.substr(pos));
            break;
        }

        size_t copyEnd = marker;
        size_t prefixLength = TRUSTED_MARKER.size() + 1;
        if (marker >= pos + prefixLength &&
            pem.compare(marker - prefixLength, TRUSTED_MARKER.size(), TRUSTED_MARKER) == 0 &&
            std::isspace(static_cast<unsigned char>(pem[marker - 1]))) {
            copyEnd = marker - prefixLength;
        }

        result.append(pem.substr(pos, copyEnd - pos));
        result.append(CERTIFICATE_MARKER);
        pos = marker + CERTIFICATE_MARKER.size();
    }
    return result;
}

// Never fall back to the terminal prompt of PEM_def_callback
int passphraseCallback(char* buf, int size, int /*rwflag*/, void* userdata) {
    if (!userdata || size <= 0) {
        return -1;
    }
    const char* secret = static_cast<const char*>(userdata);
    size_t length = std::min(std::strlen(secret), static_cast<size_t>(size));
    std::memcpy(buf, secret, length);
    return static_cast<int>(length);
}

std::string toHex(const unsigned char* data, size_t length) {
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; ++i) {
        out << std::setw(2) << static_cast<int>(data[i]);
    }
    return out.str();
}

} // namespace

std::vector<std::string> extractPemBlocks(std::string_view raw) {
    std::vector<std::string> blocks;

    size_t pos = 0;
    while (pos < raw.size()) {
        size_t start = raw.find(PEM_BEGIN, pos);
        if (start == std::string_view::npos) {
            break;
        }

        size_t bodyStart = matchLabel(raw, start + PEM_BEGIN.size());
        if (bodyStart == std::string_view::npos) {
            pos = start + 1;
            continue;
        }

        // Body is at least one character, the first valid END marker closes the block
        size_t blockEnd = std::string_view::npos;
        size_t search = bodyStart + 1;
        while (search < raw.size()) {
            size_t end = raw.find(PEM_END, search);
            if (end == std::string_view::npos) {
                break;
            }
            blockEnd = matchLabel(raw, end + PEM_END.size());
            if (blockEnd != std::string_view::npos) {
                break;
            }
            search = end + 1;
        }

        if (blockEnd == std::string_view::npos) {
            pos = start + 1;
            continue;
        }

        blocks.emplace_back(raw.substr(start, blockEnd - start));
        pos = blockEnd;
    }

    return blocks;
}

X509Ptr parseCertificate(std::string_view pem) {
    std::string normalized = normalizeTrustedMarkers(pem);
    auto bio = memoryBio(normalized);

    X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, passphraseCallback, nullptr), X509_free);
    if (!cert) {
        throw core::MalformedCertificate("Unable to parse certificate: " + core::openSSLError());
    }
    return cert;
}

EVP_PKEYPtr readPrivateKey(std::string_view pem, const char* secret) {
    auto bio = memoryBio(pem);

    EVP_PKEYPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, passphraseCallback,
                                            const_cast<char*>(secret)),
                    EVP_PKEY_free);
    if (!key) {
        throw core::KeyDecryptionError("Unable to decrypt private key: " + core::openSSLError());
    }
    return key;
}

std::string nameToString(const X509_NAME* name) {
    if (!name) {
        return {};
    }
    char* line = X509_NAME_oneline(name, nullptr, 0);
    if (!line) {
        return {};
    }
    std::string result(line);
    OPENSSL_free(line);
    return result;
}

std::string fingerprint(X509* cert) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (X509_digest(cert, EVP_sha1(), md, &length) != 1) {
        throw core::MalformedCertificate("Unable to compute fingerprint: " + core::openSSLError());
    }
    return toHex(md, length);
}

std::string rsaModulus(const EVP_PKEY* key) {
    if (!key || EVP_PKEY_get_base_id(key) != EVP_PKEY_RSA) {
        return {};
    }

    BIGNUM* n = nullptr;
    if (EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_N, &n) != 1 || !n) {
        return {};
    }
    std::unique_ptr<BIGNUM, decltype(&BN_free)> nGuard(n, BN_free);

    char* hex = BN_bn2hex(n);
    if (!hex) {
        return {};
    }
    std::string result(hex);
    OPENSSL_free(hex);
    return result;
}

std::string subjectHash(X509* cert) {
    std::ostringstream out;
    out << std::hex << X509_subject_name_hash(cert);
    return out.str();
}

std::chrono::system_clock::time_point toTimePoint(const ASN1_TIME* time) {
    std::tm tm{};
    if (!time || ASN1_TIME_to_tm(time, &tm) != 1) {
        throw core::MalformedCertificate("Invalid certificate validity time");
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string toPem(X509* cert) {
    BIOPtr bio(BIO_new(BIO_s_mem()), BIO_free);
    if (!bio || PEM_write_bio_X509(bio.get(), cert) != 1) {
        throw core::CryptoError("Unable to encode certificate: " + core::openSSLError());
    }

    char* data = nullptr;
    long length = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(length));
}

} // namespace securemail::certs
