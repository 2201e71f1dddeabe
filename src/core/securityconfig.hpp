#pragma once

#include "core/core_export.hpp"
#include <openssl/evp.h>
#include <filesystem>
#include <string>

namespace securemail::core {

/**
 * @brief S/MIME security settings consumed by the outgoing mail engine
 *
 * JSON layout:
 * @code
 * { "sign": {"allow_expired": false},
 *   "encryption": {"allow_expired": false},
 *   "cipher": "AES-128-CBC" }
 * @endcode
 */
struct SECUREMAIL_CORE_EXPORT SecurityConfig {
    static constexpr const char* DEFAULT_CIPHER = "AES-128-CBC";

    bool allowExpiredForSigning = false;
    bool allowExpiredForEncryption = false;
    std::string cipher = DEFAULT_CIPHER;

    /**
     * @brief Parse settings from JSON text
     * @param json JSON document, all keys optional
     * @throws ConfigurationError on malformed JSON or unknown cipher
     */
    static SecurityConfig fromJson(const std::string& json);

    /**
     * @brief Load settings from a JSON file
     * @throws ConfigurationError if the file cannot be read or parsed
     */
    static SecurityConfig loadFromFile(const std::filesystem::path& path);

    /**
     * @brief Look up the OpenSSL cipher for the configured name
     * @throws ConfigurationError if OpenSSL does not know the cipher
     */
    const EVP_CIPHER* resolveCipher() const;
};

} // namespace securemail::core
