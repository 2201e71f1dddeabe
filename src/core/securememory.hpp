#pragma once

#include "core/core_export.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <cstddef>

namespace securemail::core {

/**
 * @brief Helpers for holding private key secrets in memory
 *
 * Secrets are wiped when released so decrypted key passphrases
 * do not linger in freed heap blocks.
 */
class SECUREMAIL_CORE_EXPORT SecureMemory {
public:
    /**
     * @brief Securely wipe memory region
     * @param ptr Pointer to memory
     * @param size Size in bytes
     */
    static void wipe(void* ptr, size_t size);

    /**
     * @brief Secure string class that auto-wipes memory
     */
    class SecureString {
    public:
        SecureString();
        explicit SecureString(std::string_view str);
        ~SecureString();

        // Move operations
        SecureString(SecureString&& other) noexcept;
        SecureString& operator=(SecureString&& other) noexcept;

        // Prevent copying
        SecureString(const SecureString&) = delete;
        SecureString& operator=(const SecureString&) = delete;

        // NUL terminated, suitable as OpenSSL passphrase
        const char* c_str() const { return data_ ? data_.get() : ""; }
        size_t size() const { return size_; }
        bool empty() const { return size_ == 0; }

        // Convert to std::string (use carefully!)
        std::string toString() const;

    private:
        std::unique_ptr<char[]> data_;
        size_t size_;
        void clear();
    };
};

} // namespace securemail::core
