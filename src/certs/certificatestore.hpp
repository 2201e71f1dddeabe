#pragma once

#include "core/core_export.hpp"
#include "certs/certificate.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace securemail::certs {

/**
 * @brief Persistent collection of S/MIME certificates backed by SQLite
 *
 * Records are returned in default order: latest validity end first, then
 * latest validity start, then highest id. Fingerprint uniqueness is a
 * constraint of the table itself, so concurrent imports cannot insert the
 * same certificate twice.
 */
class SECUREMAIL_CORE_EXPORT CertificateStore {
public:
    static constexpr size_t DEFAULT_BATCH_SIZE = 1000;

    enum class ScanControl {
        Continue,
        Stop
    };

    struct ScanOptions {
        bool withPrivateKeyOnly = false;
        size_t batchSize = DEFAULT_BATCH_SIZE;
    };

    using Visitor = std::function<ScanControl(const Certificate&)>;

    /**
     * @brief Open or create a certificate store
     * @param dbPath Path to the SQLite database file (":memory:" for a
     *        private in-memory store)
     * @throws core::StoreError if the database cannot be opened
     */
    explicit CertificateStore(const std::string& dbPath);
    ~CertificateStore();

    // Prevent copying
    CertificateStore(const CertificateStore&) = delete;
    CertificateStore& operator=(const CertificateStore&) = delete;

    /**
     * @brief Persist a new certificate record
     * @param cert Record built with Certificate::fromPem
     * @return The stored record with its id assigned
     * @throws core::DuplicateCertificate if the fingerprint already exists
     */
    Certificate insert(const Certificate& cert);

    /**
     * @brief Attach private key material to a stored certificate
     * @param id Certificate id
     * @param pem Private key PEM as imported
     * @param secret Secret the key is encrypted with
     */
    void attachPrivateKey(int64_t id, const std::string& pem, std::string_view secret);

    std::optional<Certificate> findByModulus(const std::string& modulus) const;
    std::optional<Certificate> findBySubject(const std::string& subject) const;
    std::optional<Certificate> findByFingerprint(const std::string& fingerprint) const;

    /**
     * @brief Visit records in default order, loading one page at a time
     * @param options Page size and private key filter
     * @param visitor Called per record, returns Stop to end the scan
     */
    void scan(const ScanOptions& options, const Visitor& visitor) const;

    // All records in default order
    std::vector<Certificate> all() const;

    size_t count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace securemail::certs
