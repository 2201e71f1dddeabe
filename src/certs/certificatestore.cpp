#include "certs/certificatestore.hpp"
#include "core/errors.hpp"
#include <sqlite3.h>
#include <chrono>

namespace securemail::certs {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

namespace sql {
    const char* CREATE_TABLES = R"(
        CREATE TABLE IF NOT EXISTS smime_certificates (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            subject TEXT NOT NULL,
            doc_hash TEXT NOT NULL,
            fingerprint TEXT NOT NULL UNIQUE,
            modulus TEXT NOT NULL,
            not_before_at INTEGER NOT NULL,
            not_after_at INTEGER NOT NULL,
            raw TEXT NOT NULL,
            private_key TEXT,
            private_key_secret TEXT,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_smime_modulus ON smime_certificates(modulus);
        CREATE INDEX IF NOT EXISTS idx_smime_subject ON smime_certificates(subject);
        CREATE INDEX IF NOT EXISTS idx_smime_order
            ON smime_certificates(not_after_at DESC, not_before_at DESC, id DESC);
    )";

    const char* COLUMNS =
        "SELECT id, subject, doc_hash, fingerprint, modulus, not_before_at, not_after_at, "
        "raw, private_key, private_key_secret FROM smime_certificates";

    const char* ORDER = " ORDER BY not_after_at DESC, not_before_at DESC, id DESC";

    const char* INSERT_CERTIFICATE = R"(
        INSERT INTO smime_certificates (
            subject, doc_hash, fingerprint, modulus, not_before_at, not_after_at,
            raw, created_at, updated_at
        ) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";

    const char* ATTACH_PRIVATE_KEY = R"(
        UPDATE smime_certificates
        SET private_key = ?, private_key_secret = ?, updated_at = ?
        WHERE id = ?;
    )";

    const char* COUNT = "SELECT COUNT(*) FROM smime_certificates";
}

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

int64_t toUnix(std::chrono::system_clock::time_point tp) {
    return static_cast<int64_t>(std::chrono::system_clock::to_time_t(tp));
}

int64_t nowUnix() {
    return toUnix(std::chrono::system_clock::now());
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? std::string(reinterpret_cast<const char*>(text),
                              static_cast<size_t>(sqlite3_column_bytes(stmt, column)))
                : std::string();
}

} // namespace

class CertificateStore::Impl {
public:
    explicit Impl(const std::string& dbPath) : db_(nullptr) {
        if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
            std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw core::StoreError("Failed to open certificate database: " + error);
        }
        sqlite3_extended_result_codes(db_, 1);
        sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);
    }

    ~Impl() {
        if (db_) {
            sqlite3_close(db_);
        }
    }

    void initTables() {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, sql::CREATE_TABLES, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw core::StoreError("Failed to initialize certificate database: " + error);
        }
    }

    Certificate insert(const Certificate& cert) {
        auto stmt = prepare(sql::INSERT_CERTIFICATE);
        const auto& attrs = cert.attributes();
        int64_t now = nowUnix();

        sqlite3_bind_text(stmt.get(), 1, attrs.subject.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 2, attrs.docHash.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 3, attrs.fingerprint.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 4, attrs.modulus.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt.get(), 5, toUnix(attrs.notBefore));
        sqlite3_bind_int64(stmt.get(), 6, toUnix(attrs.notAfter));
        sqlite3_bind_text(stmt.get(), 7, attrs.raw.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt.get(), 8, now);
        sqlite3_bind_int64(stmt.get(), 9, now);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
            throw core::DuplicateCertificate(attrs.fingerprint);
        }
        if (rc != SQLITE_DONE) {
            throw core::StoreError(std::string("Failed to store certificate: ") + sqlite3_errmsg(db_));
        }

        Certificate stored(cert);
        stored.setId(sqlite3_last_insert_rowid(db_));
        return stored;
    }

    void attachPrivateKey(int64_t id, const std::string& pem, std::string_view secret) {
        auto stmt = prepare(sql::ATTACH_PRIVATE_KEY);

        sqlite3_bind_text(stmt.get(), 1, pem.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt.get(), 2, secret.data(), static_cast<int>(secret.size()), SQLITE_STATIC);
        sqlite3_bind_int64(stmt.get(), 3, nowUnix());
        sqlite3_bind_int64(stmt.get(), 4, id);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw core::StoreError(std::string("Failed to store private key: ") + sqlite3_errmsg(db_));
        }
        if (sqlite3_changes(db_) != 1) {
            throw core::StoreError("No certificate with id " + std::to_string(id));
        }
    }

    std::optional<Certificate> findFirstBy(const char* column, const std::string& value) const {
        std::string query = std::string(sql::COLUMNS) + " WHERE " + column + " = ?" +
                            sql::ORDER + " LIMIT 1";
        auto stmt = prepare(query.c_str());
        sqlite3_bind_text(stmt.get(), 1, value.c_str(), -1, SQLITE_STATIC);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            return readRow(stmt.get());
        }
        if (rc != SQLITE_DONE) {
            throw core::StoreError(std::string("Certificate lookup failed: ") + sqlite3_errmsg(db_));
        }
        return std::nullopt;
    }

    // Keyset pagination over the default order
    std::vector<Certificate> page(bool withPrivateKeyOnly,
                                  const std::optional<Certificate>& after,
                                  size_t limit) const {
        std::string query = sql::COLUMNS;
        std::string where;
        if (withPrivateKeyOnly) {
            where += "private_key IS NOT NULL";
        }
        if (after) {
            if (!where.empty()) {
                where += " AND ";
            }
            where += "(not_after_at, not_before_at, id) < (?, ?, ?)";
        }
        if (!where.empty()) {
            query += " WHERE " + where;
        }
        query += sql::ORDER;
        query += " LIMIT ?";

        auto stmt = prepare(query.c_str());
        int index = 1;
        if (after) {
            sqlite3_bind_int64(stmt.get(), index++, toUnix(after->notAfter()));
            sqlite3_bind_int64(stmt.get(), index++, toUnix(after->notBefore()));
            sqlite3_bind_int64(stmt.get(), index++, after->id());
        }
        sqlite3_bind_int64(stmt.get(), index, static_cast<int64_t>(limit));

        std::vector<Certificate> rows;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            rows.push_back(readRow(stmt.get()));
        }
        if (rc != SQLITE_DONE) {
            throw core::StoreError(std::string("Certificate scan failed: ") + sqlite3_errmsg(db_));
        }
        return rows;
    }

    size_t count() const {
        auto stmt = prepare(sql::COUNT);
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw core::StoreError(std::string("Certificate count failed: ") + sqlite3_errmsg(db_));
        }
        return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

private:
    sqlite3* db_;

    StatementPtr prepare(const char* query) const {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, query, -1, &stmt, nullptr) != SQLITE_OK) {
            throw core::StoreError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }
        return StatementPtr(stmt, sqlite3_finalize);
    }

    static Certificate readRow(sqlite3_stmt* stmt) {
        Certificate::Attributes attrs;
        attrs.id = sqlite3_column_int64(stmt, 0);
        attrs.subject = columnText(stmt, 1);
        attrs.docHash = columnText(stmt, 2);
        attrs.fingerprint = columnText(stmt, 3);
        attrs.modulus = columnText(stmt, 4);
        attrs.notBefore = std::chrono::system_clock::from_time_t(sqlite3_column_int64(stmt, 5));
        attrs.notAfter = std::chrono::system_clock::from_time_t(sqlite3_column_int64(stmt, 6));
        attrs.raw = columnText(stmt, 7);

        std::shared_ptr<const Certificate::PrivateKey> privateKey;
        if (sqlite3_column_type(stmt, 8) != SQLITE_NULL) {
            auto key = std::make_shared<Certificate::PrivateKey>();
            key->pem = columnText(stmt, 8);
            const unsigned char* secret = sqlite3_column_text(stmt, 9);
            if (secret) {
                key->secret = core::SecureMemory::SecureString(std::string_view(
                    reinterpret_cast<const char*>(secret),
                    static_cast<size_t>(sqlite3_column_bytes(stmt, 9))));
            }
            privateKey = std::move(key);
        }

        return Certificate(std::move(attrs), std::move(privateKey));
    }
};

CertificateStore::CertificateStore(const std::string& dbPath)
    : impl_(std::make_unique<Impl>(dbPath)) {
    impl_->initTables();
}

CertificateStore::~CertificateStore() = default;

Certificate CertificateStore::insert(const Certificate& cert) {
    return impl_->insert(cert);
}

void CertificateStore::attachPrivateKey(int64_t id, const std::string& pem, std::string_view secret) {
    impl_->attachPrivateKey(id, pem, secret);
}

std::optional<Certificate> CertificateStore::findByModulus(const std::string& modulus) const {
    return impl_->findFirstBy("modulus", modulus);
}

std::optional<Certificate> CertificateStore::findBySubject(const std::string& subject) const {
    return impl_->findFirstBy("subject", subject);
}

std::optional<Certificate> CertificateStore::findByFingerprint(const std::string& fingerprint) const {
    return impl_->findFirstBy("fingerprint", fingerprint);
}

void CertificateStore::scan(const ScanOptions& options, const Visitor& visitor) const {
    size_t batchSize = options.batchSize > 0 ? options.batchSize : DEFAULT_BATCH_SIZE;

    std::optional<Certificate> cursor;
    for (;;) {
        auto batch = impl_->page(options.withPrivateKeyOnly, cursor, batchSize);
        for (const auto& cert : batch) {
            if (visitor(cert) == ScanControl::Stop) {
                return;
            }
        }
        if (batch.size() < batchSize) {
            return;
        }
        cursor = batch.back();
    }
}

std::vector<Certificate> CertificateStore::all() const {
    std::vector<Certificate> result;
    scan({}, [&result](const Certificate& cert) {
        result.push_back(cert);
        return ScanControl::Continue;
    });
    return result;
}

size_t CertificateStore::count() const {
    return impl_->count();
}

} // namespace securemail::certs
