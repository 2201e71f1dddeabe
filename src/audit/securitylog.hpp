#pragma once

#include "core/core_export.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace securemail::audit {

/**
 * @brief Sink for the outcome of S/MIME operations
 */
class SECUREMAIL_CORE_EXPORT SecurityLog {
public:
    virtual ~SecurityLog() = default;

    /**
     * @brief Record an operation outcome
     * @param operation "sign" or "encryption"
     * @param outcome "success" or "failed"
     * @param message Error text, never key material
     */
    virtual void logEvent(const std::string& operation,
                          const std::string& outcome,
                          const std::string& message) = 0;
};

struct Entry {
    uint64_t id;
    std::string type;
    std::string operation;
    std::string outcome;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
};

enum class Format {
    JSON,
    CSV
};

struct TimeRange {
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point end;
};

struct Query {
    std::optional<std::string> operation;
    std::optional<std::string> outcome;
    std::optional<TimeRange> timeRange;
};

/**
 * @brief SecurityLog persisted in SQLite
 *
 * Failed operations are also echoed to stderr. Storage errors while
 * logging are reported on stderr and never replace the error being logged.
 */
class SECUREMAIL_CORE_EXPORT SqliteSecurityLog : public SecurityLog {
public:
    /**
     * @param dbPath Path to the SQLite database file
     * @param type Protection mechanism recorded with each entry
     * @throws core::StoreError if the database cannot be opened
     */
    explicit SqliteSecurityLog(const std::string& dbPath, std::string type = "S/MIME");
    ~SqliteSecurityLog() override;

    void logEvent(const std::string& operation,
                  const std::string& outcome,
                  const std::string& message) override;

    std::vector<Entry> queryLogs(const Query& filter) const;

    // Serialized entries of the range, oldest first
    std::string exportLogs(Format format, const TimeRange& range) const;

    /**
     * @brief Delete entries older than a point in time
     * @return Number of deleted entries
     */
    size_t purgeOldLogs(std::chrono::system_clock::time_point before);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Prevent copying
    SqliteSecurityLog(const SqliteSecurityLog&) = delete;
    SqliteSecurityLog& operator=(const SqliteSecurityLog&) = delete;
};

} // namespace securemail::audit
