#include "audit/securitylog.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <iostream>
#include <sstream>

namespace securemail::audit {

// SQL statements
namespace sql {
    const char* CREATE_TABLES = R"(
        CREATE TABLE IF NOT EXISTS security_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            type TEXT NOT NULL,
            operation TEXT NOT NULL,
            outcome TEXT NOT NULL,
            message TEXT NOT NULL,
            timestamp INTEGER NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_security_log_timestamp ON security_log(timestamp);
        CREATE INDEX IF NOT EXISTS idx_security_log_operation ON security_log(operation);
    )";

    const char* INSERT_EVENT = R"(
        INSERT INTO security_log (type, operation, outcome, message, timestamp)
        VALUES (?, ?, ?, ?, ?);
    )";

    const char* QUERY_EVENTS = R"(
        SELECT id, type, operation, outcome, message, timestamp FROM security_log WHERE 1=1
    )";

    const char* PURGE_EVENTS = "DELETE FROM security_log WHERE timestamp < ?";
}

namespace {

std::string csvField(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

class SqliteSecurityLog::Impl {
public:
    Impl(const std::string& dbPath, std::string type)
        : db_(nullptr), type_(std::move(type)) {
        if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            throw core::StoreError("Failed to open security log database");
        }
        initializeDatabase();
    }

    ~Impl() {
        if (db_) sqlite3_close(db_);
    }

    void logEvent(const std::string& operation, const std::string& outcome,
                  const std::string& message) {
        if (outcome != "success") {
            std::cerr << type_ << " " << operation << " " << outcome << ": " << message << std::endl;
        }

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql::INSERT_EVENT, -1, &stmt, nullptr) != SQLITE_OK) {
            std::cerr << "Failed to write security log: " << sqlite3_errmsg(db_) << std::endl;
            return;
        }

        sqlite3_bind_text(stmt, 1, type_.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, operation.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, outcome.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, message.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 5, std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::cerr << "Failed to write security log: " << sqlite3_errmsg(db_) << std::endl;
        }
        sqlite3_finalize(stmt);
    }

    std::vector<Entry> queryLogs(const Query& filter) const {
        std::stringstream query;
        query << sql::QUERY_EVENTS;
        if (filter.operation) query << " AND operation = ?";
        if (filter.outcome) query << " AND outcome = ?";
        if (filter.timeRange) query << " AND timestamp >= ? AND timestamp <= ?";
        query << " ORDER BY id";

        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, query.str().c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw core::StoreError(std::string("Failed to query security log: ") + sqlite3_errmsg(db_));
        }

        int index = 1;
        if (filter.operation) {
            sqlite3_bind_text(stmt, index++, filter.operation->c_str(), -1, SQLITE_STATIC);
        }
        if (filter.outcome) {
            sqlite3_bind_text(stmt, index++, filter.outcome->c_str(), -1, SQLITE_STATIC);
        }
        if (filter.timeRange) {
            sqlite3_bind_int64(stmt, index++, std::chrono::system_clock::to_time_t(filter.timeRange->start));
            sqlite3_bind_int64(stmt, index++, std::chrono::system_clock::to_time_t(filter.timeRange->end));
        }

        std::vector<Entry> entries;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Entry entry;
            entry.id = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
            entry.type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
            entry.operation = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
            entry.outcome = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
            entry.message = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4));
            entry.timestamp = std::chrono::system_clock::from_time_t(sqlite3_column_int64(stmt, 5));
            entries.push_back(std::move(entry));
        }

        if (rc != SQLITE_DONE) {
            std::string error = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::StoreError("Failed to query security log: " + error);
        }

        sqlite3_finalize(stmt);
        return entries;
    }

    std::string exportLogs(Format format, const TimeRange& range) const {
        std::vector<Entry> entries = queryLogs({std::nullopt, std::nullopt, range});

        std::stringstream output;
        switch (format) {
            case Format::JSON: {
                nlohmann::json j = nlohmann::json::array();
                for (const auto& entry : entries) {
                    nlohmann::json entry_json;
                    entry_json["id"] = entry.id;
                    entry_json["type"] = entry.type;
                    entry_json["operation"] = entry.operation;
                    entry_json["outcome"] = entry.outcome;
                    entry_json["message"] = entry.message;
                    entry_json["timestamp"] = std::chrono::system_clock::to_time_t(entry.timestamp);
                    j.push_back(entry_json);
                }
                output << j.dump(2);
                break;
            }
            case Format::CSV: {
                output << "ID,Type,Operation,Outcome,Message,Timestamp\n";
                for (const auto& entry : entries) {
                    output << entry.id << ","
                           << entry.type << ","
                           << entry.operation << ","
                           << entry.outcome << ","
                           << csvField(entry.message) << ","
                           << std::chrono::system_clock::to_time_t(entry.timestamp)
                           << "\n";
                }
                break;
            }
        }
        return output.str();
    }

    size_t purgeOldLogs(std::chrono::system_clock::time_point before) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql::PURGE_EVENTS, -1, &stmt, nullptr) != SQLITE_OK) {
            throw core::StoreError(std::string("Failed to purge security log: ") + sqlite3_errmsg(db_));
        }

        sqlite3_bind_int64(stmt, 1, std::chrono::system_clock::to_time_t(before));
        bool success = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_finalize(stmt);
        if (!success) {
            throw core::StoreError(std::string("Failed to purge security log: ") + sqlite3_errmsg(db_));
        }
        return static_cast<size_t>(sqlite3_changes(db_));
    }

private:
    sqlite3* db_;
    std::string type_;

    void initializeDatabase() {
        char* errMsg = nullptr;
        if (sqlite3_exec(db_, sql::CREATE_TABLES, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            std::string error = errMsg ? errMsg : "unknown error";
            sqlite3_free(errMsg);
            throw core::StoreError("Failed to initialize security log: " + error);
        }
    }
};

SqliteSecurityLog::SqliteSecurityLog(const std::string& dbPath, std::string type)
    : impl_(std::make_unique<Impl>(dbPath, std::move(type))) {}

SqliteSecurityLog::~SqliteSecurityLog() = default;

void SqliteSecurityLog::logEvent(const std::string& operation,
                                 const std::string& outcome,
                                 const std::string& message) {
    impl_->logEvent(operation, outcome, message);
}

std::vector<Entry> SqliteSecurityLog::queryLogs(const Query& filter) const {
    return impl_->queryLogs(filter);
}

std::string SqliteSecurityLog::exportLogs(Format format, const TimeRange& range) const {
    return impl_->exportLogs(format, range);
}

size_t SqliteSecurityLog::purgeOldLogs(std::chrono::system_clock::time_point before) {
    return impl_->purgeOldLogs(before);
}

} // namespace securemail::audit
