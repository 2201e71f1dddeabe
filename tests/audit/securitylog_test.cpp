#include "audit/securitylog.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include "test_config.h"

using namespace securemail;
using namespace securemail::audit;

class SecurityLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        testOutputPath = std::filesystem::path(TEST_OUTPUT_DIR) / "securitylog";
        std::filesystem::remove_all(testOutputPath);
        std::filesystem::create_directories(testOutputPath);
        dbPath = (testOutputPath / "security_log.db").string();

        log_ = std::make_unique<SqliteSecurityLog>(dbPath);
    }

    void TearDown() override {
        log_.reset();
        std::filesystem::remove_all(testOutputPath);
    }

    static TimeRange aroundNow() {
        auto now = std::chrono::system_clock::now();
        return {now - std::chrono::hours(1), now + std::chrono::hours(1)};
    }

    std::unique_ptr<SqliteSecurityLog> log_;
    std::filesystem::path testOutputPath;
    std::string dbPath;
};

TEST_F(SecurityLogTest, LogEvent) {
    log_->logEvent("sign", "failed", "Unable to find ssl private key for 'a@example.com'");

    auto entries = log_->queryLogs({});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, "S/MIME");
    EXPECT_EQ(entries[0].operation, "sign");
    EXPECT_EQ(entries[0].outcome, "failed");
    EXPECT_EQ(entries[0].message, "Unable to find ssl private key for 'a@example.com'");
}

TEST_F(SecurityLogTest, QueryByOperationAndOutcome) {
    log_->logEvent("sign", "success", "");
    log_->logEvent("encryption", "failed", "Can't find S/MIME encryption certificates for: b@example.com");
    log_->logEvent("encryption", "success", "");

    Query byOperation;
    byOperation.operation = "encryption";
    EXPECT_EQ(log_->queryLogs(byOperation).size(), 2u);

    Query failures;
    failures.outcome = "failed";
    auto failed = log_->queryLogs(failures);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].operation, "encryption");

    Query range;
    range.timeRange = TimeRange{std::chrono::system_clock::now() - std::chrono::hours(48),
                                std::chrono::system_clock::now() - std::chrono::hours(24)};
    EXPECT_TRUE(log_->queryLogs(range).empty());
}

TEST_F(SecurityLogTest, EntriesPersist) {
    log_->logEvent("sign", "failed", "first");
    log_.reset();

    log_ = std::make_unique<SqliteSecurityLog>(dbPath);
    log_->logEvent("sign", "failed", "second");

    auto entries = log_->queryLogs({});
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].message, "first");
    EXPECT_EQ(entries[1].message, "second");
    EXPECT_LT(entries[0].id, entries[1].id);
}

TEST_F(SecurityLogTest, ExportJSON) {
    log_->logEvent("encryption", "failed", "Expired certificates for cert with x to y");

    auto exported = nlohmann::json::parse(log_->exportLogs(Format::JSON, aroundNow()));
    ASSERT_TRUE(exported.is_array());
    ASSERT_EQ(exported.size(), 1u);
    EXPECT_EQ(exported[0]["operation"], "encryption");
    EXPECT_EQ(exported[0]["outcome"], "failed");
    EXPECT_EQ(exported[0]["type"], "S/MIME");
}

TEST_F(SecurityLogTest, ExportCSVQuotesMessage) {
    log_->logEvent("sign", "failed", "say \"hello\", world");

    std::string csv = log_->exportLogs(Format::CSV, aroundNow());
    EXPECT_EQ(csv.rfind("ID,Type,Operation,Outcome,Message,Timestamp\n", 0), 0u);
    EXPECT_NE(csv.find(",S/MIME,sign,failed,\"say \"\"hello\"\", world\","), std::string::npos);
}

TEST_F(SecurityLogTest, PurgeOldLogs) {
    log_->logEvent("sign", "success", "");
    log_->logEvent("encryption", "success", "");

    EXPECT_EQ(log_->purgeOldLogs(std::chrono::system_clock::now() - std::chrono::hours(1)), 0u);
    EXPECT_EQ(log_->purgeOldLogs(std::chrono::system_clock::now() + std::chrono::hours(1)), 2u);
    EXPECT_TRUE(log_->queryLogs({}).empty());
}

TEST_F(SecurityLogTest, CustomType) {
    SqliteSecurityLog pgp(":memory:", "PGP");
    pgp.logEvent("sign", "success", "");

    auto entries = pgp.queryLogs({});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].type, "PGP");
}

TEST_F(SecurityLogTest, FailedQueryThrows) {
    log_->logEvent("sign", "success", "");

    // a second connection holding an exclusive lock makes reads fail with SQLITE_BUSY
    sqlite3* locker = nullptr;
    ASSERT_EQ(sqlite3_open(dbPath.c_str(), &locker), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(locker, "BEGIN EXCLUSIVE;", nullptr, nullptr, nullptr), SQLITE_OK);

    EXPECT_THROW(log_->queryLogs({}), core::StoreError);
    EXPECT_THROW(log_->exportLogs(Format::JSON, aroundNow()), core::StoreError);

    sqlite3_exec(locker, "ROLLBACK;", nullptr, nullptr, nullptr);
    sqlite3_close(locker);

    EXPECT_EQ(log_->queryLogs({}).size(), 1u);
}

TEST(SecurityLogOpenTest, UnopenableDatabase) {
    EXPECT_THROW(SqliteSecurityLog("/nonexistent-directory/security_log.db"), core::StoreError);
}
