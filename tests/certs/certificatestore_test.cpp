#include "certs/certificatestore.hpp"
#include "core/errors.hpp"
#include "support/testcertificates.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "test_config.h"

using namespace securemail;
using namespace securemail::certs;

class CertificateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        testOutputPath = std::filesystem::path(TEST_OUTPUT_DIR) / "certificatestore";
        std::filesystem::remove_all(testOutputPath);
        std::filesystem::create_directories(testOutputPath);
        dbPath = (testOutputPath / "certificates.db").string();

        store_ = std::make_unique<CertificateStore>(dbPath);
    }

    void TearDown() override {
        store_.reset();
        std::filesystem::remove_all(testOutputPath);
    }

    test::Issued issue(const std::string& address, int notAfterDays, int notBeforeDays = -1) {
        test::CertificateSpec spec;
        spec.commonName = address;
        spec.emailAddresses = {address};
        spec.notBeforeOffset = std::chrono::hours(24 * notBeforeDays);
        spec.notAfterOffset = std::chrono::hours(24 * notAfterDays);
        return factory_.issue(spec);
    }

    Certificate store(const test::Issued& issued) {
        return store_->insert(Certificate::fromPem(issued.certificatePem()));
    }

    std::vector<int64_t> scannedIds(const CertificateStore::ScanOptions& options) {
        std::vector<int64_t> ids;
        store_->scan(options, [&ids](const Certificate& cert) {
            ids.push_back(cert.id());
            return CertificateStore::ScanControl::Continue;
        });
        return ids;
    }

    test::CertificateFactory factory_;
    std::unique_ptr<CertificateStore> store_;
    std::filesystem::path testOutputPath;
    std::string dbPath;
};

TEST_F(CertificateStoreTest, InsertAssignsId) {
    auto issued = issue("a@example.com", 365);
    auto stored = store(issued);

    EXPECT_GT(stored.id(), 0);
    EXPECT_EQ(stored.fingerprint(), issued.fingerprint());
    EXPECT_EQ(store_->count(), 1u);
}

TEST_F(CertificateStoreTest, DuplicateFingerprintIsRejected) {
    auto issued = issue("a@example.com", 365);
    auto first = store(issued);

    try {
        store(issued);
        FAIL() << "duplicate certificate was stored";
    } catch (const core::DuplicateCertificate& e) {
        EXPECT_EQ(e.fingerprint(), issued.fingerprint());
    }

    EXPECT_EQ(store_->count(), 1u);
    auto found = store_->findByFingerprint(issued.fingerprint());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id(), first.id());
}

TEST_F(CertificateStoreTest, DefaultOrder) {
    auto older = store(issue("a@example.com", 100));
    auto newest = store(issue("a@example.com", 300));
    auto laterStart = store(issue("a@example.com", 100, 0));
    auto middle = store(issue("a@example.com", 200));

    std::vector<int64_t> ids;
    for (const auto& cert : store_->all()) {
        ids.push_back(cert.id());
    }
    EXPECT_EQ(ids, std::vector<int64_t>({newest.id(), middle.id(), laterStart.id(), older.id()}));
}

TEST_F(CertificateStoreTest, EqualValidityOrdersByHighestId) {
    auto issued = issue("a@example.com", 365);
    test::CertificateSpec spec;
    spec.emailAddresses = {"a@example.com"};
    auto twin = factory_.issueWithKey(spec, issued);

    auto first = store(issued);
    auto second = store(twin);

    // same second for both certificates, id decides
    if (first.notAfter() == second.notAfter() && first.notBefore() == second.notBefore()) {
        EXPECT_EQ(scannedIds({}), std::vector<int64_t>({second.id(), first.id()}));
        EXPECT_EQ(store_->findByModulus(first.modulus())->id(), second.id());
    }
}

TEST_F(CertificateStoreTest, ScanPagesThroughAllRecords) {
    for (int i = 0; i < 7; ++i) {
        store(issue("page" + std::to_string(i) + "@example.com", 10 + i));
    }

    auto expected = scannedIds({});
    ASSERT_EQ(expected.size(), 7u);

    for (size_t batchSize : {1u, 2u, 3u, 7u, 50u}) {
        CertificateStore::ScanOptions options;
        options.batchSize = batchSize;
        EXPECT_EQ(scannedIds(options), expected) << "batch size " << batchSize;
    }
}

TEST_F(CertificateStoreTest, ScanStopsOnRequest) {
    for (int i = 0; i < 5; ++i) {
        store(issue("stop" + std::to_string(i) + "@example.com", 10 + i));
    }

    size_t visited = 0;
    CertificateStore::ScanOptions options;
    options.batchSize = 2;
    store_->scan(options, [&visited](const Certificate&) {
        return ++visited == 3 ? CertificateStore::ScanControl::Stop
                              : CertificateStore::ScanControl::Continue;
    });
    EXPECT_EQ(visited, 3u);
}

TEST_F(CertificateStoreTest, ScanWithPrivateKeyOnly) {
    auto withKey = issue("key@example.com", 365);
    auto storedWithKey = store(withKey);
    store(issue("nokey@example.com", 400));
    store_->attachPrivateKey(storedWithKey.id(), withKey.privateKeyPem("secret"), "secret");

    CertificateStore::ScanOptions options;
    options.withPrivateKeyOnly = true;
    options.batchSize = 1;
    EXPECT_EQ(scannedIds(options), std::vector<int64_t>({storedWithKey.id()}));
    EXPECT_EQ(scannedIds({}).size(), 2u);
}

TEST_F(CertificateStoreTest, AttachPrivateKey) {
    auto issued = issue("a@example.com", 365);
    auto stored = store(issued);
    std::string pem = issued.privateKeyPem("secret");

    store_->attachPrivateKey(stored.id(), pem, "secret");

    auto found = store_->findByFingerprint(issued.fingerprint());
    ASSERT_TRUE(found.has_value());
    ASSERT_TRUE(found->hasPrivateKey());
    EXPECT_EQ(found->privateKey()->pem, pem);
    EXPECT_EQ(found->privateKey()->secret.toString(), "secret");
}

TEST_F(CertificateStoreTest, FindByModulusAndSubject) {
    auto issued = issue("find@example.com", 365);
    auto stored = store(issued);
    store(issue("other@example.com", 365));

    auto byModulus = store_->findByModulus(stored.modulus());
    ASSERT_TRUE(byModulus.has_value());
    EXPECT_EQ(byModulus->id(), stored.id());

    auto bySubject = store_->findBySubject("/O=SecureMail/CN=find@example.com");
    ASSERT_TRUE(bySubject.has_value());
    EXPECT_EQ(bySubject->id(), stored.id());

    EXPECT_FALSE(store_->findByModulus("ABCDEF").has_value());
    EXPECT_FALSE(store_->findBySubject("/CN=nobody").has_value());
    EXPECT_FALSE(store_->findByFingerprint(std::string(40, '0')).has_value());
}

TEST_F(CertificateStoreTest, EmptyStore) {
    EXPECT_EQ(store_->count(), 0u);
    EXPECT_TRUE(store_->all().empty());
    EXPECT_TRUE(scannedIds({}).empty());
}

TEST_F(CertificateStoreTest, RecordsPersistAcrossReopen) {
    auto issued = issue("persist@example.com", 365);
    auto stored = store(issued);
    store_->attachPrivateKey(stored.id(), issued.privateKeyPem("secret"), "secret");
    store_.reset();

    store_ = std::make_unique<CertificateStore>(dbPath);
    auto found = store_->findByFingerprint(issued.fingerprint());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id(), stored.id());
    EXPECT_EQ(found->subject(), stored.subject());
    EXPECT_EQ(found->notAfter(), stored.notAfter());
    EXPECT_EQ(found->emailAddresses(), std::vector<std::string>({"persist@example.com"}));
    EXPECT_TRUE(found->hasPrivateKey());
}

TEST_F(CertificateStoreTest, InMemoryStore) {
    CertificateStore memory(":memory:");
    memory.insert(Certificate::fromPem(issue("mem@example.com", 365).certificatePem()));
    EXPECT_EQ(memory.count(), 1u);
    EXPECT_EQ(store_->count(), 0u);
}

TEST(CertificateStoreOpenTest, UnopenableDatabase) {
    EXPECT_THROW(CertificateStore("/nonexistent-directory/certificates.db"), core::StoreError);
}
