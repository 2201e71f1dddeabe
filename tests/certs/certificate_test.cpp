#include "certs/certificate.hpp"
#include "certs/keyusage.hpp"
#include "core/errors.hpp"
#include "support/testcertificates.hpp"
#include <gtest/gtest.h>
#include <chrono>

using namespace securemail;
using namespace securemail::certs;
using namespace std::chrono_literals;

class CertificateTest : public ::testing::Test {
protected:
    Certificate issue(const test::CertificateSpec& spec) {
        return Certificate::fromPem(factory_.issue(spec).certificatePem());
    }

    test::CertificateFactory factory_;
};

TEST_F(CertificateTest, DerivesIdentityFields) {
    test::CertificateSpec spec;
    spec.commonName = "smime1@example.com";
    spec.emailAddresses = {"smime1@example.com"};
    auto issued = factory_.issue(spec);

    auto cert = Certificate::fromPem(issued.certificatePem());
    EXPECT_EQ(cert.id(), 0);
    EXPECT_EQ(cert.subject(), "/O=SecureMail/CN=smime1@example.com");
    EXPECT_EQ(cert.fingerprint(), issued.fingerprint());
    EXPECT_EQ(cert.modulus(), rsaModulus(issued.key.get()));
    EXPECT_FALSE(cert.docHash().empty());
    EXPECT_LT(cert.notBefore(), cert.notAfter());
    EXPECT_FALSE(cert.hasPrivateKey());
    EXPECT_TRUE(cert.selfSigned());
}

TEST_F(CertificateTest, SingleEmailAddress) {
    test::CertificateSpec spec;
    spec.emailAddresses = {"smime1@example.com"};
    auto cert = issue(spec);

    EXPECT_EQ(cert.emailAddresses(), std::vector<std::string>({"smime1@example.com"}));
}

TEST_F(CertificateTest, MultipleEmailAddresses) {
    test::CertificateSpec spec;
    spec.emailAddresses = {"smimedouble@example.com", "smimedouble@example.de"};
    auto cert = issue(spec);

    EXPECT_EQ(cert.emailAddresses(),
              std::vector<std::string>({"smimedouble@example.com", "smimedouble@example.de"}));
}

TEST_F(CertificateTest, EmailAddressesAreLowercase) {
    test::CertificateSpec spec;
    spec.emailAddresses = {"CaseInsenstive@eXample.COM"};
    auto cert = issue(spec);

    EXPECT_EQ(cert.emailAddresses(), std::vector<std::string>({"caseinsenstive@example.com"}));
}

TEST_F(CertificateTest, MalformedEmailAddressIsSkipped) {
    test::CertificateSpec spec;
    spec.emailAddresses = {"not-an-address", "valid@example.com"};
    auto cert = issue(spec);

    EXPECT_EQ(cert.emailAddresses(), std::vector<std::string>({"valid@example.com"}));
}

TEST_F(CertificateTest, NoSubjectAltName) {
    test::CertificateSpec spec;
    spec.emailAddresses = {"smime1@example.com"};
    spec.subjectAltName = false;
    auto cert = issue(spec);

    EXPECT_TRUE(cert.emailAddresses().empty());
}

TEST_F(CertificateTest, ReplacingMaterialResetsCache) {
    test::CertificateSpec first;
    first.emailAddresses = {"first@example.com"};
    test::CertificateSpec second;
    second.emailAddresses = {"second@example.com"};

    auto cert = issue(first);
    ASSERT_EQ(cert.emailAddresses(), std::vector<std::string>({"first@example.com"}));

    auto replacement = factory_.issue(second);
    cert.setPublicKey(replacement.certificatePem());
    EXPECT_EQ(cert.emailAddresses(), std::vector<std::string>({"second@example.com"}));
    EXPECT_EQ(cert.fingerprint(), replacement.fingerprint());
}

TEST_F(CertificateTest, RestoredRecordParsesLazily) {
    test::CertificateSpec spec;
    spec.emailAddresses = {"lazy@example.com"};
    auto original = issue(spec);

    Certificate restored(original.attributes());
    EXPECT_EQ(restored.emailAddresses(), original.emailAddresses());
    EXPECT_EQ(restored.issuer(), original.issuer());
}

TEST_F(CertificateTest, CorruptStoredMaterial) {
    Certificate::Attributes attributes;
    attributes.raw = "garbage";
    Certificate cert(attributes);

    EXPECT_THROW(cert.parsed(), core::MalformedCertificate);
}

TEST_F(CertificateTest, Expired) {
    test::CertificateSpec expiredSpec;
    expiredSpec.notBeforeOffset = -std::chrono::hours(24 * 730);
    expiredSpec.notAfterOffset = -std::chrono::hours(24 * 365);
    EXPECT_TRUE(issue(expiredSpec).expired());

    test::CertificateSpec validSpec;
    EXPECT_FALSE(issue(validSpec).expired());

    test::CertificateSpec futureSpec;
    futureSpec.notBeforeOffset = std::chrono::hours(24);
    EXPECT_TRUE(issue(futureSpec).expired());
}

TEST_F(CertificateTest, ExpiredAtPointInTime) {
    auto cert = issue(test::CertificateSpec{});

    EXPECT_FALSE(cert.expired(cert.notBefore()));
    EXPECT_FALSE(cert.expired(cert.notAfter()));
    EXPECT_TRUE(cert.expired(cert.notAfter() + 1s));
    EXPECT_TRUE(cert.expired(cert.notBefore() - 1s));
}

TEST_F(CertificateTest, KeyUsageAllowsDeclaredUsages) {
    test::CertificateSpec spec;
    spec.keyUsage = "digitalSignature,keyEncipherment";
    auto cert = issue(spec);

    EXPECT_FALSE(cert.keyUsageProhibits(KeyUsage::DigitalSignature));
    EXPECT_FALSE(cert.keyUsageProhibits(KeyUsage::KeyEncipherment));
    EXPECT_TRUE(cert.keyUsageProhibits(KeyUsage::KeyCertSign));
}

TEST_F(CertificateTest, KeyUsageProhibitsUndeclaredUsages) {
    test::CertificateSpec spec;
    spec.keyUsage = "cRLSign,keyCertSign";
    auto cert = issue(spec);

    EXPECT_TRUE(cert.keyUsageProhibits(KeyUsage::DigitalSignature));
    EXPECT_TRUE(cert.keyUsageProhibits(KeyUsage::KeyEncipherment));
    EXPECT_EQ(declaredKeyUsages(cert.parsed()),
              std::vector<KeyUsage>({KeyUsage::KeyCertSign, KeyUsage::CRLSign}));
}

TEST_F(CertificateTest, MissingKeyUsageIsPermissive) {
    test::CertificateSpec spec;
    spec.keyUsage = std::nullopt;
    auto cert = issue(spec);

    EXPECT_FALSE(cert.keyUsageProhibits(KeyUsage::DigitalSignature));
    EXPECT_FALSE(cert.keyUsageProhibits(KeyUsage::KeyEncipherment));
    EXPECT_TRUE(declaredKeyUsages(cert.parsed()).empty());
}

TEST(KeyUsageTest, Names) {
    EXPECT_EQ(keyUsageName(KeyUsage::DigitalSignature), "Digital Signature");
    EXPECT_EQ(keyUsageName(KeyUsage::KeyEncipherment), "Key Encipherment");
}

TEST(EmailAddressTest, Validation) {
    EXPECT_TRUE(isValidEmailAddress("jd@example.com"));
    EXPECT_TRUE(isValidEmailAddress("john.doe@mail.example.co.uk"));
    EXPECT_FALSE(isValidEmailAddress(""));
    EXPECT_FALSE(isValidEmailAddress("example.com"));
    EXPECT_FALSE(isValidEmailAddress("@example.com"));
    EXPECT_FALSE(isValidEmailAddress("a@b@example.com"));
    EXPECT_FALSE(isValidEmailAddress("jd@localhost"));
    EXPECT_FALSE(isValidEmailAddress("j d@example.com"));
    EXPECT_FALSE(isValidEmailAddress("jd@example."));
}
