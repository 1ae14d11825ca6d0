/**
 * @file test_cert_ops.cpp
 * @brief Unit tests for certificate helpers (identity, AIA, chains)
 */

#include <gtest/gtest.h>
#include <ocspdash/health/cert_ops.h>
#include "test_helpers.h"

#include <openssl/pem.h>

using namespace ocspdash::health;
using namespace test_helpers;

class CertOpsTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        IntermediateProfile profile;
        profile.ocspUrl = "http://ocsp.example-trust.test/";
        profile.caIssuersUrl = "http://crt.example-trust.test/root.der";
        pki_ = new TestPki("Example Trust", profile);
    }

    static void TearDownTestSuite() {
        delete pki_;
        pki_ = nullptr;
    }

    static TestPki* pki_;
};

TestPki* CertOpsTest::pki_ = nullptr;

// ============================================================================
// Encoding
// ============================================================================

TEST_F(CertOpsTest, ParseCertificate_DerAndPem) {
    Der der = toDer(pki_->root.get());
    ASSERT_FALSE(der.empty());
    EXPECT_NE(parseCertificate(der), nullptr);

    BIO* bio = BIO_new(BIO_s_mem());
    PEM_write_bio_X509(bio, pki_->root.get());
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    Der pem(data, data + len);
    BIO_free(bio);

    X509Ptr fromPem = parseCertificate(pem);
    ASSERT_NE(fromPem, nullptr);
    EXPECT_EQ(certificateToDer(fromPem.get()), der);
}

TEST_F(CertOpsTest, ParseCertificate_GarbageReturnsNull) {
    EXPECT_EQ(parseCertificate(Der{0x01, 0x02, 0x03}), nullptr);
    EXPECT_EQ(parseCertificate(Der{}), nullptr);
}

TEST_F(CertOpsTest, Base64_KnownVectors) {
    Der foobar{'f', 'o', 'o', 'b', 'a', 'r'};
    EXPECT_EQ(base64Encode(foobar), "Zm9vYmFy");
    EXPECT_EQ(base64Encode(Der{'f', 'o'}), "Zm8=");

    auto decoded = base64Decode("Zm8=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, (Der{'f', 'o'}));

    auto wrapped = base64Decode("Zm9v\nYmFy");
    ASSERT_TRUE(wrapped.has_value());
    EXPECT_EQ(*wrapped, foobar);
}

TEST_F(CertOpsTest, Base64_InvalidInput) {
    EXPECT_FALSE(base64Decode("abc").has_value());
    EXPECT_FALSE(base64Decode("!!!!").has_value());
}

// ============================================================================
// Identity
// ============================================================================

TEST_F(CertOpsTest, KeyIdentifier_MatchesAuthorityKeyIdOfChild) {
    std::string rootKeyId = getKeyIdentifier(pki_->root.get());
    ASSERT_FALSE(rootKeyId.empty());
    EXPECT_EQ(getAuthorityKeyIdentifier(pki_->intermediate.get()), rootKeyId);
    EXPECT_NE(getKeyIdentifier(pki_->intermediate.get()), rootKeyId);
}

TEST_F(CertOpsTest, Fingerprint_IsSha256Hex) {
    std::string fp = getCertificateFingerprint(pki_->root.get());
    EXPECT_EQ(fp.size(), 64u);
    EXPECT_EQ(fp, sha256Hex(toDer(pki_->root.get())));
}

TEST_F(CertOpsTest, SubjectOrganization) {
    EXPECT_EQ(getSubjectOrganization(pki_->root.get()), "Example Trust");
    EXPECT_NE(getSubjectDn(pki_->root.get()).find("Example Trust"), std::string::npos);
}

// ============================================================================
// Structure checks
// ============================================================================

TEST_F(CertOpsTest, CaAndSelfSigned) {
    EXPECT_TRUE(isCaCertificate(pki_->root.get()));
    EXPECT_TRUE(isSelfSigned(pki_->root.get()));
    EXPECT_TRUE(isCaCertificate(pki_->intermediate.get()));
    EXPECT_FALSE(isSelfSigned(pki_->intermediate.get()));
}

TEST_F(CertOpsTest, IsIssuedBy) {
    EXPECT_TRUE(isIssuedBy(pki_->intermediate.get(), pki_->root.get()));
    EXPECT_FALSE(isIssuedBy(pki_->root.get(), pki_->intermediate.get()));

    // Same name, different key
    auto otherKey = generateRsaKey();
    auto impostor = createRootCa(otherKey.get(), "Example Trust");
    EXPECT_FALSE(isIssuedBy(pki_->intermediate.get(), impostor.get()));
}

TEST_F(CertOpsTest, NullInputsAreSafe) {
    EXPECT_EQ(getKeyIdentifier(nullptr), "");
    EXPECT_FALSE(isCaCertificate(nullptr));
    EXPECT_FALSE(isIssuedBy(nullptr, pki_->root.get()));
    EXPECT_TRUE(getOcspUrls(nullptr).empty());
}

// ============================================================================
// Authority Information Access
// ============================================================================

TEST_F(CertOpsTest, AiaUrls) {
    auto ocsp = getOcspUrls(pki_->intermediate.get());
    ASSERT_EQ(ocsp.size(), 1u);
    EXPECT_EQ(ocsp[0], "http://ocsp.example-trust.test/");

    auto issuers = getCaIssuerUrls(pki_->intermediate.get());
    ASSERT_EQ(issuers.size(), 1u);
    EXPECT_EQ(issuers[0], "http://crt.example-trust.test/root.der");

    EXPECT_TRUE(getOcspUrls(pki_->root.get()).empty());
}

// ============================================================================
// Chains
// ============================================================================

TEST_F(CertOpsTest, ChainId_Deterministic) {
    Der subject = toDer(pki_->intermediate.get());
    Der issuer = toDer(pki_->root.get());

    auto a = makeChain(subject, issuer);
    auto b = makeChain(subject, issuer);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->id, b->id);
    EXPECT_EQ(a->id, computeChainId(subject, issuer));

    // Order matters: (issuer, subject) is a different chain
    EXPECT_NE(computeChainId(issuer, subject), a->id);
}

TEST_F(CertOpsTest, MakeChain_RecordsSubjectNotAfter) {
    auto chain = makeChain(toDer(pki_->intermediate.get()), toDer(pki_->root.get()));
    ASSERT_TRUE(chain.has_value());
    EXPECT_EQ(chain->subjectNotAfter, getNotAfter(pki_->intermediate.get()));
    EXPECT_FALSE(chain->isExpiredAt(Clock::now()));
    EXPECT_TRUE(chain->isExpiredAt(Clock::now() + std::chrono::hours(24 * 365 * 10)));
}

TEST_F(CertOpsTest, MakeChain_RejectsUnparseable) {
    EXPECT_FALSE(makeChain(Der{0x30, 0x00}, toDer(pki_->root.get())).has_value());
}
