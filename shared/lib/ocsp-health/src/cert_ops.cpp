/**
 * @file cert_ops.cpp
 * @brief Pure X.509 certificate operations implementation
 *
 * All functions are idempotent. No I/O, no logging side effects.
 */

#include "ocspdash/health/cert_ops.h"

#include <cctype>
#include <ctime>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/sha.h>
#include <openssl/x509v3.h>

namespace ocspdash::health {

namespace {

bool verifySignature(X509* cert, X509* signer) {
    EVP_PKEY* key = X509_get0_pubkey(signer);
    if (!key) {
        ERR_clear_error();
        return false;
    }
    int rc = X509_verify(cert, key);
    if (rc != 1) {
        // Clear OpenSSL error queue to prevent stale errors from leaking
        ERR_clear_error();
    }
    return rc == 1;
}

std::vector<std::string> getAiaUris(X509* cert, int methodNid) {
    std::vector<std::string> uris;
    if (!cert) return uris;

    auto* aia = static_cast<AUTHORITY_INFO_ACCESS*>(
        X509_get_ext_d2i(cert, NID_info_access, nullptr, nullptr));
    if (!aia) return uris;

    for (int i = 0; i < sk_ACCESS_DESCRIPTION_num(aia); ++i) {
        ACCESS_DESCRIPTION* ad = sk_ACCESS_DESCRIPTION_value(aia, i);
        if (OBJ_obj2nid(ad->method) != methodNid) continue;
        if (!ad->location || ad->location->type != GEN_URI) continue;

        ASN1_IA5STRING* uri = ad->location->d.uniformResourceIdentifier;
        uris.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(uri)),
                          static_cast<size_t>(ASN1_STRING_length(uri)));
    }
    AUTHORITY_INFO_ACCESS_free(aia);
    return uris;
}

std::string nameEntry(X509_NAME* name, int nid) {
    int idx = X509_NAME_get_index_by_NID(name, nid, -1);
    if (idx < 0) return "";

    ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, idx));
    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0) return "";

    std::string result(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return result;
}

} // anonymous namespace

// --- Encoding ---

X509Ptr parseCertificate(const Der& bytes) {
    if (bytes.empty()) return nullptr;

    const unsigned char* p = bytes.data();
    X509* cert = d2i_X509(nullptr, &p, static_cast<long>(bytes.size()));
    if (cert) return X509Ptr(cert);
    ERR_clear_error();

    BIO* bio = BIO_new_mem_buf(bytes.data(), static_cast<int>(bytes.size()));
    if (!bio) return nullptr;
    cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!cert) ERR_clear_error();
    return X509Ptr(cert);
}

Der certificateToDer(X509* cert) {
    if (!cert) return {};

    int len = i2d_X509(cert, nullptr);
    if (len <= 0) return {};

    Der out(static_cast<size_t>(len));
    unsigned char* p = out.data();
    i2d_X509(cert, &p);
    return out;
}

std::string toHex(const unsigned char* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[(data[i] >> 4) & 0x0F];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

std::string sha256Hex(const Der& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_Digest(data.data(), data.size(), md, &mdLen, EVP_sha256(), nullptr) != 1) {
        return "";
    }
    return toHex(md, mdLen);
}

std::string base64Encode(const Der& data) {
    if (data.empty()) return "";

    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                              data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(len));
    return out;
}

std::optional<Der> base64Decode(const std::string& encoded) {
    std::string clean;
    clean.reserve(encoded.size());
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) clean += c;
    }
    if (clean.empty()) return Der{};
    if (clean.size() % 4 != 0) return std::nullopt;

    Der out(clean.size() / 4 * 3);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(clean.data()),
                              static_cast<int>(clean.size()));
    if (len < 0) return std::nullopt;

    // EVP_DecodeBlock counts padding bytes as output
    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') ++padding;
    if (clean[clean.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

// --- Identity ---

std::string getCertificateFingerprint(X509* cert) {
    if (!cert) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (X509_digest(cert, EVP_sha256(), md, &mdLen) != 1) {
        return "";
    }
    return toHex(md, mdLen);
}

std::string getKeyIdentifier(X509* cert) {
    if (!cert) return "";

    const ASN1_OCTET_STRING* skid = X509_get0_subject_key_id(cert);
    if (skid) {
        return toHex(ASN1_STRING_get0_data(skid), static_cast<size_t>(ASN1_STRING_length(skid)));
    }

    ASN1_BIT_STRING* key = X509_get0_pubkey_bitstr(cert);
    if (!key) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_Digest(ASN1_STRING_get0_data(key), static_cast<size_t>(ASN1_STRING_length(key)),
                   md, &mdLen, EVP_sha1(), nullptr) != 1) {
        return "";
    }
    return toHex(md, mdLen);
}

std::string getAuthorityKeyIdentifier(X509* cert) {
    if (!cert) return "";

    const ASN1_OCTET_STRING* akid = X509_get0_authority_key_id(cert);
    if (!akid) return "";
    return toHex(ASN1_STRING_get0_data(akid), static_cast<size_t>(ASN1_STRING_length(akid)));
}

std::string getSubjectDn(X509* cert) {
    if (!cert) return "";

    char* dn = X509_NAME_oneline(X509_get_subject_name(cert), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::string getSubjectOrganization(X509* cert) {
    if (!cert) return "";

    X509_NAME* name = X509_get_subject_name(cert);
    std::string org = nameEntry(name, NID_organizationName);
    if (!org.empty()) return org;
    return nameEntry(name, NID_commonName);
}

// --- Structure checks ---

bool isCaCertificate(X509* cert) {
    if (!cert) return false;

    auto* bc = static_cast<BASIC_CONSTRAINTS*>(
        X509_get_ext_d2i(cert, NID_basic_constraints, nullptr, nullptr));
    if (!bc) return false;
    bool ca = bc->ca != 0;
    BASIC_CONSTRAINTS_free(bc);
    return ca;
}

bool isSelfSigned(X509* cert) {
    if (!cert) return false;
    if (X509_NAME_cmp(X509_get_subject_name(cert), X509_get_issuer_name(cert)) != 0) {
        return false;
    }
    return verifySignature(cert, cert);
}

bool isIssuedBy(X509* cert, X509* issuer) {
    if (!cert || !issuer) return false;
    if (X509_NAME_cmp(X509_get_issuer_name(cert), X509_get_subject_name(issuer)) != 0) {
        return false;
    }
    return verifySignature(cert, issuer);
}

// --- Authority Information Access ---

std::vector<std::string> getOcspUrls(X509* cert) {
    return getAiaUris(cert, NID_ad_OCSP);
}

std::vector<std::string> getCaIssuerUrls(X509* cert) {
    return getAiaUris(cert, NID_ad_ca_issuers);
}

// --- Time ---

std::optional<TimePoint> asn1TimeToTimePoint(const ASN1_TIME* t) {
    if (!t) return std::nullopt;

    std::tm tm{};
    if (ASN1_TIME_to_tm(t, &tm) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }
    return Clock::from_time_t(timegm(&tm));
}

TimePoint getNotAfter(X509* cert) {
    if (!cert) return TimePoint{};
    return asn1TimeToTimePoint(X509_get0_notAfter(cert)).value_or(TimePoint{});
}

// --- Chains ---

std::string computeChainId(const Der& subject, const Der& issuer) {
    Der joined;
    joined.reserve(subject.size() + issuer.size());
    joined.insert(joined.end(), subject.begin(), subject.end());
    joined.insert(joined.end(), issuer.begin(), issuer.end());
    return sha256Hex(joined);
}

std::optional<Chain> makeChain(const Der& subject, const Der& issuer) {
    X509Ptr subjectCert = parseCertificate(subject);
    X509Ptr issuerCert = parseCertificate(issuer);
    if (!subjectCert || !issuerCert) return std::nullopt;

    // Normalize to DER so PEM and DER inputs address the same record
    Chain chain;
    chain.subject = certificateToDer(subjectCert.get());
    chain.issuer = certificateToDer(issuerCert.get());
    chain.id = computeChainId(chain.subject, chain.issuer);
    chain.subjectNotAfter = getNotAfter(subjectCert.get());
    return chain;
}

} // namespace ocspdash::health
