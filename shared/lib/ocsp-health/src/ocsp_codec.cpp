/**
 * @file ocsp_codec.cpp
 * @brief OCSP request encoding and response decoding/verification
 */

#include "ocspdash/health/ocsp_codec.h"
#include "ocspdash/health/cert_ops.h"

#include <cstring>
#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ocsp.h>
#include <openssl/sha.h>
#include <openssl/x509v3.h>

namespace ocspdash::health {

namespace {

struct OcspResponseDeleter { void operator()(OCSP_RESPONSE* p) const { OCSP_RESPONSE_free(p); } };
struct OcspBasicDeleter { void operator()(OCSP_BASICRESP* p) const { OCSP_BASICRESP_free(p); } };
struct OcspCertIdDeleter { void operator()(OCSP_CERTID* p) const { OCSP_CERTID_free(p); } };
struct OcspRequestDeleter { void operator()(OCSP_REQUEST* p) const { OCSP_REQUEST_free(p); } };
struct X509StoreDeleter { void operator()(X509_STORE* p) const { X509_STORE_free(p); } };
struct X509StackDeleter { void operator()(STACK_OF(X509)* p) const { sk_X509_free(p); } };

using UniqueResponse = std::unique_ptr<OCSP_RESPONSE, OcspResponseDeleter>;
using UniqueBasic = std::unique_ptr<OCSP_BASICRESP, OcspBasicDeleter>;
using UniqueCertId = std::unique_ptr<OCSP_CERTID, OcspCertIdDeleter>;
using UniqueRequest = std::unique_ptr<OCSP_REQUEST, OcspRequestDeleter>;
using UniqueStore = std::unique_ptr<X509_STORE, X509StoreDeleter>;
using UniqueStack = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;

std::string lastOpenSslError() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

/// OCSP_basic_verify with the chain issuer as the only trust anchor
bool verifyAgainstIssuer(OCSP_BASICRESP* basic, X509* issuer, std::string& error) {
    UniqueStore store(X509_STORE_new());
    UniqueStack certs(sk_X509_new_null());
    if (!store || !certs) {
        error = "allocation failure";
        return false;
    }
    if (X509_STORE_add_cert(store.get(), issuer) != 1) {
        error = lastOpenSslError();
        return false;
    }
    // The issuer is usually an intermediate: accept it as a trust anchor
    X509_STORE_set_flags(store.get(), X509_V_FLAG_PARTIAL_CHAIN);
    sk_X509_push(certs.get(), issuer);

    // Issuer/delegate authorization is checked separately by responderIdentityMatches
    int rc = OCSP_basic_verify(basic, certs.get(), store.get(), OCSP_TRUSTOTHER | OCSP_NOCHECKS);
    if (rc <= 0) {
        error = lastOpenSslError();
        return false;
    }
    return true;
}

bool isAuthorizedDelegate(X509* signer, X509* issuer) {
    if (!isIssuedBy(signer, issuer)) return false;
    if ((X509_get_extension_flags(signer) & EXFLAG_XKUSAGE) == 0) return false;
    return (X509_get_extended_key_usage(signer) & XKU_OCSP_SIGN) != 0;
}

bool responderIdentityMatches(OCSP_BASICRESP* basic, X509* issuer) {
    const ASN1_OCTET_STRING* keyHash = nullptr;
    const X509_NAME* name = nullptr;
    if (OCSP_resp_get0_id(basic, &keyHash, &name) != 1) {
        ERR_clear_error();
        return false;
    }

    if (name && X509_NAME_cmp(name, X509_get_subject_name(issuer)) == 0) {
        return true;
    }

    if (keyHash) {
        unsigned char md[SHA_DIGEST_LENGTH];
        unsigned int mdLen = 0;
        if (X509_pubkey_digest(issuer, EVP_sha1(), md, &mdLen) == 1
            && static_cast<int>(mdLen) == ASN1_STRING_length(keyHash)
            && std::memcmp(md, ASN1_STRING_get0_data(keyHash), mdLen) == 0) {
            return true;
        }
    }

    // Delegated responder: signer certificate embedded in the response
    X509* signer = nullptr;
    if (OCSP_resp_get0_signer(basic, &signer, nullptr) != 1 || !signer) {
        ERR_clear_error();
        return false;
    }
    return isAuthorizedDelegate(signer, issuer);
}

OcspCertStatus mapCertStatus(int status) {
    switch (status) {
        case V_OCSP_CERTSTATUS_GOOD:    return OcspCertStatus::GOOD;
        case V_OCSP_CERTSTATUS_REVOKED: return OcspCertStatus::REVOKED;
        case V_OCSP_CERTSTATUS_UNKNOWN: return OcspCertStatus::UNKNOWN;
        default:                        return OcspCertStatus::MALFORMED;
    }
}

} // anonymous namespace

std::optional<Der> buildOcspRequest(X509* subject, X509* issuer, std::string* error) {
    auto fail = [error](const std::string& msg) -> std::optional<Der> {
        if (error) *error = msg;
        return std::nullopt;
    };

    if (!subject || !issuer) return fail("subject and issuer certificates are required");

    UniqueRequest request(OCSP_REQUEST_new());
    if (!request) return fail("OCSP_REQUEST_new failed");

    OCSP_CERTID* id = OCSP_cert_to_id(EVP_sha1(), subject, issuer);
    if (!id) return fail("OCSP_cert_to_id failed: " + lastOpenSslError());

    // add0: request takes ownership of id on success
    if (!OCSP_request_add0_id(request.get(), id)) {
        OCSP_CERTID_free(id);
        return fail("OCSP_request_add0_id failed: " + lastOpenSslError());
    }

    int len = i2d_OCSP_REQUEST(request.get(), nullptr);
    if (len <= 0) return fail("i2d_OCSP_REQUEST failed: " + lastOpenSslError());

    Der der(static_cast<size_t>(len));
    unsigned char* p = der.data();
    i2d_OCSP_REQUEST(request.get(), &p);
    return der;
}

OcspResponseInfo parseOcspResponse(const Der& body, X509* subject, X509* issuer) {
    OcspResponseInfo info;

    if (!subject || !issuer) {
        info.failure = ProbeFailure::CHAIN_UNUSABLE;
        info.message = "subject and issuer certificates are required";
        return info;
    }

    // --- 1. DER decode ---
    const unsigned char* p = body.data();
    UniqueResponse response(body.empty()
        ? nullptr
        : d2i_OCSP_RESPONSE(nullptr, &p, static_cast<long>(body.size())));
    if (!response) {
        ERR_clear_error();
        info.failure = ProbeFailure::MALFORMED_RESPONSE;
        info.certStatus = OcspCertStatus::MALFORMED;
        info.message = body.empty() ? "empty response body" : "body is not a DER OCSPResponse";
        return info;
    }

    // --- 2. Response status ---
    info.responseStatus = OCSP_response_status(response.get());
    if (info.responseStatus != OCSP_RESPONSE_STATUS_SUCCESSFUL) {
        info.failure = ProbeFailure::RESPONSE_NOT_SUCCESSFUL;
        info.message = std::string("responseStatus ") + OCSP_response_status_str(info.responseStatus);
        return info;
    }

    UniqueBasic basic(OCSP_response_get1_basic(response.get()));
    if (!basic) {
        ERR_clear_error();
        info.failure = ProbeFailure::MALFORMED_RESPONSE;
        info.certStatus = OcspCertStatus::MALFORMED;
        info.message = "responseBytes is not a BasicOCSPResponse";
        return info;
    }

    // --- 3. Signature ---
    std::string verifyError;
    info.signatureVerified = verifyAgainstIssuer(basic.get(), issuer, verifyError);
    info.responderMatchesIssuer = responderIdentityMatches(basic.get(), issuer);
    if (!info.signatureVerified) {
        info.failure = ProbeFailure::SIGNATURE_INVALID;
        info.message = "signature does not verify against issuer: " + verifyError;
    }

    // --- 4. SingleResponse for our CertID ---
    UniqueCertId certId(OCSP_cert_to_id(EVP_sha1(), subject, issuer));
    if (!certId) {
        ERR_clear_error();
        if (info.failure == ProbeFailure::NONE) {
            info.failure = ProbeFailure::CHAIN_UNUSABLE;
            info.message = "cannot build CertID from chain";
        }
        return info;
    }

    int status = -1;
    int reason = -1;
    ASN1_GENERALIZEDTIME* revokedAt = nullptr;
    ASN1_GENERALIZEDTIME* thisUpdate = nullptr;
    ASN1_GENERALIZEDTIME* nextUpdate = nullptr;
    if (OCSP_resp_find_status(basic.get(), certId.get(), &status, &reason,
                              &revokedAt, &thisUpdate, &nextUpdate) != 1) {
        ERR_clear_error();
        if (info.failure == ProbeFailure::NONE) {
            info.failure = ProbeFailure::CERT_ID_NOT_FOUND;
            info.message = "no SingleResponse for the requested CertID";
        }
        return info;
    }

    info.certStatus = mapCertStatus(status);
    info.thisUpdate = asn1TimeToTimePoint(thisUpdate);
    if (nextUpdate) {
        info.nextUpdate = asn1TimeToTimePoint(nextUpdate);
    }
    if (info.certStatus == OcspCertStatus::REVOKED) {
        info.revocationReason = reason >= 0 ? OCSP_crl_reason_str(reason) : "unspecified";
    }
    if (info.certStatus == OcspCertStatus::MALFORMED && info.failure == ProbeFailure::NONE) {
        info.failure = ProbeFailure::MALFORMED_RESPONSE;
        info.message = "unrecognized certStatus";
    }
    return info;
}

} // namespace ocspdash::health
