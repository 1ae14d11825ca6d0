/**
 * @file ocsp_codec.h
 * @brief OCSP request encoding and response decoding/verification
 *
 * RFC 6960 Section 4.1 (request) and 4.2 (response).
 * The CertID uses SHA-1 for both name and key hashes, the form every
 * public responder answers.
 */

#pragma once

#include "ocspdash/health/models.h"
#include "ocspdash/health/types.h"

#include <optional>
#include <string>
#include <openssl/x509.h>

namespace ocspdash::health {

/**
 * @brief Build a DER OCSPRequest for subject as issued by issuer
 * @param subject Certificate being asked about (non-owning)
 * @param issuer Issuer of subject (non-owning)
 * @param error Optional out-parameter for a diagnostic
 * @return DER bytes, or std::nullopt if the CertID cannot be built
 */
std::optional<Der> buildOcspRequest(X509* subject, X509* issuer, std::string* error = nullptr);

/// @brief Decoded and verified OCSP response
struct OcspResponseInfo {
    ProbeFailure failure = ProbeFailure::NONE;      ///< Protocol-layer failure, if any
    int responseStatus = -1;                        ///< OCSPResponseStatus, -1 if undecodable
    OcspCertStatus certStatus = OcspCertStatus::NOT_PRESENT;
    bool signatureVerified = false;
    bool responderMatchesIssuer = false;
    std::optional<TimePoint> thisUpdate;
    std::optional<TimePoint> nextUpdate;
    std::string revocationReason;
    std::string message;
};

/**
 * @brief Parse a DER OCSPResponse and verify it against the chain issuer
 *
 * Verification order:
 *   1. DER decode (failure: MALFORMED_RESPONSE, certStatus MALFORMED)
 *   2. responseStatus == successful (failure: RESPONSE_NOT_SUCCESSFUL)
 *   3. BasicOCSPResponse signature chains to issuer (failure: SIGNATURE_INVALID)
 *   4. SingleResponse for the SHA-1 CertID of subject (failure: CERT_ID_NOT_FOUND)
 *
 * The certificate status is extracted even when the signature fails so the
 * diagnostic is complete; the failure field still carries SIGNATURE_INVALID.
 *
 * responderMatchesIssuer is true when the ResponderID names the issuer (by
 * name or key hash), or when the signer was issued by the issuer and carries
 * the id-kp-OCSPSigning extended key usage.
 */
OcspResponseInfo parseOcspResponse(const Der& body, X509* subject, X509* issuer);

} // namespace ocspdash::health
