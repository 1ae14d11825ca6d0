/**
 * @file cert_ops.h
 * @brief Pure X.509 certificate operations used by discovery and probing
 *
 * All functions are side-effect free. They operate on OpenSSL X509 structures
 * passed as arguments (non-owning) or on DER byte vectors.
 *
 * RFC 5280 Section 4.2 (extensions) and 4.2.2.1 (Authority Information Access).
 */

#pragma once

#include "ocspdash/health/models.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <openssl/asn1.h>
#include <openssl/x509.h>

namespace ocspdash::health {

/// RAII wrapper for X509
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

/// @name Encoding
/// @{

/**
 * @brief Parse a certificate from DER, falling back to PEM
 * @return Owned certificate, or nullptr if the bytes are not a certificate
 */
X509Ptr parseCertificate(const Der& bytes);

/// @brief Serialize a certificate to DER (empty on failure)
Der certificateToDer(X509* cert);

/// @brief Lowercase hex encoding
std::string toHex(const unsigned char* data, size_t len);

/// @brief SHA-256 over a byte vector, lowercase hex
std::string sha256Hex(const Der& data);

/// @brief Standard base64 without line breaks
std::string base64Encode(const Der& data);

/// @brief Decode standard base64; std::nullopt on invalid input
std::optional<Der> base64Decode(const std::string& encoded);

/// @}

/// @name Identity
/// @{

/// @brief SHA-256 fingerprint of the DER certificate, lowercase hex
std::string getCertificateFingerprint(X509* cert);

/**
 * @brief Key identifier of the certificate's public key
 *
 * SubjectKeyIdentifier when present, otherwise the SHA-1 of the
 * subjectPublicKey BIT STRING (RFC 5280 4.2.1.2 method 1).
 */
std::string getKeyIdentifier(X509* cert);

/// @brief AuthorityKeyIdentifier keyIdentifier as hex, empty if absent
std::string getAuthorityKeyIdentifier(X509* cert);

/// @brief Subject DN in OpenSSL one-line form
std::string getSubjectDn(X509* cert);

/// @brief Subject organization (O=), falling back to the common name
std::string getSubjectOrganization(X509* cert);

/// @}

/// @name Structure checks
/// @{

/// @brief BasicConstraints CA:TRUE
bool isCaCertificate(X509* cert);

/// @brief Subject equals issuer and the certificate verifies under its own key
bool isSelfSigned(X509* cert);

/**
 * @brief Check that issuer's subject matches cert's issuer name and that
 *        issuer's key verifies cert's signature
 */
bool isIssuedBy(X509* cert, X509* issuer);

/// @}

/// @name Authority Information Access
/// @{

/// @brief id-ad-ocsp URIs, in extension order
std::vector<std::string> getOcspUrls(X509* cert);

/// @brief id-ad-caIssuers URIs, in extension order
std::vector<std::string> getCaIssuerUrls(X509* cert);

/// @}

/// @name Time
/// @{

/// @brief Convert ASN1_TIME (UTCTime or GeneralizedTime) to a UTC time point
std::optional<TimePoint> asn1TimeToTimePoint(const ASN1_TIME* t);

/// @brief Certificate notAfter as a time point (epoch on failure)
TimePoint getNotAfter(X509* cert);

/// @}

/// @name Chains
/// @{

/// @brief Content-derived chain id: SHA-256 over subject DER || issuer DER
std::string computeChainId(const Der& subject, const Der& issuer);

/**
 * @brief Build a Chain record from DER certificates
 * @return std::nullopt if either certificate does not parse
 */
std::optional<Chain> makeChain(const Der& subject, const Der& issuer);

/// @}

} // namespace ocspdash::health
