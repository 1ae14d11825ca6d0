/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exceptions thrown across component boundaries of the monitor. Probing
 * itself never throws; these cover configuration, the certificate source
 * and the vantage point transports.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ocspdash::common {

/**
 * @brief Base exception for all OCSP dashboard exceptions
 */
class OcspDashException : public std::runtime_error {
public:
    explicit OcspDashException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public OcspDashException {
public:
    explicit ConfigException(const std::string& message)
        : OcspDashException("Configuration error: " + message) {}
};

/**
 * @brief Certificate-intelligence API call failed
 *
 * rateLimited() distinguishes quota exhaustion (HTTP 429) from transient
 * network or server errors.
 */
class CertificateSourceException : public OcspDashException {
public:
    explicit CertificateSourceException(const std::string& message, bool rateLimited = false)
        : OcspDashException("Certificate source error: " + message), rateLimited_(rateLimited) {}

    bool rateLimited() const { return rateLimited_; }

private:
    bool rateLimited_;
};

/**
 * @brief Parsing error (API payloads, location files, agent replies)
 */
class ParsingException : public OcspDashException {
public:
    explicit ParsingException(const std::string& message)
        : OcspDashException("Parsing error: " + message) {}
};

} // namespace ocspdash::common
