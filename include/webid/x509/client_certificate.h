/**
 * @file client_certificate.h
 * @brief Client certificate record consumed by the WebID verifier
 *
 * Mirrors the fields a TLS server exposes for a peer certificate: the
 * printed Subject Alternative Name and the RSA public key as hex.
 */

#pragma once

#include <string>
#include <optional>
#include <openssl/x509.h>

namespace webid {
namespace x509 {

/**
 * @brief Outcome of the required-field check
 */
enum class KeyFieldStatus {
    OK,
    MISSING_MODULUS,
    MISSING_EXPONENT
};

/**
 * @brief Decoded client certificate
 *
 * Only subjectAltName, modulus and exponent take part in verification.
 * The remaining fields are informational.
 */
struct ClientCertificate {
    std::string subjectAltName;   ///< e.g. "URI:https://alice.example/profile#me, DNS:alice.example"
    std::string modulus;          ///< RSA modulus, hex, any case
    std::string exponent;         ///< RSA public exponent, hex ("010001" or "0x10001")

    std::string subjectCommonName;
    std::string issuerCommonName;
    std::string serialNumber;     ///< hex
    std::string validFrom;        ///< ISO 8601 (UTC)
    std::string validTo;          ///< ISO 8601 (UTC)
    std::string fingerprint;      ///< SHA-256, lowercase hex

    /**
     * @brief Check that the key material needed for matching is present
     * @return First missing field (modulus is checked before exponent)
     */
    KeyFieldStatus checkKeyFields() const {
        if (modulus.empty()) return KeyFieldStatus::MISSING_MODULUS;
        if (exponent.empty()) return KeyFieldStatus::MISSING_EXPONENT;
        return KeyFieldStatus::OK;
    }
};

/**
 * @brief Build a ClientCertificate from an OpenSSL certificate
 *
 * The SAN text is rendered with OpenSSL's extension printer, so entries
 * appear as "URI:...", "DNS:...", "email:..." joined by ", ".
 * Non-RSA keys leave modulus and exponent empty.
 *
 * @param cert X509 certificate (non-owning)
 * @return Record, or std::nullopt for a null certificate
 */
std::optional<ClientCertificate> readClientCertificate(X509* cert);

/**
 * @brief Render the Subject Alternative Name extension as text
 * @param cert X509 certificate (non-owning)
 * @return Printed SAN, or empty string when the extension is absent
 */
std::string getSubjectAltNameText(X509* cert);

} // namespace x509
} // namespace webid
