/**
 * @file certificate_parser.h
 * @brief Certificate loading and serialization
 *
 * Handles PEM and DER encoded certificates and provides RAII owners for
 * the OpenSSL structures used across the library.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>
#include <openssl/x509.h>
#include <openssl/evp.h>

namespace webid {
namespace x509 {

/// RAII owner for X509
struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using X509Ptr = std::unique_ptr<X509, X509Deleter>;

/// RAII owner for EVP_PKEY
struct PKeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

/**
 * @brief Certificate encoding
 */
enum class CertificateFormat {
    UNKNOWN,        ///< Not recognized
    PEM,            ///< Base64-encoded with BEGIN/END markers
    DER             ///< Binary DER encoding
};

/**
 * @brief Detect certificate encoding from leading bytes
 *
 * @param data Certificate data (raw bytes)
 * @return PEM if a BEGIN CERTIFICATE marker is present (leading whitespace
 *         allowed), DER if the data starts with a SEQUENCE tag, else UNKNOWN
 */
CertificateFormat detectCertificateFormat(const std::vector<uint8_t>& data);

/**
 * @brief Parse certificate from binary data
 *
 * Detects the format and dispatches to the PEM or DER reader.
 *
 * @param data Certificate data
 * @return Owned certificate, or nullptr on error
 */
X509Ptr parseCertificate(const std::vector<uint8_t>& data);

/**
 * @brief Parse certificate from PEM string
 *
 * @param pem PEM-encoded certificate
 * @return Owned certificate, or nullptr on error
 */
X509Ptr parseCertificateFromPem(const std::string& pem);

/**
 * @brief Parse certificate from DER data
 *
 * @param der DER-encoded certificate
 * @return Owned certificate, or nullptr on error (including trailing garbage)
 */
X509Ptr parseCertificateFromDer(const std::vector<uint8_t>& der);

/**
 * @brief Serialize certificate to PEM format
 *
 * @param cert X509 certificate (non-owning)
 * @return PEM string, or std::nullopt on error
 */
std::optional<std::string> certificateToPem(X509* cert);

/**
 * @brief Compute SHA-256 fingerprint of certificate
 *
 * @param cert X509 certificate (non-owning)
 * @return Hex-encoded SHA-256 fingerprint (64 chars lowercase),
 *         or std::nullopt on error
 */
std::optional<std::string> computeFingerprint(X509* cert);

} // namespace x509
} // namespace webid
