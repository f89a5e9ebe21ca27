/**
 * @file certificate_issuer.h
 * @brief Self-signed WebID certificate generation from an SPKAC request
 *
 * The subject key comes from the browser's SPKAC (keygen) request. The
 * certificate is signed with a fresh, unrelated RSA key that is discarded
 * afterwards, so nothing is persisted.
 */

#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include "webid/tls/types.h"
#include "webid/x509/certificate_parser.h"
#include "webid/x509/client_certificate.h"

namespace webid::tls {

/// Placeholder for name fields the caller leaves out
constexpr const char* kNamePlaceholder = ".";

/**
 * @brief Caller-supplied issuance parameters
 */
struct IssuanceOptions {
    std::string agent;                              ///< identity URI, goes into the SAN
    std::string spkac;                              ///< base64 SPKAC, "SPKAC=" prefix allowed
    std::optional<std::string> countryName;
    std::optional<std::string> localityName;
    std::optional<std::string> organizationName;
    std::optional<std::string> commonName;          ///< defaults to the agent's host name
};

/**
 * @brief Decoded SPKAC content
 */
struct SpkacInfo {
    std::string challenge;
    std::string publicKeyPem;
};

/**
 * @brief Strip an optional "SPKAC=" prefix and all whitespace
 */
std::string normalizeSpkac(const std::string& spkac);

/**
 * @brief Decode an SPKAC and check its self-signature
 * @return Challenge and PEM public key, or std::nullopt when invalid
 */
std::optional<SpkacInfo> parseSpkac(const std::string& spkac);

/**
 * @brief Outcome of certificate generation (move-only)
 */
struct IssuanceResult {
    VerifyError error = VerifyError::NONE;
    std::string message;
    x509::X509Ptr certificate;
    std::string pem;
    x509::ClientCertificate record;

    bool ok() const { return error == VerifyError::NONE; }

    static IssuanceResult failure(VerifyError code, const std::string& message = "") {
        IssuanceResult r;
        r.error = code;
        r.message = message.empty() ? defaultErrorMessage(code) : message;
        return r;
    }
};

/**
 * @brief Certificate generator
 */
class CertificateIssuer {
public:
    using Callback = std::function<void(const IssuanceResult&)>;

    /// RSA size of the throwaway signing key
    static constexpr int kSigningKeyBits = 2048;

    CertificateIssuer() = default;

    /**
     * @brief Generate a certificate
     *
     * The SPKAC is checked before any key pair is generated.
     */
    IssuanceResult generate(const IssuanceOptions& options) const;

    /**
     * @brief Generate and report through a callback that fires exactly once
     */
    void generate(const IssuanceOptions& options, const Callback& callback) const;

    /// Number of signing key pairs generated by this instance
    size_t signingKeysGenerated() const { return keysGenerated_.load(); }

private:
    mutable std::atomic<size_t> keysGenerated_{0};

    x509::PKeyPtr generateSigningKey() const;
};

} // namespace webid::tls
