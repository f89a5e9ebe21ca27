/**
 * @file verifier.h
 * @brief WebID-TLS verification
 *
 * Proves that the holder of a client certificate controls the identity
 * URI in its Subject Alternative Name: the profile at that URI must
 * publish the certificate's RSA key.
 */

#pragma once

#include <functional>
#include <future>
#include <string>
#include "webid/rdf/graph_builder.h"
#include "webid/tls/profile_resolver.h"
#include "webid/tls/types.h"
#include "webid/x509/client_certificate.h"

namespace webid::tls {

/**
 * @brief Verification orchestrator
 *
 * Holds non-owning pointers to its collaborators. Keeps no state between
 * calls, so one instance may serve concurrent callers as long as the
 * collaborators allow it.
 */
class WebIdVerifier {
public:
    using Callback = std::function<void(const VerificationResult&)>;

    /**
     * @param resolver Profile resolver (non-owning, must outlive this object)
     * @param builder Graph builder (non-owning, must outlive this object)
     * @throws std::invalid_argument if either pointer is null
     */
    WebIdVerifier(IProfileResolver* resolver, const rdf::IGraphBuilder* builder);

    /**
     * @brief Verify a certificate
     *
     * Only the first SAN URI is attempted. On success the result carries
     * that URI.
     *
     * @param certificate Client certificate, nullptr gives NO_CERTIFICATE
     */
    VerificationResult verify(const x509::ClientCertificate* certificate) const;

    /**
     * @brief Verify and report through a callback that fires exactly once
     */
    void verify(const x509::ClientCertificate* certificate, const Callback& callback) const;

    /**
     * @brief Verify on a std::async task
     *
     * The certificate is copied, the caller's object need not outlive the call.
     * The task does not refer to this verifier, which may be destroyed before
     * the future is ready. The resolver and graph builder must outlive the
     * future.
     */
    std::future<VerificationResult> verifyAsync(const x509::ClientCertificate* certificate) const;

    /**
     * @brief Verify against an already fetched profile
     *
     * Runs the key field check, parsing (relative IRIs against uri) and key
     * matching.
     */
    VerificationResult verifyKey(const x509::ClientCertificate& certificate,
                                 const std::string& uri,
                                 const std::string& profileBody,
                                 const std::string& mimeType) const;

private:
    IProfileResolver* resolver_;
    const rdf::IGraphBuilder* builder_;
};

} // namespace webid::tls
