/**
 * @file verifier.cpp
 * @brief WebID-TLS verification sequence
 */

#include "webid/tls/verifier.h"
#include "webid/tls/key_matcher.h"
#include "webid/x509/san_extractor.h"
#include <spdlog/spdlog.h>
#include <optional>
#include <stdexcept>

namespace webid::tls {

namespace {
    /// Key field check; an exponent that is not hex counts as missing
    std::optional<VerificationResult> checkKeyFields(const x509::ClientCertificate& certificate) {
        switch (certificate.checkKeyFields()) {
            case x509::KeyFieldStatus::MISSING_MODULUS:
                return VerificationResult::failure(VerifyError::MISSING_MODULUS);
            case x509::KeyFieldStatus::MISSING_EXPONENT:
                return VerificationResult::failure(VerifyError::MISSING_EXPONENT);
            case x509::KeyFieldStatus::OK:
                break;
        }
        if (!normalizeExponent(certificate.exponent)) {
            return VerificationResult::failure(VerifyError::MISSING_EXPONENT,
                                               "Invalid exponent value in client certificate");
        }
        return std::nullopt;
    }
}

WebIdVerifier::WebIdVerifier(IProfileResolver* resolver, const rdf::IGraphBuilder* builder)
    : resolver_(resolver), builder_(builder) {
    if (!resolver_) {
        throw std::invalid_argument("WebIdVerifier: resolver must not be null");
    }
    if (!builder_) {
        throw std::invalid_argument("WebIdVerifier: builder must not be null");
    }
}

VerificationResult WebIdVerifier::verify(const x509::ClientCertificate* certificate) const {
    if (!certificate) {
        return VerificationResult::failure(VerifyError::NO_CERTIFICATE);
    }

    std::vector<std::string> uris = x509::extractUris(certificate);
    if (uris.empty()) {
        spdlog::debug("[WebIdVerifier] No URI in SAN '{}'", certificate->subjectAltName);
        return VerificationResult::failure(VerifyError::EMPTY_SAN);
    }

    const std::string& uri = uris.front();
    if (uris.size() > 1) {
        spdlog::debug("[WebIdVerifier] {} SAN URIs, trying only {}", uris.size(), uri);
    }

    FetchResult fetched;
    try {
        fetched = resolver_->fetch(uri);
    } catch (const std::exception& e) {
        fetched = FetchResult::failure(e.what());
    }
    if (!fetched.ok) {
        spdlog::debug("[WebIdVerifier] Fetch failed for {}: {}", uri, fetched.error);
        return VerificationResult::failure(VerifyError::FETCH_FAILURE, fetched.error);
    }

    return verifyKey(*certificate, uri, fetched.body, fetched.mimeType);
}

void WebIdVerifier::verify(const x509::ClientCertificate* certificate, const Callback& callback) const {
    VerificationResult result = verify(certificate);
    if (callback) {
        callback(result);
    }
}

std::future<VerificationResult> WebIdVerifier::verifyAsync(const x509::ClientCertificate* certificate) const {
    std::optional<x509::ClientCertificate> copy;
    if (certificate) {
        copy = *certificate;
    }
    // No reference to this object: the future may outlive it
    IProfileResolver* resolver = resolver_;
    const rdf::IGraphBuilder* builder = builder_;
    return std::async(std::launch::async, [resolver, builder, copy]() {
        WebIdVerifier verifier(resolver, builder);
        return verifier.verify(copy ? &*copy : nullptr);
    });
}

VerificationResult WebIdVerifier::verifyKey(const x509::ClientCertificate& certificate,
                                            const std::string& uri,
                                            const std::string& profileBody,
                                            const std::string& mimeType) const {
    if (auto failed = checkKeyFields(certificate)) {
        return *failed;
    }

    rdf::GraphParseResult parsed;
    try {
        parsed = builder_->parse(profileBody, uri, mimeType);
    } catch (const std::exception& e) {
        parsed = rdf::GraphParseResult::failure(e.what());
    }
    if (!parsed.ok()) {
        spdlog::debug("[WebIdVerifier] Profile {} not parsed: {}", uri, parsed.error);
        return VerificationResult::failure(VerifyError::PARSE_FAILURE, parsed.error);
    }

    MatchResult match = findMatchingKey(*parsed.graph, certificate.modulus, certificate.exponent);
    if (!match.found) {
        return VerificationResult::failure(match.error, match.message);
    }

    spdlog::debug("[WebIdVerifier] Verified {}", uri);
    return VerificationResult::success(uri);
}

} // namespace webid::tls
