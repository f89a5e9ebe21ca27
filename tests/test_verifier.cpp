/**
 * @file test_verifier.cpp
 * @brief Unit tests for WebIdVerifier
 *
 * Profiles are served by FakeResolver; parsing goes through the real
 * RdfGraphBuilder.
 */

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include "test_helpers.h"
#include "webid/rdf/graph_builder.h"
#include "webid/tls/verifier.h"
#include "webid/utils/string_utils.h"
#include "webid/x509/client_certificate.h"

using namespace webid;
using namespace webid::tls;
using namespace test_helpers;

namespace {
    const std::string kModulus =
        "C1E2A3B4C5D6E7F8091A2B3C4D5E6F708192A3B4C5D6E7F8091A2B3C4D5E6F7";
}

class VerifierTest : public ::testing::Test {
protected:
    FakeResolver resolver;
    rdf::RdfGraphBuilder builder;

    x509::ClientCertificate certificate(const std::string& san = std::string("URI:") + kAliceWebId) {
        x509::ClientCertificate cert;
        cert.subjectAltName = san;
        cert.modulus = kModulus;
        cert.exponent = "010001";
        return cert;
    }

    VerificationResult run(const x509::ClientCertificate& cert) {
        WebIdVerifier verifier(&resolver, &builder);
        return verifier.verify(&cert);
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(VerifierTest, NullCollaboratorsRejected) {
    EXPECT_THROW(WebIdVerifier(nullptr, &builder), std::invalid_argument);
    EXPECT_THROW(WebIdVerifier(&resolver, nullptr), std::invalid_argument);
}

// ============================================================================
// Success
// ============================================================================

TEST_F(VerifierTest, MatchingTurtleProfile) {
    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{kModulus, "65537"}}));

    VerificationResult result = run(certificate());
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.webid, kAliceWebId);
    EXPECT_TRUE(result.message.empty());
    ASSERT_EQ(resolver.requests.size(), 1u);
    EXPECT_EQ(resolver.requests[0], kAliceWebId);
}

TEST_F(VerifierTest, LastOfSeveralKeysMatches) {
    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {
        {"AA01", "65537"},
        {"BB02", "65537"},
        {kModulus, "3"},
        {kModulus, "65537"},
    }));

    EXPECT_TRUE(run(certificate()).ok());
}

TEST_F(VerifierTest, SameOutcomeAcrossSyntaxes) {
    const std::string lower = utils::toLower(kModulus);

    resolver.serve(kAliceWebId, ntriplesProfile(kAliceWebId, lower, "65537"), "application/n-triples");
    VerificationResult nt = run(certificate());

    resolver.serve(kAliceWebId, jsonLdProfile(kAliceWebId, lower, "65537"), "application/ld+json");
    VerificationResult jsonld = run(certificate());

    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{lower, "65537"}}),
                   "text/turtle; charset=utf-8");
    VerificationResult turtle = run(certificate());

    EXPECT_TRUE(nt.ok()) << nt.message;
    EXPECT_TRUE(jsonld.ok()) << jsonld.message;
    EXPECT_TRUE(turtle.ok()) << turtle.message;
}

TEST_F(VerifierTest, RelativeSubjectResolvedAgainstUri) {
    const std::string profile =
        "@prefix cert: <http://www.w3.org/ns/auth/cert#> .\n"
        "<#me> cert:key [ cert:modulus \"" + kModulus + "\" ; cert:exponent 65537 ] .\n";
    resolver.serve(kAliceWebId, profile);

    EXPECT_TRUE(run(certificate()).ok());
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(VerifierTest, NoCertificate) {
    WebIdVerifier verifier(&resolver, &builder);
    VerificationResult result = verifier.verify(nullptr);
    EXPECT_EQ(result.error, VerifyError::NO_CERTIFICATE);
    EXPECT_TRUE(resolver.requests.empty());
}

TEST_F(VerifierTest, EmptySanDoesNotFetch) {
    VerificationResult result = run(certificate("DNS:alice.example, email:alice@example.org"));
    EXPECT_EQ(result.error, VerifyError::EMPTY_SAN);
    EXPECT_EQ(result.message, "Empty Subject Alternative Name field in certificate");
    EXPECT_TRUE(resolver.requests.empty());
}

TEST_F(VerifierTest, OnlyFirstUriAttempted) {
    const std::string second = "https://bob.example/card#me";
    resolver.serve(second, turtleProfile(second, {{kModulus, "65537"}}));

    VerificationResult result = run(certificate(std::string("URI:") + kAliceWebId + ", URI:" + second));
    EXPECT_EQ(result.error, VerifyError::FETCH_FAILURE);
    ASSERT_EQ(resolver.requests.size(), 1u);
    EXPECT_EQ(resolver.requests[0], kAliceWebId);
}

TEST_F(VerifierTest, FetchFailureCarriesResolverMessage) {
    VerificationResult result = run(certificate());
    EXPECT_EQ(result.error, VerifyError::FETCH_FAILURE);
    EXPECT_EQ(result.message, std::string("HTTP 404 fetching ") + kAliceWebId);
}

TEST_F(VerifierTest, ThrowingResolverReportedAsFetchFailure) {
    class ThrowingResolver : public IProfileResolver {
    public:
        FetchResult fetch(const std::string&) override {
            throw std::runtime_error("connection reset");
        }
    } throwing;

    WebIdVerifier verifier(&throwing, &builder);
    x509::ClientCertificate cert = certificate();
    VerificationResult result = verifier.verify(&cert);
    EXPECT_EQ(result.error, VerifyError::FETCH_FAILURE);
    EXPECT_EQ(result.message, "connection reset");
}

TEST_F(VerifierTest, MissingModulus) {
    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{kModulus, "65537"}}));
    x509::ClientCertificate cert = certificate();
    cert.modulus.clear();
    cert.exponent.clear();

    VerificationResult result = run(cert);
    EXPECT_EQ(result.error, VerifyError::MISSING_MODULUS);
    EXPECT_EQ(result.message, "Missing modulus value in client certificate");
}

TEST_F(VerifierTest, MissingExponent) {
    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{kModulus, "65537"}}));
    x509::ClientCertificate cert = certificate();
    cert.exponent.clear();

    VerificationResult result = run(cert);
    EXPECT_EQ(result.error, VerifyError::MISSING_EXPONENT);
    EXPECT_EQ(result.message, "Missing exponent value in client certificate");
}

TEST_F(VerifierTest, InvalidExponent) {
    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{kModulus, "65537"}}));
    x509::ClientCertificate cert = certificate();
    cert.exponent = "not-hex";

    VerificationResult result = run(cert);
    EXPECT_EQ(result.error, VerifyError::MISSING_EXPONENT);
    EXPECT_EQ(result.message, "Invalid exponent value in client certificate");
}

TEST_F(VerifierTest, UnsupportedContentType) {
    resolver.serve(kAliceWebId, "<html></html>", "text/html; charset=utf-8");

    VerificationResult result = run(certificate());
    EXPECT_EQ(result.error, VerifyError::PARSE_FAILURE);
    EXPECT_EQ(result.message, "Unsupported content type: text/html");
}

TEST_F(VerifierTest, MalformedProfile) {
    resolver.serve(kAliceWebId, "<#me> <http://xmlns.com/foaf/0.1/name> \"unterminated .");

    VerificationResult result = run(certificate());
    EXPECT_EQ(result.error, VerifyError::PARSE_FAILURE);
    EXPECT_FALSE(result.message.empty());
}

TEST_F(VerifierTest, DeeplyNestedProfileIsParseFailure) {
    const size_t depth = 150000;
    std::string profile = "<#me> <http://ex/p> ";
    for (size_t i = 0; i < depth; ++i) {
        profile += "[ <http://ex/p> ";
    }
    profile += "1" + std::string(depth, ']') + " .";
    resolver.serve(kAliceWebId, profile);

    VerificationResult result = run(certificate());
    EXPECT_EQ(result.error, VerifyError::PARSE_FAILURE);
    EXPECT_NE(result.message.find("nesting too deep"), std::string::npos);
}

TEST_F(VerifierTest, KeyNotFound) {
    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{"AA01", "65537"}, {kModulus, "3"}}));

    VerificationResult result = run(certificate());
    EXPECT_EQ(result.error, VerifyError::KEY_NOT_FOUND);
    EXPECT_EQ(result.message, "Certificate public key not found in the user's profile");
    EXPECT_TRUE(result.webid.empty());
}

TEST_F(VerifierTest, ResultCarriesFetchedUriNotKeyOwner) {
    const std::string other = "https://bob.example/card#me";
    resolver.serve(kAliceWebId, turtleProfile(other, {{kModulus, "65537"}}));

    VerificationResult result = run(certificate());
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.webid, kAliceWebId);
}

// ============================================================================
// Callback and async delivery
// ============================================================================

TEST_F(VerifierTest, CallbackFiresOnce) {
    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{kModulus, "65537"}}));
    WebIdVerifier verifier(&resolver, &builder);
    x509::ClientCertificate cert = certificate();

    int calls = 0;
    VerificationResult delivered;
    verifier.verify(&cert, [&](const VerificationResult& result) {
        ++calls;
        delivered = result;
    });

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(delivered.ok());
}

TEST_F(VerifierTest, CallbackFiresOnceOnFailure) {
    WebIdVerifier verifier(&resolver, &builder);

    int calls = 0;
    verifier.verify(nullptr, [&](const VerificationResult& result) {
        ++calls;
        EXPECT_EQ(result.error, VerifyError::NO_CERTIFICATE);
    });
    EXPECT_EQ(calls, 1);
}

TEST_F(VerifierTest, AsyncCopiesCertificate) {
    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{kModulus, "65537"}}));
    WebIdVerifier verifier(&resolver, &builder);

    std::future<VerificationResult> pending;
    {
        x509::ClientCertificate cert = certificate();
        pending = verifier.verifyAsync(&cert);
    }

    VerificationResult result = pending.get();
    EXPECT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.webid, kAliceWebId);
}

TEST_F(VerifierTest, AsyncOutlivesVerifier) {
    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{kModulus, "65537"}}));
    x509::ClientCertificate cert = certificate();

    std::future<VerificationResult> pending;
    {
        auto verifier = std::make_unique<WebIdVerifier>(&resolver, &builder);
        pending = verifier->verifyAsync(&cert);
    }

    VerificationResult result = pending.get();
    EXPECT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.webid, kAliceWebId);
}

TEST_F(VerifierTest, AsyncNullCertificate) {
    WebIdVerifier verifier(&resolver, &builder);
    EXPECT_EQ(verifier.verifyAsync(nullptr).get().error, VerifyError::NO_CERTIFICATE);
}

// ============================================================================
// verifyKey
// ============================================================================

TEST_F(VerifierTest, VerifyKeyAgainstGivenBody) {
    WebIdVerifier verifier(&resolver, &builder);
    VerificationResult result = verifier.verifyKey(
        certificate(), kAliceWebId, turtleProfile(kAliceWebId, {{kModulus, "65537"}}), "text/turtle");

    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(resolver.requests.empty());
}

// ============================================================================
// JSON form
// ============================================================================

TEST(VerificationResultTest, JsonForm) {
    Json::Value ok = VerificationResult::success(kAliceWebId).toJson();
    EXPECT_TRUE(ok["verified"].asBool());
    EXPECT_EQ(ok["webid"].asString(), kAliceWebId);
    EXPECT_TRUE(ok["error"].isNull());

    Json::Value failed = VerificationResult::failure(VerifyError::EMPTY_SAN).toJson();
    EXPECT_FALSE(failed["verified"].asBool());
    EXPECT_TRUE(failed["webid"].isNull());
    EXPECT_EQ(failed["error"]["code"].asString(), "EMPTY_SAN");
    EXPECT_EQ(failed["error"]["message"].asString(),
              "Empty Subject Alternative Name field in certificate");
}

// ============================================================================
// End to end with a real certificate
// ============================================================================

TEST_F(VerifierTest, RealCertificate) {
    UniqueKey key = generateRsaKey();
    UniqueCert cert = createClientCert(key.get(), std::string("URI:") + kAliceWebId + ",DNS:alice.example");
    std::optional<x509::ClientCertificate> record = x509::readClientCertificate(cert.get());
    ASSERT_TRUE(record.has_value());

    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{modulusHex(key.get()), "65537"}}));
    WebIdVerifier verifier(&resolver, &builder);

    VerificationResult result = verifier.verify(&*record);
    EXPECT_TRUE(result.ok()) << result.message;

    UniqueKey otherKey = generateRsaKey();
    resolver.serve(kAliceWebId, turtleProfile(kAliceWebId, {{modulusHex(otherKey.get()), "65537"}}));
    EXPECT_EQ(verifier.verify(&*record).error, VerifyError::KEY_NOT_FOUND);
}
