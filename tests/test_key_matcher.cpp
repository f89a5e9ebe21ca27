/**
 * @file test_key_matcher.cpp
 * @brief Unit tests for exponent normalization and profile key matching
 */

#include <gtest/gtest.h>
#include <cctype>
#include "webid/rdf/graph_builder.h"
#include "webid/tls/key_matcher.h"
#include "test_helpers.h"

using namespace webid;
using namespace webid::tls;
using namespace test_helpers;

namespace {
    const std::string kModulus = "C2D4E6F80A1B2C3D4E5F60718293A4B5C6D7E8F9";
}

class KeyMatcherTest : public ::testing::Test {
protected:
    rdf::RdfGraphBuilder builder_;

    rdf::Graph graphOf(const std::string& body, const std::string& mimeType = "text/turtle") {
        auto parsed = builder_.parse(body, kAliceDocument, mimeType);
        EXPECT_TRUE(parsed.ok()) << parsed.error;
        return parsed.graph.value_or(rdf::Graph());
    }
};

// ============================================================================
// normalizeExponent / modulusMatches
// ============================================================================

TEST(NormalizeExponentTest, HexToDecimal) {
    EXPECT_EQ(normalizeExponent("010001").value(), "65537");
    EXPECT_EQ(normalizeExponent("10001").value(), "65537");
    EXPECT_EQ(normalizeExponent("0x10001").value(), "65537");
    EXPECT_EQ(normalizeExponent("0X010001").value(), "65537");
    EXPECT_EQ(normalizeExponent("3").value(), "3");
    EXPECT_EQ(normalizeExponent("ff").value(), "255");
}

TEST(NormalizeExponentTest, ArbitraryPrecision) {
    EXPECT_EQ(normalizeExponent("10000000000000000").value(), "18446744073709551616");
}

TEST(NormalizeExponentTest, InvalidInput) {
    EXPECT_FALSE(normalizeExponent("").has_value());
    EXPECT_FALSE(normalizeExponent("0x").has_value());
    EXPECT_FALSE(normalizeExponent("65537z").has_value());
    EXPECT_FALSE(normalizeExponent("-1").has_value());
}

TEST(ModulusMatchesTest, CaseInsensitiveWithoutCanonicalization) {
    EXPECT_TRUE(modulusMatches("AB12CD", "ab12cd"));
    EXPECT_TRUE(modulusMatches("ab12cd", "AB12CD"));
    EXPECT_FALSE(modulusMatches("00AB12CD", "AB12CD"));
    EXPECT_FALSE(modulusMatches("AB12CD", "AB12CE"));
}

// ============================================================================
// findMatchingKey
// ============================================================================

TEST_F(KeyMatcherTest, MatchesHexExponentAgainstDecimalProfile) {
    auto graph = graphOf(turtleProfile(kAliceWebId, {{kModulus, "65537"}}));

    for (const char* exponent : {"010001", "10001", "0x10001"}) {
        MatchResult result = findMatchingKey(graph, kModulus, exponent);
        EXPECT_TRUE(result.found) << exponent;
        EXPECT_EQ(result.assertion.webid, kAliceWebId);
        EXPECT_EQ(result.assertion.exponent, "65537");
    }
}

TEST_F(KeyMatcherTest, ModulusCaseIgnored) {
    auto graph = graphOf(turtleProfile(kAliceWebId, {{kModulus, "65537"}}));
    std::string lower = kModulus;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    EXPECT_TRUE(findMatchingKey(graph, lower, "010001").found);
}

TEST_F(KeyMatcherTest, LeadingZeroPaddingDoesNotMatch) {
    auto graph = graphOf(turtleProfile(kAliceWebId, {{"00" + kModulus, "65537"}}));
    MatchResult result = findMatchingKey(graph, kModulus, "010001");
    EXPECT_FALSE(result.found);
    EXPECT_EQ(result.error, VerifyError::KEY_NOT_FOUND);
}

TEST_F(KeyMatcherTest, ExponentPaddingInProfileDoesNotMatch) {
    auto graph = graphOf(turtleProfile(kAliceWebId, {{kModulus, "065537"}}));
    EXPECT_FALSE(findMatchingKey(graph, kModulus, "010001").found);
}

TEST_F(KeyMatcherTest, NoMatchGivesKeyNotFound) {
    auto graph = graphOf(turtleProfile(kAliceWebId, {{"ABCDEF", "65537"}}));
    MatchResult result = findMatchingKey(graph, kModulus, "010001");
    EXPECT_FALSE(result.found);
    EXPECT_EQ(result.error, VerifyError::KEY_NOT_FOUND);
    EXPECT_EQ(result.message, "Certificate public key not found in the user's profile");
}

TEST_F(KeyMatcherTest, MatchAfterSeveralNonMatchingKeys) {
    auto graph = graphOf(turtleProfile(kAliceWebId, {
        {"AAAA", "65537"},
        {"BBBB", "65537"},
        {kModulus, "3"},
        {kModulus, "65537"},
    }));

    EXPECT_EQ(listKeyAssertions(graph).size(), 4u);
    EXPECT_TRUE(findMatchingKey(graph, kModulus, "010001").found);
}

TEST_F(KeyMatcherTest, EmptyProfile) {
    rdf::Graph empty;
    EXPECT_EQ(findMatchingKey(empty, kModulus, "010001").error, VerifyError::KEY_NOT_FOUND);
    EXPECT_TRUE(listKeyAssertions(empty).empty());
}

TEST_F(KeyMatcherTest, InvalidCertificateExponentNeverMatches) {
    auto graph = graphOf(turtleProfile(kAliceWebId, {{kModulus, "65537"}}));
    EXPECT_FALSE(findMatchingKey(graph, kModulus, "xyz").found);
}

TEST_F(KeyMatcherTest, DatatypesAndLanguageTagsIgnored) {
    auto graph = graphOf(
        "@prefix cert: <http://www.w3.org/ns/auth/cert#> .\n"
        "@prefix xsd: <http://www.w3.org/2001/XMLSchema#> .\n"
        "<#me> cert:key [ cert:modulus \"" + kModulus + "\"@en ;\n"
        "                 cert:exponent \"65537\"^^xsd:int ] .\n");
    EXPECT_TRUE(findMatchingKey(graph, kModulus, "010001").found);
}

TEST_F(KeyMatcherTest, NonLiteralBindingsSkipped) {
    auto graph = graphOf(
        "@prefix cert: <http://www.w3.org/ns/auth/cert#> .\n"
        "<#me> cert:key <#k1>, <#k2> .\n"
        "<#k1> cert:modulus <#notALiteral> ; cert:exponent 65537 .\n"
        "<#k2> cert:modulus \"" + kModulus + "\" ; cert:exponent 65537 .\n");

    MatchResult result = findMatchingKey(graph, kModulus, "10001");
    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.assertion.modulus, kModulus);
}

TEST_F(KeyMatcherTest, JsonLdProfile) {
    auto graph = graphOf(jsonLdProfile(kAliceWebId, kModulus, "65537"), "application/ld+json");
    EXPECT_TRUE(findMatchingKey(graph, kModulus, "010001").found);
}
