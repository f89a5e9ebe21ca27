/**
 * @file key_matcher.h
 * @brief Matching a certificate's RSA key against profile key assertions
 *
 * Profile keys are found with the query
 *   ?webid cert:key ?key . ?key cert:modulus ?m . ?key cert:exponent ?e .
 * over http://www.w3.org/ns/auth/cert#.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "webid/rdf/graph.h"
#include "webid/tls/types.h"

namespace webid::tls {

/// cert ontology namespace
constexpr const char* kCertNamespace = "http://www.w3.org/ns/auth/cert#";

/**
 * @brief Convert a hex exponent to its decimal string
 *
 * Accepts an optional "0x"/"0X" prefix and any case.
 *
 * @return Decimal string, or std::nullopt for empty or non-hex input
 *
 * @example
 * normalizeExponent("010001");   // "65537"
 * normalizeExponent("0x10001");  // "65537"
 */
std::optional<std::string> normalizeExponent(const std::string& hexExponent);

/**
 * @brief Case-insensitive modulus comparison (no leading-zero stripping)
 */
bool modulusMatches(const std::string& profileModulus, const std::string& certModulus);

/**
 * @brief Outcome of findMatchingKey
 */
struct MatchResult {
    bool found = false;
    KeyAssertion assertion;        ///< matching key (found only)
    VerifyError error = VerifyError::NONE;
    std::string message;
};

/**
 * @brief Look for the certificate's key among the profile's keys
 *
 * Evaluation stops at the first solution whose modulus equals certModulus
 * ignoring case and whose exponent lexical form equals the decimal value
 * of certExponent. Solutions binding a non-literal modulus or exponent
 * are skipped.
 *
 * @param graph Profile graph
 * @param certModulus Certificate modulus, hex
 * @param certExponent Certificate exponent, hex
 * @return found, or KEY_NOT_FOUND
 */
MatchResult findMatchingKey(const rdf::Graph& graph,
                            const std::string& certModulus,
                            const std::string& certExponent);

/**
 * @brief Every key assertion of a profile, in evaluation order
 */
std::vector<KeyAssertion> listKeyAssertions(const rdf::Graph& graph);

} // namespace webid::tls
