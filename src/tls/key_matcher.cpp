/**
 * @file key_matcher.cpp
 * @brief Profile key lookup and comparison
 */

#include "webid/tls/key_matcher.h"
#include "webid/rdf/query_engine.h"
#include "webid/rdf/sparql_query.h"
#include "webid/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <cctype>

namespace webid::tls {

namespace {
    const rdf::SelectQuery& keyQuery() {
        static const rdf::SelectQuery query = rdf::SelectQuery::parse(
            std::string("PREFIX cert: <") + kCertNamespace + ">\n"
            "SELECT ?webid ?m ?e WHERE {\n"
            "  ?webid cert:key ?key .\n"
            "  ?key cert:modulus ?m .\n"
            "  ?key cert:exponent ?e .\n"
            "}");
        return query;
    }

    /// Literal lexical form bound to name, nullptr when unbound or not a literal
    const std::string* literalValue(const rdf::Solution& solution, const char* name) {
        auto it = solution.find(name);
        if (it == solution.end() || !it->second.isLiteral()) {
            return nullptr;
        }
        return &it->second.value;
    }

    KeyAssertion toAssertion(const rdf::Solution& solution) {
        KeyAssertion assertion;
        auto webid = solution.find("webid");
        if (webid != solution.end()) {
            assertion.webid = webid->second.value;
        }
        if (const std::string* m = literalValue(solution, "m")) {
            assertion.modulus = *m;
        }
        if (const std::string* e = literalValue(solution, "e")) {
            assertion.exponent = *e;
        }
        return assertion;
    }
}

std::optional<std::string> normalizeExponent(const std::string& hexExponent) {
    std::string hex = utils::trim(hexExponent);
    if (utils::startsWith(hex, "0x") || utils::startsWith(hex, "0X")) {
        hex = hex.substr(2);
    }
    if (hex.empty()) {
        return std::nullopt;
    }
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    BIGNUM* bn = nullptr;
    if (BN_hex2bn(&bn, hex.c_str()) == 0 || bn == nullptr) {
        BN_free(bn);
        return std::nullopt;
    }

    char* dec = BN_bn2dec(bn);
    BN_free(bn);
    if (dec == nullptr) {
        return std::nullopt;
    }
    std::string result(dec);
    OPENSSL_free(dec);
    return result;
}

bool modulusMatches(const std::string& profileModulus, const std::string& certModulus) {
    return utils::equalsIgnoreCase(profileModulus, certModulus);
}

MatchResult findMatchingKey(const rdf::Graph& graph,
                            const std::string& certModulus,
                            const std::string& certExponent) {
    MatchResult result;

    std::optional<std::string> exponent = normalizeExponent(certExponent);
    if (!exponent) {
        // Nothing can equal an unparseable exponent
        spdlog::debug("[KeyMatcher] Certificate exponent is not hex: '{}'", certExponent);
        result.error = VerifyError::KEY_NOT_FOUND;
        result.message = defaultErrorMessage(VerifyError::KEY_NOT_FOUND);
        return result;
    }

    size_t examined = 0;
    auto match = rdf::QueryEngine::findFirst(graph, keyQuery(),
        [&](const rdf::Solution& solution) {
            ++examined;
            const std::string* m = literalValue(solution, "m");
            const std::string* e = literalValue(solution, "e");
            if (m == nullptr || e == nullptr) {
                return false;
            }
            return modulusMatches(*m, certModulus) && *e == *exponent;
        });

    if (!match) {
        spdlog::debug("[KeyMatcher] No match among {} key assertion(s)", examined);
        result.error = VerifyError::KEY_NOT_FOUND;
        result.message = defaultErrorMessage(VerifyError::KEY_NOT_FOUND);
        return result;
    }

    result.found = true;
    result.assertion = toAssertion(*match);
    spdlog::debug("[KeyMatcher] Key matched for {} after {} assertion(s)",
                  result.assertion.webid, examined);
    return result;
}

std::vector<KeyAssertion> listKeyAssertions(const rdf::Graph& graph) {
    std::vector<KeyAssertion> assertions;
    for (const auto& solution : rdf::QueryEngine::selectAll(graph, keyQuery())) {
        assertions.push_back(toAssertion(solution));
    }
    return assertions;
}

} // namespace webid::tls
