/**
 * @file sparql_query.h
 * @brief SPARQL SELECT subset (basic graph patterns only)
 *
 * Grammar accepted:
 *   PREFIX p: <iri> ...
 *   SELECT [DISTINCT] (* | ?v ...) [WHERE] { s p o (. | ; | ,) ... }
 *
 * No FILTER, OPTIONAL, UNION or solution modifiers.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include "webid/rdf/term.h"

namespace webid::rdf {

/**
 * @brief One position of a triple pattern: a variable or a fixed term
 */
struct PatternTerm {
    bool isVariable = false;
    std::string variable;   ///< name without '?'
    Term term;

    static PatternTerm var(const std::string& name) {
        PatternTerm p;
        p.isVariable = true;
        p.variable = name;
        return p;
    }

    static PatternTerm constant(const Term& t) {
        PatternTerm p;
        p.term = t;
        return p;
    }
};

struct TriplePattern {
    PatternTerm subject;
    PatternTerm predicate;
    PatternTerm object;
};

/**
 * @brief Parsed SELECT query
 */
class SelectQuery {
public:
    /**
     * @brief Parse query text
     * @throws common::ParsingException on anything outside the subset
     */
    static SelectQuery parse(const std::string& text);

    /// Projected variables in SELECT order (empty when selecting all)
    const std::vector<std::string>& variables() const { return variables_; }
    bool selectsAll() const { return selectAll_; }
    bool distinct() const { return distinct_; }
    const std::vector<TriplePattern>& patterns() const { return patterns_; }
    const std::map<std::string, std::string>& prefixes() const { return prefixes_; }

private:
    std::vector<std::string> variables_;
    bool selectAll_ = false;
    bool distinct_ = false;
    std::vector<TriplePattern> patterns_;
    std::map<std::string, std::string> prefixes_;

    friend class SparqlParser;
};

} // namespace webid::rdf
