/**
 * @file turtle_parser.h
 * @brief Turtle / N-Triples reader
 *
 * Covers the Turtle 1.1 grammar used by WebID profiles: directives in both
 * @prefix and SPARQL style, predicate and object lists, blank node property
 * lists, collections, and string, numeric and boolean literals.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include "webid/common/exceptions.h"
#include "webid/rdf/graph.h"

namespace webid::rdf {

/**
 * @brief Recursive-descent Turtle parser writing into a Graph
 *
 * One instance parses one document. Blank node labels from the document
 * are mapped to fresh graph-local labels.
 */
class TurtleParser {
public:
    /// Deepest allowed nesting of blank node property lists and collections
    static constexpr size_t kMaxNesting = 256;

    /**
     * @param graph Destination graph (non-owning)
     * @param baseUri Base IRI for relative references
     */
    TurtleParser(Graph& graph, const std::string& baseUri);

    /**
     * @brief Parse a whole document
     * @throws common::ParsingException on syntax errors (with line number)
     */
    void parse(const std::string& document);

private:
    Graph& graph_;
    std::string base_;
    std::map<std::string, std::string> prefixes_;
    std::map<std::string, Term> blankLabels_;

    const std::string* input_ = nullptr;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t depth_ = 0;

    // Lexical helpers
    bool atEnd() const;
    char peek(size_t offset = 0) const;
    char get();
    void skipWhitespace();
    bool consumeIf(char c);
    void expect(char c);
    bool matchKeyword(const std::string& keyword, bool caseInsensitive);
    common::ParsingException error(const std::string& message) const;

    // Grammar productions
    void parseStatement();
    void parsePrefixDirective(bool sparqlStyle);
    void parseBaseDirective(bool sparqlStyle);
    void parseTriples();
    void parsePredicateObjectList(const Term& subject);
    void parseObjectList(const Term& subject, const Term& predicate);
    Term parseSubject();
    Term parsePredicate();
    Term parseObject();
    Term parseBlankNodePropertyList();
    Term parseCollection();
    Term parseIriOrPrefixedName();
    Term parseBlankNodeLabel();
    Term parseLiteral();
    Term parseNumericLiteral();

    // Token readers
    std::string readIriRef();
    std::string readPrefixName();
    std::string readLocalName();
    std::string readString();
    std::string readEscape(bool inIri);
    Term blankFor(const std::string& label);
};

} // namespace webid::rdf
