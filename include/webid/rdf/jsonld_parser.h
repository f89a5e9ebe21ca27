/**
 * @file jsonld_parser.h
 * @brief JSON-LD to RDF reader (jsoncpp based)
 *
 * Handles the compacted JSON-LD shapes used by WebID profiles. Remote
 * contexts are never fetched; terms they would define are dropped.
 */

#pragma once

#include <map>
#include <string>
#include <vector>
#include <json/json.h>
#include "webid/common/exceptions.h"
#include "webid/rdf/graph.h"

namespace webid::rdf {

/**
 * @brief JSON-LD reader writing into a Graph
 */
class JsonLdParser {
public:
    /**
     * @param graph Destination graph (non-owning)
     * @param baseUri Document base IRI
     */
    JsonLdParser(Graph& graph, const std::string& baseUri);

    /**
     * @brief Parse a whole document
     * @throws common::ParsingException on invalid JSON or malformed JSON-LD
     */
    void parse(const std::string& document);

private:
    /// Term definition from an active context
    struct TermDefinition {
        std::string id;         ///< expanded IRI
        std::string type;       ///< "@id", "@vocab", a datatype IRI, or empty
        std::string container;  ///< "@list", "@set", or empty
        std::string language;
        bool hasLanguage = false;
    };

    struct Context {
        std::string base;
        std::string vocab;
        std::string language;
        std::map<std::string, TermDefinition> terms;
    };

    Graph& graph_;
    std::string documentBase_;
    std::map<std::string, Term> blankLabels_;

    Context processContext(const Context& active, const Json::Value& local) const;
    std::string expandIri(const Context& ctx, const std::string& value,
                          bool vocabRelative, bool documentRelative,
                          int depth = 0) const;

    Term processNode(const Json::Value& node, const Context& parent);
    void processValue(const Json::Value& value, const Context& ctx,
                      const TermDefinition* definition, std::vector<Term>& out);
    Term processList(const Json::Value& items, const Context& ctx,
                     const TermDefinition* definition);
    Term literalFromJson(const Json::Value& value, const std::string& datatype,
                         const std::string& language) const;
    Term nodeReference(const std::string& iri);
};

} // namespace webid::rdf
