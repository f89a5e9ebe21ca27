/**
 * @file graph_builder.h
 * @brief Profile document to RDF graph conversion
 *
 * The verifier depends only on IGraphBuilder. RdfGraphBuilder is the
 * default adapter, dispatching to the Turtle or JSON-LD reader by media type.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include "webid/rdf/graph.h"

namespace webid::rdf {

/**
 * @brief Outcome of a parse: a graph, or an error message
 */
struct GraphParseResult {
    std::optional<Graph> graph;
    std::string error;

    bool ok() const { return graph.has_value(); }

    static GraphParseResult success(Graph g) {
        GraphParseResult r;
        r.graph = std::move(g);
        return r;
    }

    static GraphParseResult failure(const std::string& message) {
        GraphParseResult r;
        r.error = message;
        return r;
    }
};

/**
 * @brief Graph builder interface
 *
 * Implementations must not throw; every failure is reported in the result.
 */
class IGraphBuilder {
public:
    virtual ~IGraphBuilder() = default;

    /**
     * @brief Parse a document into a graph
     * @param body Document bytes
     * @param baseUri Base IRI for relative references (the fetched URI)
     * @param mimeType Media type of the document, parameters allowed
     * @return Graph, or error message
     */
    virtual GraphParseResult parse(const std::string& body,
                                   const std::string& baseUri,
                                   const std::string& mimeType) const = 0;
};

/**
 * @brief Serialization understood by RdfGraphBuilder
 */
enum class RdfSyntax {
    UNSUPPORTED,
    TURTLE,     ///< Turtle, N3 subset, N-Triples
    JSON_LD
};

/**
 * @brief Lowercase a media type and drop its parameters
 *
 * @example
 * normalizeMediaType(" Text/Turtle; charset=utf-8");  // "text/turtle"
 */
std::string normalizeMediaType(const std::string& mimeType);

/**
 * @brief Map a media type to a syntax (empty maps to TURTLE)
 */
RdfSyntax syntaxForMediaType(const std::string& mimeType);

/**
 * @brief Default builder backed by the in-tree Turtle and JSON-LD readers
 */
class RdfGraphBuilder : public IGraphBuilder {
public:
    GraphParseResult parse(const std::string& body,
                           const std::string& baseUri,
                           const std::string& mimeType) const override;
};

} // namespace webid::rdf
