/**
 * @file graph_builder.cpp
 * @brief Media type dispatch to the RDF readers
 */

#include "webid/rdf/graph_builder.h"
#include "webid/common/exceptions.h"
#include "webid/rdf/jsonld_parser.h"
#include "webid/rdf/turtle_parser.h"
#include "webid/utils/string_utils.h"
#include <spdlog/spdlog.h>

namespace webid::rdf {

std::string normalizeMediaType(const std::string& mimeType) {
    std::string type = mimeType;
    size_t semi = type.find(';');
    if (semi != std::string::npos) {
        type = type.substr(0, semi);
    }
    return utils::toLower(utils::trim(type));
}

RdfSyntax syntaxForMediaType(const std::string& mimeType) {
    const std::string type = normalizeMediaType(mimeType);

    if (type.empty() ||
        type == "text/turtle" ||
        type == "application/x-turtle" ||
        type == "text/n3" ||
        type == "text/rdf+n3" ||
        type == "application/n-triples" ||
        type == "text/plain") {
        return RdfSyntax::TURTLE;
    }
    if (type == "application/ld+json" || type == "application/json") {
        return RdfSyntax::JSON_LD;
    }
    return RdfSyntax::UNSUPPORTED;
}

GraphParseResult RdfGraphBuilder::parse(const std::string& body,
                                        const std::string& baseUri,
                                        const std::string& mimeType) const {
    RdfSyntax syntax = syntaxForMediaType(mimeType);
    if (syntax == RdfSyntax::UNSUPPORTED) {
        return GraphParseResult::failure("Unsupported content type: " + normalizeMediaType(mimeType));
    }

    Graph graph;
    try {
        if (syntax == RdfSyntax::JSON_LD) {
            JsonLdParser parser(graph, baseUri);
            parser.parse(body);
        } else {
            TurtleParser parser(graph, baseUri);
            parser.parse(body);
        }
    } catch (const common::ParsingException& e) {
        spdlog::debug("[RdfGraphBuilder] {} rejected: {}", baseUri, e.what());
        return GraphParseResult::failure(e.what());
    }

    spdlog::debug("[RdfGraphBuilder] {} parsed: {} triples", baseUri, graph.size());
    return GraphParseResult::success(std::move(graph));
}

} // namespace webid::rdf
