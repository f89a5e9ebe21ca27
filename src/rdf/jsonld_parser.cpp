/**
 * @file jsonld_parser.cpp
 * @brief JSON-LD to RDF reader implementation
 */

#include "webid/rdf/jsonld_parser.h"
#include "webid/rdf/iri.h"
#include "webid/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <sstream>

namespace webid::rdf {

namespace {
    constexpr int kMaxExpansionDepth = 8;

    // JSON-LD canonical form for xsd:double (e.g. 1.5E0)
    std::string canonicalDouble(double value) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.15E", value);
        std::string text(buf);

        size_t e = text.find('E');
        std::string mantissa = text.substr(0, e);
        std::string exponent = text.substr(e + 1);

        while (mantissa.size() > 1 && mantissa.back() == '0' &&
               mantissa[mantissa.size() - 2] != '.') {
            mantissa.pop_back();
        }

        bool negative = !exponent.empty() && exponent[0] == '-';
        size_t start = (exponent[0] == '+' || exponent[0] == '-') ? 1 : 0;
        while (start + 1 < exponent.size() && exponent[start] == '0') {
            ++start;
        }
        return mantissa + "E" + (negative ? "-" : "") + exponent.substr(start);
    }

    // Wrap a scalar so that single values and arrays iterate the same way
    Json::Value asArray(const Json::Value& value) {
        if (value.isArray()) {
            return value;
        }
        Json::Value array(Json::arrayValue);
        array.append(value);
        return array;
    }
}

JsonLdParser::JsonLdParser(Graph& graph, const std::string& baseUri)
    : graph_(graph), documentBase_(baseUri) {}

void JsonLdParser::parse(const std::string& document) {
    Json::CharReaderBuilder reader;
    std::istringstream iss(document);
    Json::Value root;
    std::string errs;

    if (!Json::parseFromStream(reader, iss, &root, &errs)) {
        throw common::ParsingException("invalid JSON: " + utils::trim(errs));
    }

    Context initial;
    initial.base = documentBase_;

    try {
        if (root.isArray()) {
            for (const auto& item : root) {
                if (!item.isObject()) {
                    throw common::ParsingException("top-level JSON-LD array must hold objects");
                }
                processNode(item, initial);
            }
        } else if (root.isObject()) {
            processNode(root, initial);
        } else {
            throw common::ParsingException("JSON-LD document must be an object or an array");
        }
    } catch (const Json::Exception& e) {
        // Keyword holding a value of the wrong JSON type
        throw common::ParsingException(std::string("unexpected JSON value: ") + e.what());
    }
}

JsonLdParser::Context JsonLdParser::processContext(const Context& active,
                                                   const Json::Value& local) const {
    if (local.isArray()) {
        Context result = active;
        for (const auto& item : local) {
            result = processContext(result, item);
        }
        return result;
    }

    if (local.isNull()) {
        Context reset;
        reset.base = documentBase_;
        return reset;
    }

    if (local.isString()) {
        spdlog::debug("[JsonLdParser] Remote context not fetched: {}", local.asString());
        return active;
    }

    if (!local.isObject()) {
        throw common::ParsingException("@context must be an object, array, string or null");
    }

    Context result = active;

    if (local.isMember("@base")) {
        const Json::Value& base = local["@base"];
        if (base.isNull()) {
            result.base.clear();
        } else if (base.isString()) {
            result.base = resolveIri(result.base, base.asString());
        } else {
            throw common::ParsingException("@base must be a string or null");
        }
    }

    if (local.isMember("@vocab")) {
        const Json::Value& vocab = local["@vocab"];
        if (vocab.isNull()) {
            result.vocab.clear();
        } else if (vocab.isString()) {
            result.vocab = expandIri(result, vocab.asString(), true, true);
        } else {
            throw common::ParsingException("@vocab must be a string or null");
        }
    }

    if (local.isMember("@language")) {
        const Json::Value& language = local["@language"];
        result.language = language.isString() ? language.asString() : "";
    }

    // Two passes so that definitions may refer to prefixes declared later
    for (int pass = 0; pass < 2; ++pass) {
        for (const auto& name : local.getMemberNames()) {
            if (name.empty() || name[0] == '@') {
                continue;
            }

            const Json::Value& value = local[name];
            if (value.isNull()) {
                result.terms.erase(name);
                continue;
            }

            TermDefinition definition;
            if (value.isString()) {
                definition.id = expandIri(result, value.asString(), true, false);
            } else if (value.isObject()) {
                if (value.isMember("@id") && value["@id"].isString()) {
                    definition.id = expandIri(result, value["@id"].asString(), true, false);
                } else {
                    definition.id = expandIri(result, name, true, false);
                }
                if (value.isMember("@type") && value["@type"].isString()) {
                    std::string type = value["@type"].asString();
                    definition.type = (type == "@id" || type == "@vocab")
                        ? type
                        : expandIri(result, type, true, false);
                }
                if (value.isMember("@container") && value["@container"].isString()) {
                    definition.container = value["@container"].asString();
                }
                if (value.isMember("@language")) {
                    definition.hasLanguage = true;
                    const Json::Value& language = value["@language"];
                    definition.language = language.isString() ? language.asString() : "";
                }
            } else {
                throw common::ParsingException("invalid term definition for '" + name + "'");
            }

            result.terms[name] = definition;
        }
    }

    return result;
}

std::string JsonLdParser::expandIri(const Context& ctx, const std::string& value,
                                    bool vocabRelative, bool documentRelative,
                                    int depth) const {
    if (depth > kMaxExpansionDepth) {
        return "";
    }
    if (value.empty()) {
        return documentRelative ? (ctx.base.empty() ? documentBase_ : ctx.base) : "";
    }
    if (value[0] == '@') {
        return value;
    }

    if (vocabRelative) {
        auto it = ctx.terms.find(value);
        if (it != ctx.terms.end() && !it->second.id.empty()) {
            return it->second.id;
        }
    }

    size_t colon = value.find(':');
    if (colon != std::string::npos) {
        std::string prefix = value.substr(0, colon);
        std::string suffix = value.substr(colon + 1);

        if (prefix == "_" || utils::startsWith(suffix, "//")) {
            return value;
        }
        auto it = ctx.terms.find(prefix);
        if (it != ctx.terms.end() && !it->second.id.empty()) {
            return it->second.id + suffix;
        }
        if (isAbsoluteIri(value)) {
            return value;
        }
    }

    if (vocabRelative && !ctx.vocab.empty()) {
        return ctx.vocab + value;
    }
    if (documentRelative) {
        return resolveIri(ctx.base.empty() ? documentBase_ : ctx.base, value);
    }
    return "";
}

Term JsonLdParser::processNode(const Json::Value& node, const Context& parent) {
    if (!node.isObject()) {
        throw common::ParsingException("expected a JSON-LD node object");
    }

    Context ctx = parent;
    if (node.isMember("@context")) {
        ctx = processContext(ctx, node["@context"]);
    }

    Term subject;
    if (node.isMember("@id") && node["@id"].isString()) {
        subject = nodeReference(expandIri(ctx, node["@id"].asString(), false, true));
    } else {
        subject = graph_.newBlankNode();
    }

    for (const auto& key : node.getMemberNames()) {
        const Json::Value& value = node[key];

        if (key == "@context" || key == "@id") {
            continue;
        }

        if (key == "@type") {
            const Json::Value types = asArray(value);
            for (const auto& type : types) {
                if (!type.isString()) {
                    throw common::ParsingException("@type values must be strings");
                }
                std::string expanded = expandIri(ctx, type.asString(), true, true);
                if (!expanded.empty()) {
                    graph_.add(subject, Term::iri(vocab::RDF_TYPE), nodeReference(expanded));
                }
            }
            continue;
        }

        if (key == "@graph") {
            const Json::Value items = asArray(value);
            for (const auto& item : items) {
                processNode(item, ctx);
            }
            continue;
        }

        if (key == "@reverse") {
            if (!value.isObject()) {
                throw common::ParsingException("@reverse must be an object");
            }
            for (const auto& reverseKey : value.getMemberNames()) {
                std::string predicate = expandIri(ctx, reverseKey, true, false);
                if (predicate.empty() || !isAbsoluteIri(predicate)) {
                    continue;
                }
                std::vector<Term> sources;
                processValue(value[reverseKey], ctx, nullptr, sources);
                for (const auto& source : sources) {
                    if (!source.isLiteral()) {
                        graph_.add(source, Term::iri(predicate), subject);
                    }
                }
            }
            continue;
        }

        if (key[0] == '@') {
            continue;
        }

        std::string predicate = expandIri(ctx, key, true, false);
        if (predicate.empty() || !isAbsoluteIri(predicate) || utils::startsWith(predicate, "_:")) {
            spdlog::debug("[JsonLdParser] Dropping property without IRI mapping: {}", key);
            continue;
        }

        auto defIt = ctx.terms.find(key);
        const TermDefinition* definition = defIt != ctx.terms.end() ? &defIt->second : nullptr;

        std::vector<Term> objects;
        if (definition && definition->container == "@list" && value.isArray()) {
            objects.push_back(processList(value, ctx, definition));
        } else {
            processValue(value, ctx, definition, objects);
        }

        for (const auto& object : objects) {
            graph_.add(subject, Term::iri(predicate), object);
        }
    }

    return subject;
}

void JsonLdParser::processValue(const Json::Value& value, const Context& ctx,
                                const TermDefinition* definition, std::vector<Term>& out) {
    if (value.isNull()) {
        return;
    }

    if (value.isArray()) {
        for (const auto& item : value) {
            processValue(item, ctx, definition, out);
        }
        return;
    }

    if (value.isObject()) {
        if (value.isMember("@value")) {
            const Json::Value& literal = value["@value"];
            if (literal.isNull()) {
                return;
            }
            std::string datatype;
            if (value.isMember("@type") && value["@type"].isString()) {
                datatype = expandIri(ctx, value["@type"].asString(), true, true);
            }
            std::string language;
            if (value.isMember("@language") && value["@language"].isString()) {
                language = value["@language"].asString();
            }
            out.push_back(literalFromJson(literal, datatype, language));
            return;
        }
        if (value.isMember("@list")) {
            out.push_back(processList(value["@list"], ctx, definition));
            return;
        }
        if (value.isMember("@set")) {
            processValue(value["@set"], ctx, definition, out);
            return;
        }
        out.push_back(processNode(value, ctx));
        return;
    }

    if (value.isString()) {
        const std::string text = value.asString();
        if (definition && definition->type == "@id") {
            out.push_back(nodeReference(expandIri(ctx, text, false, true)));
        } else if (definition && definition->type == "@vocab") {
            out.push_back(nodeReference(expandIri(ctx, text, true, true)));
        } else if (definition && !definition->type.empty()) {
            out.push_back(Term::literal(text, definition->type));
        } else {
            std::string language = (definition && definition->hasLanguage)
                ? definition->language
                : ctx.language;
            out.push_back(Term::literal(text, "", language));
        }
        return;
    }

    std::string datatype;
    if (definition && !definition->type.empty() && definition->type[0] != '@') {
        datatype = definition->type;
    }
    out.push_back(literalFromJson(value, datatype, ""));
}

Term JsonLdParser::processList(const Json::Value& items, const Context& ctx,
                               const TermDefinition* definition) {
    std::vector<Term> elements;
    processValue(items, ctx, definition, elements);

    if (elements.empty()) {
        return Term::iri(vocab::RDF_NIL);
    }

    const Term first = Term::iri(vocab::RDF_FIRST);
    const Term rest = Term::iri(vocab::RDF_REST);
    Term head = graph_.newBlankNode();
    Term current = head;
    for (size_t i = 0; i < elements.size(); ++i) {
        graph_.add(current, first, elements[i]);
        if (i + 1 == elements.size()) {
            graph_.add(current, rest, Term::iri(vocab::RDF_NIL));
        } else {
            Term next = graph_.newBlankNode();
            graph_.add(current, rest, next);
            current = next;
        }
    }
    return head;
}

Term JsonLdParser::literalFromJson(const Json::Value& value, const std::string& datatype,
                                   const std::string& language) const {
    if (value.isString()) {
        return Term::literal(value.asString(), datatype, datatype.empty() ? language : "");
    }
    if (value.isBool()) {
        return Term::literal(value.asBool() ? "true" : "false",
                             datatype.empty() ? vocab::XSD_BOOLEAN : datatype);
    }
    if (value.isInt64()) {
        return Term::literal(std::to_string(value.asInt64()),
                             datatype.empty() ? vocab::XSD_INTEGER : datatype);
    }
    if (value.isUInt64()) {
        return Term::literal(std::to_string(value.asUInt64()),
                             datatype.empty() ? vocab::XSD_INTEGER : datatype);
    }
    if (value.isDouble()) {
        return Term::literal(canonicalDouble(value.asDouble()),
                             datatype.empty() ? vocab::XSD_DOUBLE : datatype);
    }
    throw common::ParsingException("@value must be a string, number or boolean");
}

Term JsonLdParser::nodeReference(const std::string& iri) {
    if (iri.empty()) {
        return graph_.newBlankNode();
    }
    if (!utils::startsWith(iri, "_:")) {
        return Term::iri(iri);
    }

    std::string label = iri.substr(2);
    auto it = blankLabels_.find(label);
    if (it != blankLabels_.end()) {
        return it->second;
    }
    Term node = graph_.newBlankNode();
    blankLabels_.emplace(label, node);
    return node;
}

} // namespace webid::rdf
