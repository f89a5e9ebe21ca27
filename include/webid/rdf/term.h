/**
 * @file term.h
 * @brief RDF terms and triples
 */

#pragma once

#include <string>
#include <tuple>

namespace webid::rdf {

/// Well-known vocabulary IRIs
namespace vocab {
    constexpr const char* RDF = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    constexpr const char* RDF_TYPE = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
    constexpr const char* RDF_FIRST = "http://www.w3.org/1999/02/22-rdf-syntax-ns#first";
    constexpr const char* RDF_REST = "http://www.w3.org/1999/02/22-rdf-syntax-ns#rest";
    constexpr const char* RDF_NIL = "http://www.w3.org/1999/02/22-rdf-syntax-ns#nil";
    constexpr const char* RDF_LANG_STRING = "http://www.w3.org/1999/02/22-rdf-syntax-ns#langString";
    constexpr const char* XSD_STRING = "http://www.w3.org/2001/XMLSchema#string";
    constexpr const char* XSD_BOOLEAN = "http://www.w3.org/2001/XMLSchema#boolean";
    constexpr const char* XSD_INTEGER = "http://www.w3.org/2001/XMLSchema#integer";
    constexpr const char* XSD_DECIMAL = "http://www.w3.org/2001/XMLSchema#decimal";
    constexpr const char* XSD_DOUBLE = "http://www.w3.org/2001/XMLSchema#double";
}

/// Kind of RDF term
enum class TermType {
    IRI,
    BLANK_NODE,
    LITERAL
};

/**
 * @brief RDF term
 *
 * value holds the IRI, the blank node label (without "_:"), or the
 * literal's lexical form. Literals carry a datatype IRI (xsd:string when
 * plain) or a language tag (datatype rdf:langString).
 */
struct Term {
    TermType type = TermType::IRI;
    std::string value;
    std::string datatype;
    std::string language;

    static Term iri(const std::string& value) {
        return Term{TermType::IRI, value, "", ""};
    }

    static Term blank(const std::string& label) {
        return Term{TermType::BLANK_NODE, label, "", ""};
    }

    static Term literal(const std::string& lexical,
                        const std::string& datatype = "",
                        const std::string& language = "") {
        if (!language.empty()) {
            return Term{TermType::LITERAL, lexical, vocab::RDF_LANG_STRING, language};
        }
        return Term{TermType::LITERAL, lexical,
                    datatype.empty() ? std::string(vocab::XSD_STRING) : datatype, ""};
    }

    bool isIri() const { return type == TermType::IRI; }
    bool isBlank() const { return type == TermType::BLANK_NODE; }
    bool isLiteral() const { return type == TermType::LITERAL; }

    /// N-Triples rendering, for logs and diagnostics
    std::string toString() const;

    bool operator==(const Term& other) const {
        return type == other.type && value == other.value &&
               datatype == other.datatype && language == other.language;
    }
    bool operator!=(const Term& other) const { return !(*this == other); }
    bool operator<(const Term& other) const {
        return std::tie(type, value, datatype, language) <
               std::tie(other.type, other.value, other.datatype, other.language);
    }
};

/**
 * @brief RDF statement
 */
struct Triple {
    Term subject;
    Term predicate;
    Term object;

    bool operator==(const Triple& other) const {
        return subject == other.subject && predicate == other.predicate && object == other.object;
    }
    bool operator<(const Triple& other) const {
        return std::tie(subject, predicate, object) <
               std::tie(other.subject, other.predicate, other.object);
    }
};

} // namespace webid::rdf
