/**
 * @file graph.cpp
 * @brief Graph storage and pattern matching
 */

#include "webid/rdf/graph.h"
#include <cstdio>

namespace webid::rdf {

namespace {
    std::string escapeLiteral(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (char c : value) {
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:   out += c; break;
            }
        }
        return out;
    }

    bool termMatches(const Term* wanted, const Term& actual) {
        return wanted == nullptr || *wanted == actual;
    }
}

std::string Term::toString() const {
    switch (type) {
        case TermType::IRI:
            return "<" + value + ">";
        case TermType::BLANK_NODE:
            return "_:" + value;
        case TermType::LITERAL: {
            std::string out = "\"" + escapeLiteral(value) + "\"";
            if (!language.empty()) {
                out += "@" + language;
            } else if (!datatype.empty() && datatype != vocab::XSD_STRING) {
                out += "^^<" + datatype + ">";
            }
            return out;
        }
    }
    return "";
}

bool Graph::add(const Term& subject, const Term& predicate, const Term& object) {
    Triple triple{subject, predicate, object};
    if (!unique_.insert(triple).second) {
        return false;
    }

    size_t index = triples_.size();
    triples_.push_back(triple);
    bySubject_[subject].push_back(index);
    byPredicate_[predicate].push_back(index);
    byObject_[object].push_back(index);
    return true;
}

std::vector<const Triple*> Graph::match(const Term* subject,
                                        const Term* predicate,
                                        const Term* object) const {
    std::vector<const Triple*> result;

    // Pick the most selective index available
    const std::vector<size_t>* candidates = nullptr;
    static const std::vector<size_t> none;
    if (subject) {
        auto it = bySubject_.find(*subject);
        candidates = it != bySubject_.end() ? &it->second : &none;
    } else if (object) {
        auto it = byObject_.find(*object);
        candidates = it != byObject_.end() ? &it->second : &none;
    } else if (predicate) {
        auto it = byPredicate_.find(*predicate);
        candidates = it != byPredicate_.end() ? &it->second : &none;
    }

    if (!candidates) {
        result.reserve(triples_.size());
        for (const auto& triple : triples_) {
            result.push_back(&triple);
        }
        return result;
    }

    for (size_t index : *candidates) {
        const Triple& triple = triples_[index];
        if (termMatches(subject, triple.subject) &&
            termMatches(predicate, triple.predicate) &&
            termMatches(object, triple.object)) {
            result.push_back(&triple);
        }
    }
    return result;
}

Term Graph::newBlankNode() {
    char label[32];
    std::snprintf(label, sizeof(label), "b%zu", blankCounter_++);
    return Term::blank(label);
}

} // namespace webid::rdf
