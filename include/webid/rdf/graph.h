/**
 * @file graph.h
 * @brief In-memory RDF graph built from a single profile document
 */

#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "webid/rdf/term.h"

namespace webid::rdf {

/**
 * @brief Set of triples with subject, predicate and object indexes
 *
 * Pointers returned by match() stay valid until the next add().
 */
class Graph {
public:
    Graph() = default;

    /**
     * @brief Add a triple
     * @return false if the triple was already present
     */
    bool add(const Term& subject, const Term& predicate, const Term& object);
    bool add(const Triple& triple) { return add(triple.subject, triple.predicate, triple.object); }

    /**
     * @brief Find triples matching a pattern
     *
     * A nullptr position matches any term.
     */
    std::vector<const Triple*> match(const Term* subject,
                                     const Term* predicate,
                                     const Term* object) const;

    bool contains(const Triple& triple) const { return unique_.count(triple) > 0; }

    /**
     * @brief Allocate a blank node label unique within this graph
     */
    Term newBlankNode();

    size_t size() const { return triples_.size(); }
    bool empty() const { return triples_.empty(); }
    const std::vector<Triple>& triples() const { return triples_; }

private:
    std::vector<Triple> triples_;
    std::set<Triple> unique_;
    std::map<Term, std::vector<size_t>> bySubject_;
    std::map<Term, std::vector<size_t>> byPredicate_;
    std::map<Term, std::vector<size_t>> byObject_;
    size_t blankCounter_ = 0;
};

} // namespace webid::rdf
