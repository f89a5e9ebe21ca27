/**
 * @file query_engine.h
 * @brief Basic graph pattern evaluation over a Graph
 */

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "webid/rdf/graph.h"
#include "webid/rdf/sparql_query.h"

namespace webid::rdf {

/// Variable name (without '?') to bound term
using Solution = std::map<std::string, Term>;

/**
 * @brief Lazy stream of solutions
 *
 * Patterns are joined depth-first in declaration order. The graph and the
 * query must outlive the stream and the graph must not change meanwhile.
 */
class SolutionStream {
public:
    SolutionStream(const Graph& graph, const SelectQuery& query);

    /**
     * @brief Produce the next projected solution
     * @return false once the stream is exhausted
     */
    bool next(Solution& out);

private:
    struct Frame {
        std::vector<const Triple*> candidates;
        size_t index = 0;
        Solution bindings;
    };

    const Graph& graph_;
    const SelectQuery& query_;
    std::vector<Frame> frames_;
    std::set<Solution> seen_;
    bool started_ = false;
    bool done_ = false;

    Frame makeFrame(size_t patternIndex, const Solution& bindings) const;
    Solution project(const Solution& bindings) const;
    bool emit(const Solution& bindings, Solution& out);
};

/**
 * @brief Query evaluation entry points
 */
class QueryEngine {
public:
    /// Return false to stop evaluation
    using SolutionCallback = std::function<bool(const Solution&)>;
    using CompletionCallback = std::function<void()>;
    using Predicate = std::function<bool(const Solution&)>;

    /**
     * @brief Push every solution to onSolution, then call onComplete
     *
     * onComplete fires exactly once, including when onSolution stopped the
     * evaluation early. Either callback may be empty.
     */
    static void execute(const Graph& graph,
                        const SelectQuery& query,
                        const SolutionCallback& onSolution,
                        const CompletionCallback& onComplete);

    /**
     * @brief First solution satisfying predicate; later ones are not evaluated
     */
    static std::optional<Solution> findFirst(const Graph& graph,
                                             const SelectQuery& query,
                                             const Predicate& predicate);

    static std::vector<Solution> selectAll(const Graph& graph, const SelectQuery& query);
};

} // namespace webid::rdf
