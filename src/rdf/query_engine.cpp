/**
 * @file query_engine.cpp
 * @brief Nested-loop join over triple patterns
 */

#include "webid/rdf/query_engine.h"

namespace webid::rdf {

namespace {
    /// Bind one pattern position; false on conflict with an earlier binding
    bool bindPosition(const PatternTerm& position, const Term& value, Solution& bindings) {
        if (!position.isVariable) {
            return position.term == value;
        }
        auto it = bindings.find(position.variable);
        if (it != bindings.end()) {
            return it->second == value;
        }
        bindings.emplace(position.variable, value);
        return true;
    }

    /// Fixed term for a position, or nullptr for an unbound variable
    const Term* resolvePosition(const PatternTerm& position, const Solution& bindings) {
        if (!position.isVariable) {
            return &position.term;
        }
        auto it = bindings.find(position.variable);
        return it != bindings.end() ? &it->second : nullptr;
    }
}

SolutionStream::SolutionStream(const Graph& graph, const SelectQuery& query)
    : graph_(graph), query_(query) {}

SolutionStream::Frame SolutionStream::makeFrame(size_t patternIndex, const Solution& bindings) const {
    const TriplePattern& pattern = query_.patterns()[patternIndex];
    Frame frame;
    frame.bindings = bindings;
    frame.candidates = graph_.match(resolvePosition(pattern.subject, frame.bindings),
                                    resolvePosition(pattern.predicate, frame.bindings),
                                    resolvePosition(pattern.object, frame.bindings));
    return frame;
}

Solution SolutionStream::project(const Solution& bindings) const {
    if (query_.selectsAll()) {
        return bindings;
    }
    Solution projected;
    for (const auto& name : query_.variables()) {
        auto it = bindings.find(name);
        if (it != bindings.end()) {
            projected.emplace(name, it->second);
        }
    }
    return projected;
}

bool SolutionStream::emit(const Solution& bindings, Solution& out) {
    Solution projected = project(bindings);
    if (query_.distinct() && !seen_.insert(projected).second) {
        return false;
    }
    out = std::move(projected);
    return true;
}

bool SolutionStream::next(Solution& out) {
    if (done_) {
        return false;
    }

    const auto& patterns = query_.patterns();
    if (!started_) {
        started_ = true;
        if (patterns.empty()) {
            // An empty group has exactly one (empty) solution
            done_ = true;
            return emit(Solution{}, out);
        }
        frames_.push_back(makeFrame(0, Solution{}));
    }

    while (!frames_.empty()) {
        Frame& frame = frames_.back();
        if (frame.index >= frame.candidates.size()) {
            frames_.pop_back();
            continue;
        }

        const Triple& triple = *frame.candidates[frame.index++];
        const TriplePattern& pattern = patterns[frames_.size() - 1];

        Solution bindings = frame.bindings;
        if (!bindPosition(pattern.subject, triple.subject, bindings) ||
            !bindPosition(pattern.predicate, triple.predicate, bindings) ||
            !bindPosition(pattern.object, triple.object, bindings)) {
            continue;
        }

        if (frames_.size() == patterns.size()) {
            if (emit(bindings, out)) {
                return true;
            }
            continue;
        }
        frames_.push_back(makeFrame(frames_.size(), bindings));
    }

    done_ = true;
    return false;
}

void QueryEngine::execute(const Graph& graph,
                          const SelectQuery& query,
                          const SolutionCallback& onSolution,
                          const CompletionCallback& onComplete) {
    SolutionStream stream(graph, query);
    Solution solution;
    while (stream.next(solution)) {
        if (onSolution && !onSolution(solution)) {
            break;
        }
    }
    if (onComplete) {
        onComplete();
    }
}

std::optional<Solution> QueryEngine::findFirst(const Graph& graph,
                                               const SelectQuery& query,
                                               const Predicate& predicate) {
    std::optional<Solution> found;
    execute(graph, query,
        [&](const Solution& solution) {
            if (!predicate || predicate(solution)) {
                found = solution;
                return false;
            }
            return true;
        },
        nullptr);
    return found;
}

std::vector<Solution> QueryEngine::selectAll(const Graph& graph, const SelectQuery& query) {
    std::vector<Solution> solutions;
    execute(graph, query,
        [&](const Solution& solution) {
            solutions.push_back(solution);
            return true;
        },
        nullptr);
    return solutions;
}

} // namespace webid::rdf
