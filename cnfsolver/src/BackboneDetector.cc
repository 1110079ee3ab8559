/**
 * @file BackboneDetector.cc
 * @brief One-by-one candidate checking for backbones
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "cnfsolver/BackboneDetector.hh"

#include <algorithm>

namespace cnfsolver {

BackboneDetector::BackboneDetector(int num_vars, const std::vector<std::vector<int>>& clauses)
    : solver_(num_vars) {
    // An unsatisfiable clause set is reported by the first solve()
    solver_.add_clauses(clauses);
}

/**
 * @brief Literals over @p variables that hold in every model
 *
 * The first model gives one candidate literal per variable. A candidate is
 * confirmed when the solver finds no model with its negation; any model found
 * instead drops every candidate it contradicts.
 *
 * @param variables Variables to check; duplicates are ignored
 * @param assumptions Literals every model must satisfy
 * @param deadline Time limit
 * @return Backbone literals sorted by variable; unsatisfiable if no model exists
 * @throws TimeoutError if the deadline expires
 */
BackboneResult BackboneDetector::compute(const std::vector<int>& variables,
                                         const std::vector<int>& assumptions,
                                         const Deadline& deadline) {
    BackboneResult result{false, {}};

    if (!solver_.solve(assumptions, deadline)) {
        return result;
    }
    result.satisfiable = true;

    std::vector<int> sorted_vars = variables;
    std::sort(sorted_vars.begin(), sorted_vars.end());
    sorted_vars.erase(std::unique(sorted_vars.begin(), sorted_vars.end()), sorted_vars.end());

    // candidate[i] is the literal of sorted_vars[i] in every model seen so far, or 0
    std::vector<int> candidates;
    candidates.reserve(sorted_vars.size());
    for (int var : sorted_vars) {
        candidates.push_back(solver_.model_value(var) ? var : -var);
    }

    std::vector<int> query = assumptions;
    query.push_back(0);

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        int literal = candidates[i];
        if (literal == 0) {
            continue;
        }

        query.back() = -literal;
        if (!solver_.solve(query, deadline)) {
            result.backbone.push_back(literal);
            if (assumptions.empty()) {
                // Entailed by the clauses alone: keep it to speed up later calls
                solver_.add_clause({literal});
            }
            continue;
        }

        for (std::size_t j = i; j < candidates.size(); ++j) {
            int candidate = candidates[j];
            if (candidate == 0) {
                continue;
            }
            int var = candidate > 0 ? candidate : -candidate;
            if (solver_.model_value(var) != (candidate > 0)) {
                candidates[j] = 0;
            }
        }
    }

    return result;
}

} // namespace cnfsolver
