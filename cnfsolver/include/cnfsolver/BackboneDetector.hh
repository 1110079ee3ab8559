/**
 * @file BackboneDetector.hh
 * @brief Backbone computation (literals fixed in every model)
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef CNFSOLVER_BACKBONEDETECTOR_H
#define CNFSOLVER_BACKBONEDETECTOR_H

#include "cnfsolver/Deadline.hh"
#include "cnfsolver/SatSolver.hh"

#include <vector>

namespace cnfsolver {

/**
 * @struct BackboneResult
 * @brief Outcome of a backbone computation
 */
struct BackboneResult {
    bool satisfiable;            ///< false if the formula (under the assumptions) has no model
    std::vector<int> backbone;   ///< Fixed literals, ordered by variable
};

/**
 * @class BackboneDetector
 * @brief Finds the literals a formula entails, checking candidates one by one
 *
 * Algorithm:
 * 1. Solve once; the model gives one candidate literal per candidate variable.
 * 2. For each remaining candidate l, solve with the assumption -l:
 *    - UNSAT: l is in the backbone,
 *    - SAT: every candidate the new model falsifies is dropped.
 *
 * At most one SAT call per candidate variable plus one.
 *
 * @code
 * cnfsolver::BackboneDetector detector(num_vars, clauses);
 * auto result = detector.compute({1, 2, 3});
 * @endcode
 */
class BackboneDetector {
private:
    SatSolver solver_;

public:
    BackboneDetector(int num_vars, const std::vector<std::vector<int>>& clauses);

    /**
     * @brief Backbone restricted to the given variables
     *
     * @param variables Candidate variables (1-based)
     * @param assumptions Literals assumed true during the whole computation
     * @param deadline Time limit
     * @throws TimeoutError if the deadline expires
     */
    BackboneResult compute(const std::vector<int>& variables,
                           const std::vector<int>& assumptions = {},
                           const Deadline& deadline = Deadline());
};

} // namespace cnfsolver

#endif // CNFSOLVER_BACKBONEDETECTOR_H
