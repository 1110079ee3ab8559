/**
 * @file SolutionEnumerator.hh
 * @brief Lazy, ordered enumeration of projected models
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef CNFSOLVER_SOLUTIONENUMERATOR_H
#define CNFSOLVER_SOLUTIONENUMERATOR_H

#include "cnfsolver/Deadline.hh"
#include "cnfsolver/SatSolver.hh"

#include <cstdint>
#include <vector>

namespace cnfsolver {

/**
 * @class SolutionEnumerator
 * @brief Enumerates the projections of all models onto a variable list
 *
 * Solutions are the distinct assignments of the projection variables that
 * extend to a model of the formula (and of the fixed assumptions). They come in
 * lexicographic order over the projection list, false before true, so the
 * order only depends on the formula and the projection order.
 *
 * Each solution costs at most two SAT calls per projection variable. A model
 * found along the way is reused as a witness: a projection variable the
 * witness already sets to false needs no call.
 *
 * @code
 * cnfsolver::SolutionEnumerator enumerator(num_vars, clauses, {1, 2, 3});
 * std::vector<bool> solution;
 * while (enumerator.next(solution)) {
 *     // solution[i] is the value of projection variable i
 * }
 * enumerator.reset();  // same sequence again
 * @endcode
 */
class SolutionEnumerator {
private:
    SatSolver solver_;
    std::vector<int> projection_;
    std::vector<int> assumptions_;
    Deadline deadline_;

    std::vector<bool> current_;
    bool started_;
    bool exhausted_;
    std::uint64_t num_solutions_;

public:
    /**
     * @param num_vars Number of variables of the formula
     * @param clauses Clauses of the formula
     * @param projection Variables to enumerate, in enumeration order
     * @param assumptions Literals every solution must satisfy
     * @param deadline Time limit for every call to next()
     */
    SolutionEnumerator(int num_vars,
                       const std::vector<std::vector<int>>& clauses,
                       std::vector<int> projection,
                       std::vector<int> assumptions = {},
                       Deadline deadline = Deadline());

    /**
     * @brief Produces the next solution
     *
     * @param solution Receives the values of the projection variables
     * @return false once every solution has been produced
     * @throws TimeoutError if the deadline expires
     */
    bool next(std::vector<bool>& solution);

    /**
     * @brief Restarts the enumeration from the first solution
     */
    void reset();

    /**
     * @brief Number of solutions produced since construction or the last reset
     */
    std::uint64_t get_num_solutions() const { return num_solutions_; }

    const std::vector<int>& get_projection() const { return projection_; }

private:
    /**
     * @brief Solves under the assumptions plus the first @p length values of
     *        current_ plus @p extra
     */
    bool solve_prefix(std::size_t length, int extra);

    /**
     * @brief Fixes current_[from..] to the smallest values compatible with
     *        current_[0..from) given that the solver holds a model of that prefix
     */
    void extend_minimal(std::size_t from);
};

} // namespace cnfsolver

#endif // CNFSOLVER_SOLUTIONENUMERATOR_H
