/**
 * @file SatSolver.hh
 * @brief Incremental SAT solving on top of CaDiCaL
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef CNFSOLVER_SATSOLVER_H
#define CNFSOLVER_SATSOLVER_H

#include "cnfsolver/Deadline.hh"

#include <memory>
#include <vector>

namespace CaDiCaL {
class Solver;
}

namespace cnfsolver {

/**
 * @class SatSolver
 * @brief DIMACS-literal front end to an incremental CaDiCaL solver
 *
 * Literals are v or -v with v >= 1. Clauses can be added between solve calls
 * and assumptions only hold for the call they are passed to. The initial
 * phase of every variable is "false", and CaDiCaL is deterministic, so the
 * same clauses and the same calls always give the same models.
 *
 * A deadline is polled by a CaDiCaL terminator while a call is running.
 *
 * @code
 * cnfsolver::SatSolver solver(3);
 * solver.add_clause({1, -2});
 * solver.add_clause({2, 3});
 * if (solver.solve({-1})) {
 *     bool x3 = solver.model_value(3);
 * }
 * @endcode
 */
class SatSolver {
public:
    SatSolver();
    explicit SatSolver(int num_vars);
    ~SatSolver();

    SatSolver(const SatSolver&) = delete;
    SatSolver& operator=(const SatSolver&) = delete;
    SatSolver(SatSolver&&) noexcept;
    SatSolver& operator=(SatSolver&&) noexcept;

    /**
     * @brief Adds a variable
     * @return Its number (1-based)
     */
    int new_var();

    /**
     * @brief Makes sure variables 1..num_vars exist
     */
    void ensure_vars(int num_vars);

    int get_num_vars() const { return num_vars_; }

    /**
     * @brief Adds a clause of DIMACS literals
     *
     * Variables beyond get_num_vars() are created on the fly.
     *
     * @return false if the clause set is now known to be unsatisfiable
     * @throws std::invalid_argument on a zero literal
     */
    bool add_clause(const std::vector<int>& clause);

    bool add_clauses(const std::vector<std::vector<int>>& clauses);

    /**
     * @brief Decides satisfiability
     * @throws TimeoutError if the deadline expires
     */
    bool solve(const Deadline& deadline = Deadline());

    /**
     * @brief Decides satisfiability under assumption literals
     *
     * A false result under assumptions does not make the solver unusable.
     *
     * @throws std::invalid_argument if an assumption names an unknown variable
     * @throws TimeoutError if the deadline expires
     */
    bool solve(const std::vector<int>& assumptions, const Deadline& deadline = Deadline());

    /**
     * @brief Value of @p var in the model of the last successful solve
     * @throws std::logic_error if there is no model
     */
    bool model_value(int var) const;

    /**
     * @brief Model of the last successful solve; model[v - 1] is the value of v
     */
    const std::vector<bool>& get_model() const { return model_; }

    /**
     * @brief false once the clauses alone are known to be unsatisfiable
     */
    bool is_okay() const { return ok_; }

private:
    std::unique_ptr<CaDiCaL::Solver> solver_;
    int num_vars_;
    std::vector<bool> model_;
    bool has_model_;
    bool ok_;
};

} // namespace cnfsolver

#endif // CNFSOLVER_SATSOLVER_H
