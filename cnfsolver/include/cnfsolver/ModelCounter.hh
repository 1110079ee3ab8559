/**
 * @file ModelCounter.hh
 * @brief Exact model counting (#SAT)
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef CNFSOLVER_MODELCOUNTER_H
#define CNFSOLVER_MODELCOUNTER_H

#include "cnfsolver/Deadline.hh"

#include <gmpxx.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace cnfsolver {

/**
 * @class ModelCounter
 * @brief Counts the models of a CNF formula without enumerating them
 *
 * DPLL-style exhaustive search with:
 * - unit propagation after every branch,
 * - free variables (no longer in any clause) counted as a factor 2^k,
 * - decomposition of the residual formula into variable-disjoint components
 *   whose counts multiply,
 * - a cache of component counts keyed by the component's clauses,
 * - branching on the variable with the most occurrences (lowest on ties).
 *
 * Counts range over all num_vars variables. Counts are arbitrary precision.
 * A counter is not thread-safe; use one per thread.
 *
 * @code
 * cnfsolver::ModelCounter counter(3, {{1, 2}, {-3}});
 * mpz_class n = counter.count();  // 3
 * @endcode
 */
class ModelCounter {
private:
    using ClauseList = std::vector<std::vector<int>>;

    int num_vars_;
    ClauseList clauses_;
    bool has_empty_clause_;
    std::unordered_map<std::string, mpz_class> cache_;
    std::uint64_t decisions_;
    const Deadline* deadline_;

public:
    ModelCounter(int num_vars, const std::vector<std::vector<int>>& clauses);

    /**
     * @brief Number of models that satisfy every assumption literal
     *
     * @throws std::invalid_argument if an assumption names an unknown variable
     * @throws TimeoutError if the deadline expires
     */
    mpz_class count(const std::vector<int>& assumptions = {}, const Deadline& deadline = Deadline());

    int get_num_vars() const { return num_vars_; }
    std::uint64_t get_num_decisions() const { return decisions_; }
    std::size_t get_cache_size() const { return cache_.size(); }

private:
    mpz_class count_formula(const ClauseList& clauses);
    mpz_class count_component(ClauseList clauses);

    /**
     * @brief Applies the units and every unit they imply
     *
     * @param clauses Simplified in place
     * @param units Literals to set true
     * @param num_fixed Incremented once per variable that gets a value
     * @return false on conflict
     */
    static bool propagate(ClauseList& clauses, std::vector<int> units, std::size_t& num_fixed);

    static std::vector<ClauseList> split_components(const ClauseList& clauses);
    static std::size_t count_variables(const ClauseList& clauses);
    static std::string cache_key(const ClauseList& clauses);
    static mpz_class power_of_two(std::size_t exponent);
};

} // namespace cnfsolver

#endif // CNFSOLVER_MODELCOUNTER_H
