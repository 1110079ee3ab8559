/**
 * @file SolutionEnumerator.cc
 * @brief Lexicographic enumeration of projected models
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "cnfsolver/SolutionEnumerator.hh"

namespace cnfsolver {

SolutionEnumerator::SolutionEnumerator(int num_vars,
                                       const std::vector<std::vector<int>>& clauses,
                                       std::vector<int> projection,
                                       std::vector<int> assumptions,
                                       Deadline deadline)
    : solver_(num_vars)
    , projection_(std::move(projection))
    , assumptions_(std::move(assumptions))
    , deadline_(std::move(deadline))
    , started_(false)
    , exhausted_(false)
    , num_solutions_(0) {
    // An unsatisfiable clause set simply yields no solution
    solver_.add_clauses(clauses);
}

void SolutionEnumerator::reset() {
    current_.clear();
    started_ = false;
    exhausted_ = false;
    num_solutions_ = 0;
}

/**
 * @brief Computes the lexicographic successor of the current solution
 *
 * The successor flips the last unselected position whose prefix still
 * extends to a model, then fills the rest with the smallest values possible.
 */
bool SolutionEnumerator::next(std::vector<bool>& solution) {
    if (exhausted_) {
        return false;
    }

    if (!started_) {
        started_ = true;
        current_.assign(projection_.size(), false);
        if (!solve_prefix(0, 0)) {
            exhausted_ = true;
            return false;
        }
        extend_minimal(0);
    } else {
        // Successor: flip the last false position whose prefix can still be completed
        bool advanced = false;
        for (std::size_t i = projection_.size(); i-- > 0;) {
            if (current_[i]) {
                continue;
            }
            if (solve_prefix(i, projection_[i])) {
                current_[i] = true;
                extend_minimal(i + 1);
                advanced = true;
                break;
            }
        }
        if (!advanced) {
            exhausted_ = true;
            return false;
        }
    }

    ++num_solutions_;
    solution = current_;
    return true;
}

bool SolutionEnumerator::solve_prefix(std::size_t length, int extra) {
    std::vector<int> literals = assumptions_;
    for (std::size_t j = 0; j < length; ++j) {
        literals.push_back(current_[j] ? projection_[j] : -projection_[j]);
    }
    if (extra != 0) {
        literals.push_back(extra);
    }
    return solver_.solve(literals, deadline_);
}

/**
 * @brief Sets positions from @p from on to false wherever some model allows it
 *
 * A position the latest model already sets to false needs no solver call.
 */
void SolutionEnumerator::extend_minimal(std::size_t from) {
    std::vector<bool> witness(projection_.size());
    for (std::size_t j = 0; j < projection_.size(); ++j) {
        witness[j] = solver_.model_value(projection_[j]);
    }

    for (std::size_t j = from; j < projection_.size(); ++j) {
        if (!witness[j]) {
            current_[j] = false;
            continue;
        }
        if (solve_prefix(j, -projection_[j])) {
            current_[j] = false;
            for (std::size_t m = 0; m < projection_.size(); ++m) {
                witness[m] = solver_.model_value(projection_[m]);
            }
        } else {
            current_[j] = true;
        }
    }
}

} // namespace cnfsolver
