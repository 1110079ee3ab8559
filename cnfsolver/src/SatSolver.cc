/**
 * @file SatSolver.cc
 * @brief CaDiCaL-backed incremental solving with assumptions and deadlines
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "cnfsolver/SatSolver.hh"

#include <cadical.hpp>

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace cnfsolver {

namespace {

constexpr int SOLVE_SATISFIABLE = 10;
constexpr int SOLVE_UNSATISFIABLE = 20;

/**
 * @brief Terminator that stops CaDiCaL once a deadline has expired
 */
class DeadlineTerminator : public CaDiCaL::Terminator {
private:
    const Deadline& deadline_;

public:
    explicit DeadlineTerminator(const Deadline& deadline)
        : deadline_(deadline) {}

    bool terminate() override { return deadline_.expired(); }
};

/**
 * @brief Keeps a terminator connected for the duration of one solve call
 */
class TerminatorConnection {
private:
    CaDiCaL::Solver& solver_;

public:
    TerminatorConnection(CaDiCaL::Solver& solver, CaDiCaL::Terminator& terminator)
        : solver_(solver) {
        solver_.connect_terminator(&terminator);
    }

    ~TerminatorConnection() { solver_.disconnect_terminator(); }

    TerminatorConnection(const TerminatorConnection&) = delete;
    TerminatorConnection& operator=(const TerminatorConnection&) = delete;
};

} // namespace

SatSolver::SatSolver()
    : solver_(std::make_unique<CaDiCaL::Solver>())
    , num_vars_(0)
    , has_model_(false)
    , ok_(true) {
    // Options can only be set before the first clause
    if (!solver_->set("phase", 0)) {
        throw std::logic_error("CaDiCaL does not accept the option 'phase'");
    }
}

SatSolver::SatSolver(int num_vars)
    : SatSolver() {
    ensure_vars(num_vars);
}

SatSolver::~SatSolver() = default;
SatSolver::SatSolver(SatSolver&&) noexcept = default;
SatSolver& SatSolver::operator=(SatSolver&&) noexcept = default;

int SatSolver::new_var() {
    ensure_vars(num_vars_ + 1);
    return num_vars_;
}

/**
 * @brief Declares variables up to @p num_vars in CaDiCaL
 *
 * CaDiCaL only answers val() for declared variables, so every variable a
 * model may be asked about is reserved up front.
 */
void SatSolver::ensure_vars(int num_vars) {
    if (num_vars <= num_vars_) {
        return;
    }
    solver_->reserve(num_vars);
    num_vars_ = num_vars;
}

bool SatSolver::add_clause(const std::vector<int>& clause) {
    // Validate first: CaDiCaL must never be left in the middle of a clause
    int max_var = 0;
    for (int literal : clause) {
        if (literal == 0 || literal == INT_MIN) {
            throw std::invalid_argument("Clause contains the invalid literal " + std::to_string(literal));
        }
        max_var = std::max(max_var, std::abs(literal));
    }
    ensure_vars(max_var);

    for (int literal : clause) {
        solver_->add(literal);
    }
    solver_->add(0);

    if (clause.empty()) {
        ok_ = false;
    }
    return ok_;
}

bool SatSolver::add_clauses(const std::vector<std::vector<int>>& clauses) {
    for (const auto& clause : clauses) {
        add_clause(clause);
    }
    return ok_;
}

bool SatSolver::solve(const Deadline& deadline) {
    return solve(std::vector<int>(), deadline);
}

/**
 * @brief Runs CaDiCaL under @p assumptions
 *
 * An unsatisfiable answer in which no assumption took part means the clauses
 * alone are unsatisfiable, and the solver is marked as not okay.
 *
 * @throws std::invalid_argument if an assumption names an unknown variable
 * @throws TimeoutError if CaDiCaL was stopped by the deadline
 */
bool SatSolver::solve(const std::vector<int>& assumptions, const Deadline& deadline) {
    for (int literal : assumptions) {
        if (literal == 0 || literal == INT_MIN || std::abs(literal) > num_vars_) {
            throw std::invalid_argument("Assumption on unknown variable " + std::to_string(literal));
        }
    }

    has_model_ = false;
    model_.clear();
    if (!ok_) {
        return false;
    }

    deadline.check();

    for (int literal : assumptions) {
        solver_->assume(literal);
    }

    int status = 0;
    {
        DeadlineTerminator terminator(deadline);
        TerminatorConnection connection(*solver_, terminator);
        status = solver_->solve();
    }

    if (status == SOLVE_SATISFIABLE) {
        model_.assign(static_cast<std::size_t>(num_vars_), false);
        for (int var = 1; var <= num_vars_; ++var) {
            model_[var - 1] = solver_->val(var) > 0;
        }
        has_model_ = true;
        return true;
    }

    if (status == SOLVE_UNSATISFIABLE) {
        bool assumption_failed = false;
        for (int literal : assumptions) {
            if (solver_->failed(literal)) {
                assumption_failed = true;
                break;
            }
        }
        if (!assumption_failed) {
            ok_ = false;
        }
        return false;
    }

    deadline.check();
    throw std::logic_error("CaDiCaL stopped without an answer before the deadline");
}

bool SatSolver::model_value(int var) const {
    if (!has_model_) {
        throw std::logic_error("SatSolver::model_value called without a model");
    }
    if (var < 1 || var > static_cast<int>(model_.size())) {
        throw std::logic_error("SatSolver::model_value: variable " + std::to_string(var) + " out of range");
    }
    return model_[var - 1];
}

} // namespace cnfsolver
