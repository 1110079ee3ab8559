/**
 * @file test_sat_solver.cc
 * @brief Tests for the SAT solver wrapper, deadlines and backbone detection
 */

#include "cnfsolver/BackboneDetector.hh"
#include "cnfsolver/Deadline.hh"
#include "cnfsolver/SatSolver.hh"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace cnfsolver;

namespace {

// Pigeons p_i in holes h_j: variable (i - 1) * holes + j
std::vector<std::vector<int>> pigeonhole(int pigeons, int holes) {
    std::vector<std::vector<int>> clauses;
    auto var = [holes](int pigeon, int hole) { return (pigeon - 1) * holes + hole; };
    for (int i = 1; i <= pigeons; ++i) {
        std::vector<int> somewhere;
        for (int j = 1; j <= holes; ++j) {
            somewhere.push_back(var(i, j));
        }
        clauses.push_back(somewhere);
    }
    for (int j = 1; j <= holes; ++j) {
        for (int a = 1; a <= pigeons; ++a) {
            for (int b = a + 1; b <= pigeons; ++b) {
                clauses.push_back({-var(a, j), -var(b, j)});
            }
        }
    }
    return clauses;
}

bool satisfies(const std::vector<std::vector<int>>& clauses, const std::vector<bool>& model) {
    for (const auto& clause : clauses) {
        bool satisfied = false;
        for (int literal : clause) {
            bool value = model[std::abs(literal) - 1];
            if ((literal > 0) == value) {
                satisfied = true;
            }
        }
        if (!satisfied) {
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// SatSolver
// ============================================================================

TEST(SatSolver, EmptyFormulaIsSatisfiable) {
    SatSolver solver(3);
    EXPECT_TRUE(solver.solve());
    EXPECT_EQ(solver.get_model().size(), 3u);
}

TEST(SatSolver, ModelSatisfiesClauses) {
    std::vector<std::vector<int>> clauses = {{1, -2}, {2, 3}, {-1, -3}, {-3, 4}};
    SatSolver solver(4);
    ASSERT_TRUE(solver.add_clauses(clauses));
    ASSERT_TRUE(solver.solve());
    EXPECT_TRUE(satisfies(clauses, solver.get_model()));
}

TEST(SatSolver, UnitContradiction) {
    SatSolver solver(1);
    solver.add_clause({1});
    solver.add_clause({-1});
    EXPECT_FALSE(solver.solve());
    EXPECT_FALSE(solver.is_okay());
    EXPECT_FALSE(solver.solve({1}));
}

TEST(SatSolver, EmptyClauseIsUnsatisfiable) {
    SatSolver solver(2);
    EXPECT_FALSE(solver.add_clause({}));
    EXPECT_FALSE(solver.is_okay());
    EXPECT_FALSE(solver.solve());
}

TEST(SatSolver, FailedAssumptionKeepsSolverOkay) {
    SatSolver solver(3);
    solver.add_clauses({{-1, 2}, {-2, 3}});
    EXPECT_FALSE(solver.solve({1, -3}));
    EXPECT_TRUE(solver.is_okay());
    ASSERT_TRUE(solver.solve({1}));
    EXPECT_TRUE(solver.model_value(3));
}

TEST(SatSolver, NewVariablesExtendModel) {
    SatSolver solver;
    EXPECT_EQ(solver.new_var(), 1);
    EXPECT_EQ(solver.new_var(), 2);
    solver.add_clause({-1, 5});
    EXPECT_EQ(solver.get_num_vars(), 5);
    ASSERT_TRUE(solver.solve({1}));
    EXPECT_EQ(solver.get_model().size(), 5u);
    EXPECT_TRUE(solver.model_value(5));
}

TEST(SatSolver, PigeonholeIsUnsatisfiable) {
    SatSolver solver;
    solver.add_clauses(pigeonhole(5, 4));
    EXPECT_FALSE(solver.solve());
}

TEST(SatSolver, PigeonholeWithEnoughHoles) {
    auto clauses = pigeonhole(4, 4);
    SatSolver solver;
    solver.add_clauses(clauses);
    ASSERT_TRUE(solver.solve());
    EXPECT_TRUE(satisfies(clauses, solver.get_model()));
}

TEST(SatSolver, AssumptionsDoNotPersist) {
    SatSolver solver(2);
    solver.add_clause({1, 2});
    EXPECT_FALSE(solver.solve({-1, -2}));
    EXPECT_TRUE(solver.is_okay());
    ASSERT_TRUE(solver.solve({-1}));
    EXPECT_FALSE(solver.model_value(1));
    EXPECT_TRUE(solver.model_value(2));
    EXPECT_TRUE(solver.solve());
}

TEST(SatSolver, ClausesBetweenSolves) {
    SatSolver solver(2);
    solver.add_clause({1, 2});
    ASSERT_TRUE(solver.solve());
    solver.add_clause({-1});
    ASSERT_TRUE(solver.solve());
    EXPECT_TRUE(solver.model_value(2));
    solver.add_clause({-2});
    EXPECT_FALSE(solver.solve());
}

TEST(SatSolver, SameCallsGiveSameModel) {
    auto clauses = pigeonhole(4, 5);
    SatSolver first;
    SatSolver second;
    first.add_clauses(clauses);
    second.add_clauses(clauses);
    ASSERT_TRUE(first.solve());
    ASSERT_TRUE(second.solve());
    EXPECT_EQ(first.get_model(), second.get_model());
}

TEST(SatSolver, InvalidLiterals) {
    SatSolver solver(2);
    EXPECT_THROW(solver.add_clause({1, 0}), std::invalid_argument);
    EXPECT_THROW(solver.solve({3}), std::invalid_argument);
}

TEST(SatSolver, NoModelAfterUnsat) {
    SatSolver solver(1);
    solver.add_clause({1});
    EXPECT_FALSE(solver.solve({-1}));
    EXPECT_THROW(solver.model_value(1), std::logic_error);
}

// ============================================================================
// Deadline
// ============================================================================

TEST(Deadline, DefaultNeverExpires) {
    Deadline deadline;
    EXPECT_FALSE(deadline.has_limit());
    EXPECT_FALSE(deadline.expired());
    EXPECT_NO_THROW(deadline.check());
    EXPECT_FALSE(Deadline::from_timeout_ms(0).has_limit());
}

TEST(Deadline, CancelReachesCopies) {
    Deadline deadline;
    Deadline copy = deadline;
    deadline.cancel();
    EXPECT_TRUE(copy.expired());
    EXPECT_THROW(copy.check(), TimeoutError);
}

TEST(Deadline, PastDeadlineExpires) {
    Deadline deadline = Deadline::after(std::chrono::milliseconds(-1));
    EXPECT_TRUE(deadline.expired());
}

TEST(Deadline, ExpiredDeadlineStopsSolver) {
    SatSolver solver;
    solver.add_clauses(pigeonhole(4, 5));
    Deadline deadline;
    deadline.cancel();
    EXPECT_THROW(solver.solve(deadline), TimeoutError);
    // The solver stays usable afterwards
    EXPECT_TRUE(solver.solve());
}

TEST(Deadline, ShortDeadlineInterruptsHardInstance) {
    SatSolver solver;
    solver.add_clauses(pigeonhole(12, 11));
    Deadline deadline = Deadline::after(std::chrono::milliseconds(20));
    EXPECT_THROW(solver.solve(deadline), TimeoutError);
    EXPECT_TRUE(solver.is_okay());
}

// ============================================================================
// BackboneDetector
// ============================================================================

TEST(BackboneDetector, FindsFixedLiterals) {
    // 1 is forced, 1 => 2, 3 free, 4 excluded by 1
    BackboneDetector detector(4, {{1}, {-1, 2}, {-1, -4}});
    BackboneResult result = detector.compute({1, 2, 3, 4});
    ASSERT_TRUE(result.satisfiable);
    std::vector<int> expected = {1, 2, -4};
    EXPECT_EQ(result.backbone, expected);
}

TEST(BackboneDetector, RestrictedToCandidates) {
    BackboneDetector detector(3, {{1}, {2}});
    BackboneResult result = detector.compute({2, 3});
    std::vector<int> expected = {2};
    EXPECT_EQ(result.backbone, expected);
}

TEST(BackboneDetector, UnderAssumptions) {
    BackboneDetector detector(3, {{-1, 2}, {-2, 3}});
    BackboneResult result = detector.compute({2, 3}, {1});
    ASSERT_TRUE(result.satisfiable);
    std::vector<int> expected = {2, 3};
    EXPECT_EQ(result.backbone, expected);
}

TEST(BackboneDetector, Unsatisfiable) {
    BackboneDetector detector(1, {{1}, {-1}});
    BackboneResult result = detector.compute({1});
    EXPECT_FALSE(result.satisfiable);
    EXPECT_TRUE(result.backbone.empty());
}
