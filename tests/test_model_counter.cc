/**
 * @file test_model_counter.cc
 * @brief Tests for exact model counting
 */

#include "cnfsolver/Deadline.hh"
#include "cnfsolver/ModelCounter.hh"
#include "cnfsolver/SolutionEnumerator.hh"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace cnfsolver;

namespace {

// Brute-force count over every assignment of num_vars variables
mpz_class brute_force(int num_vars, const std::vector<std::vector<int>>& clauses) {
    mpz_class total = 0;
    for (unsigned long mask = 0; mask < (1ul << num_vars); ++mask) {
        bool ok = true;
        for (const auto& clause : clauses) {
            bool satisfied = false;
            for (int literal : clause) {
                int var = literal > 0 ? literal : -literal;
                bool value = (mask >> (var - 1)) & 1ul;
                if ((literal > 0) == value) {
                    satisfied = true;
                    break;
                }
            }
            if (!satisfied) {
                ok = false;
                break;
            }
        }
        if (ok) {
            total += 1;
        }
    }
    return total;
}

} // namespace

// ============================================================================
// Basic counts
// ============================================================================

TEST(ModelCounter, NoClauses) {
    ModelCounter counter(5, {});
    EXPECT_EQ(counter.count(), 32);
}

TEST(ModelCounter, ZeroVariables) {
    ModelCounter counter(0, {});
    EXPECT_EQ(counter.count(), 1);
}

TEST(ModelCounter, UnitClausesAndFreeVariables) {
    ModelCounter counter(4, {{1}, {-2}});
    EXPECT_EQ(counter.count(), 4);
}

TEST(ModelCounter, Unsatisfiable) {
    ModelCounter counter(2, {{1}, {-1, 2}, {-2}});
    EXPECT_EQ(counter.count(), 0);
}

TEST(ModelCounter, EmptyClause) {
    std::vector<std::vector<int>> clauses = {{1, 2}, std::vector<int>()};
    ModelCounter counter(2, clauses);
    EXPECT_EQ(counter.count(), 0);
}

TEST(ModelCounter, IndependentComponents) {
    // (1 | 2) has 3 models, (3 | 4) has 3 models, 5 is free
    ModelCounter counter(5, {{1, 2}, {3, 4}});
    EXPECT_EQ(counter.count(), 18);
}

TEST(ModelCounter, MatchesBruteForce) {
    std::vector<std::vector<int>> clauses = {
        {1, 2, -3}, {-1, 4}, {2, 5, 6}, {-4, -5}, {3, -6, 7}, {-2, -7, 8}, {1, -8}, {-3, -4, 6}};
    ModelCounter counter(9, clauses);
    EXPECT_EQ(counter.count(), brute_force(9, clauses));
}

TEST(ModelCounter, LargeCountsAreExact) {
    // 100 free variables beyond the first
    ModelCounter counter(101, {{1}});
    mpz_class expected;
    mpz_ui_pow_ui(expected.get_mpz_t(), 2, 100);
    EXPECT_EQ(counter.count(), expected);
}

// ============================================================================
// Assumptions
// ============================================================================

TEST(ModelCounter, WithAssumptions) {
    std::vector<std::vector<int>> clauses = {{1, 2}, {-1, 3}};
    ModelCounter counter(3, clauses);
    EXPECT_EQ(counter.count(), 4);
    EXPECT_EQ(counter.count({1}), 1);
    EXPECT_EQ(counter.count({-1}), 2);
    EXPECT_EQ(counter.count({1, -3}), 0);
}

TEST(ModelCounter, CountsAgreeWithEnumeration) {
    std::vector<std::vector<int>> clauses = {{1}, {-1, 2, 3}, {-2, -3}, {-4, 1}, {-5, 4}};
    ModelCounter counter(5, clauses);
    SolutionEnumerator enumerator(5, clauses, {1, 2, 3, 4, 5});
    std::vector<bool> solution;
    mpz_class enumerated = 0;
    while (enumerator.next(solution)) {
        enumerated += 1;
    }
    EXPECT_EQ(counter.count(), enumerated);
}

TEST(ModelCounter, RepeatedCallsAgree) {
    std::vector<std::vector<int>> clauses = {{1, 2}, {2, 3}, {3, 4}, {4, 5}};
    ModelCounter counter(5, clauses);
    mpz_class first = counter.count();
    EXPECT_EQ(counter.count(), first);
    EXPECT_EQ(first, brute_force(5, clauses));
}

TEST(ModelCounter, InvalidAssumption) {
    ModelCounter counter(2, {{1, 2}});
    EXPECT_THROW(counter.count({3}), std::invalid_argument);
    EXPECT_THROW(counter.count({0}), std::invalid_argument);
}

TEST(ModelCounter, CancelledDeadline) {
    ModelCounter counter(3, {{1, 2}, {2, 3}});
    Deadline deadline;
    deadline.cancel();
    EXPECT_THROW(counter.count({}, deadline), TimeoutError);
}
