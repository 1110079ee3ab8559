/**
 * @file test_enumeration.cc
 * @brief Tests for projected solution enumeration
 */

#include "cnfsolver/Deadline.hh"
#include "cnfsolver/SolutionEnumerator.hh"

#include <gtest/gtest.h>

#include <vector>

using namespace cnfsolver;

namespace {

std::vector<std::vector<bool>> collect(SolutionEnumerator& enumerator) {
    std::vector<std::vector<bool>> solutions;
    std::vector<bool> solution;
    while (enumerator.next(solution)) {
        solutions.push_back(solution);
    }
    return solutions;
}

} // namespace

TEST(SolutionEnumerator, LexicographicOrder) {
    SolutionEnumerator enumerator(3, {{1}}, {1, 2, 3});
    std::vector<std::vector<bool>> expected = {
        {true, false, false}, {true, false, true}, {true, true, false}, {true, true, true}};
    EXPECT_EQ(collect(enumerator), expected);
    EXPECT_EQ(enumerator.get_num_solutions(), 4u);
}

TEST(SolutionEnumerator, OrderFollowsProjection) {
    SolutionEnumerator enumerator(2, {{1, 2}}, {2, 1});
    std::vector<std::vector<bool>> expected = {{false, true}, {true, false}, {true, true}};
    EXPECT_EQ(collect(enumerator), expected);
}

TEST(SolutionEnumerator, ProjectionHidesAuxiliaryVariables) {
    // 3 <=> (1 & 2); projected on {1, 2} every assignment appears once
    std::vector<std::vector<int>> clauses = {{-3, 1}, {-3, 2}, {3, -1, -2}};
    SolutionEnumerator enumerator(3, clauses, {1, 2});
    EXPECT_EQ(collect(enumerator).size(), 4u);
}

TEST(SolutionEnumerator, ProjectionMergesDistinctExtensions) {
    // 3 is free: without projection there would be 2 models per assignment
    SolutionEnumerator enumerator(3, {{1, 2}}, {1, 2});
    EXPECT_EQ(collect(enumerator).size(), 3u);
}

TEST(SolutionEnumerator, Assumptions) {
    SolutionEnumerator enumerator(3, {{1, 2, 3}}, {1, 2, 3}, {-1, 2});
    std::vector<std::vector<bool>> expected = {{false, true, false}, {false, true, true}};
    EXPECT_EQ(collect(enumerator), expected);
}

TEST(SolutionEnumerator, Unsatisfiable) {
    SolutionEnumerator enumerator(1, {{1}, {-1}}, {1});
    std::vector<bool> solution;
    EXPECT_FALSE(enumerator.next(solution));
    EXPECT_FALSE(enumerator.next(solution));
}

TEST(SolutionEnumerator, ExhaustedStaysExhausted) {
    SolutionEnumerator enumerator(1, {{1}}, {1});
    std::vector<bool> solution;
    EXPECT_TRUE(enumerator.next(solution));
    EXPECT_FALSE(enumerator.next(solution));
    EXPECT_FALSE(enumerator.next(solution));
}

TEST(SolutionEnumerator, ResetRepeatsSequence) {
    SolutionEnumerator enumerator(3, {{1, -2}, {2, 3}}, {1, 2, 3});
    auto first = collect(enumerator);
    enumerator.reset();
    EXPECT_EQ(enumerator.get_num_solutions(), 0u);
    EXPECT_EQ(collect(enumerator), first);
}

TEST(SolutionEnumerator, EmptyProjection) {
    SolutionEnumerator enumerator(2, {{1, 2}}, {});
    std::vector<bool> solution;
    EXPECT_TRUE(enumerator.next(solution));
    EXPECT_TRUE(solution.empty());
    EXPECT_FALSE(enumerator.next(solution));
}

TEST(SolutionEnumerator, CancelledDeadline) {
    Deadline deadline;
    SolutionEnumerator enumerator(2, {{1, 2}}, {1, 2}, {}, deadline);
    deadline.cancel();
    std::vector<bool> solution;
    EXPECT_THROW(enumerator.next(solution), TimeoutError);
}
