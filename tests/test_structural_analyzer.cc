/**
 * @file test_structural_analyzer.cc
 * @brief Tests for tree metrics, feature classifications and shares
 */

#include "ModelErrors.hh"
#include "cnfsolver/Deadline.hh"
#include "fmanalyzer/StructuralAnalyzer.hh"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace fmanalyzer;

namespace {

StructuralAnalyzer analyze(const std::string& text) {
    return StructuralAnalyzer(ModelHandle::parse(text));
}

std::vector<std::string> names(std::initializer_list<const char*> list) {
    return std::vector<std::string>(list.begin(), list.end());
}

const std::string OPTIONAL_MODEL =
    "features\n"
    "    Root\n"
    "        optional\n"
    "            A\n";

const std::string CAR_MODEL =
    "features\n"
    "    Car\n"
    "        mandatory\n"
    "            Engine\n"
    "                alternative\n"
    "                    Petrol\n"
    "                    Electric\n"
    "        optional\n"
    "            GPS\n"
    "            Radio\n"
    "constraints\n"
    "    GPS => Electric\n";

const std::string CONTRADICTORY_MODEL =
    "features\n"
    "    Root\n"
    "        optional\n"
    "            A\n"
    "constraints\n"
    "    A\n"
    "    !A\n";

} // namespace

// ============================================================================
// Tree metrics
// ============================================================================

TEST(StructuralAnalyzer, Leaves) {
    StructuralAnalyzer analyzer = analyze(CAR_MODEL);
    EXPECT_EQ(analyzer.leaf_features(), names({"GPS", "Radio", "Petrol", "Electric"}));
    EXPECT_EQ(analyzer.count_leaves(), 4u);
}

TEST(StructuralAnalyzer, SingleFeatureIsALeaf) {
    StructuralAnalyzer analyzer = analyze("features\n    Root\n");
    EXPECT_EQ(analyzer.leaf_features(), names({"Root"}));
    EXPECT_EQ(analyzer.max_depth(), 0u);
    EXPECT_DOUBLE_EQ(analyzer.average_branching_factor(), 0.0);
}

TEST(StructuralAnalyzer, MaxDepth) {
    EXPECT_EQ(analyze(OPTIONAL_MODEL).max_depth(), 1u);
    EXPECT_EQ(analyze(CAR_MODEL).max_depth(), 2u);
}

TEST(StructuralAnalyzer, AverageBranchingFactor) {
    // Car has 3 children, Engine has 2
    EXPECT_DOUBLE_EQ(analyze(CAR_MODEL).average_branching_factor(), 2.5);
}

TEST(StructuralAnalyzer, AncestorsNearestFirst) {
    StructuralAnalyzer analyzer = analyze(CAR_MODEL);
    EXPECT_EQ(analyzer.feature_ancestors("Petrol"), names({"Engine", "Car"}));
    EXPECT_TRUE(analyzer.feature_ancestors("Car").empty());
    EXPECT_THROW(analyzer.feature_ancestors("Wings"), UnknownFeatureError);
}

// ============================================================================
// Estimated configuration count
// ============================================================================

TEST(StructuralAnalyzer, EstimateIgnoresConstraints) {
    StructuralAnalyzer analyzer = analyze(CAR_MODEL);
    // Engine: 2, GPS: 2, Radio: 2
    EXPECT_EQ(analyzer.estimate_configuration_count(), 8);
}

TEST(StructuralAnalyzer, EstimateIsExactWithoutConstraints) {
    const std::string text =
        "features\n"
        "    R\n"
        "        or\n"
        "            A\n"
        "                optional\n"
        "                    A1\n"
        "            B\n"
        "        [2..3]\n"
        "            C\n"
        "            D\n"
        "            E\n"
        "            F\n";
    auto handle = ModelHandle::parse(text);
    StructuralAnalyzer analyzer(handle);
    // or: (2 + 1) * (1 + 1) - 1 = 5, [2..3] of 4: 6 + 4 = 10
    EXPECT_EQ(analyzer.estimate_configuration_count(), 50);
    EXPECT_EQ(analyzer.estimate_configuration_count(), handle->get_configuration_space().count_configurations());
}

TEST(StructuralAnalyzer, EstimateBoundsCount) {
    auto handle = ModelHandle::parse(CAR_MODEL);
    StructuralAnalyzer analyzer(handle);
    EXPECT_GE(analyzer.estimate_configuration_count(), handle->get_configuration_space().count_configurations());
}

// ============================================================================
// Classifications
// ============================================================================

TEST(StructuralAnalyzer, OptionalChildScenario) {
    StructuralAnalyzer analyzer = analyze(OPTIONAL_MODEL);
    EXPECT_EQ(analyzer.core_features(), names({"Root"}));
    EXPECT_TRUE(analyzer.dead_features().empty());
    EXPECT_EQ(analyzer.variant_features(), names({"A"}));
    EXPECT_TRUE(analyzer.false_optional_features().empty());
    EXPECT_DOUBLE_EQ(analyzer.commonality("A"), 0.5);
    EXPECT_DOUBLE_EQ(analyzer.commonality("Root"), 1.0);
}

TEST(StructuralAnalyzer, AlternativeScenario) {
    StructuralAnalyzer analyzer = analyze(
        "features\n"
        "    Root\n"
        "        alternative\n"
        "            X\n"
        "            Y\n");
    EXPECT_EQ(analyzer.core_features(), names({"Root"}));
    EXPECT_EQ(analyzer.variant_features(), names({"X", "Y"}));
    EXPECT_DOUBLE_EQ(analyzer.commonality("X"), 0.5);
    std::vector<std::vector<std::string>> expected = {names({"Root"}), names({"X"}), names({"Y"})};
    EXPECT_EQ(analyzer.atomic_sets(), expected);
    EXPECT_EQ(analyzer.unique_features(), names({"Root", "X", "Y"}));
}

TEST(StructuralAnalyzer, FalseOptionalThroughConstraint) {
    StructuralAnalyzer analyzer = analyze(
        "features\n"
        "    Root\n"
        "        mandatory\n"
        "            M\n"
        "        optional\n"
        "            A\n"
        "            B\n"
        "constraints\n"
        "    M => A\n");
    EXPECT_EQ(analyzer.core_features(), names({"Root", "M", "A"}));
    EXPECT_EQ(analyzer.false_optional_features(), names({"A"}));
    EXPECT_EQ(analyzer.variant_features(), names({"B"}));
}

TEST(StructuralAnalyzer, DeadFeature) {
    StructuralAnalyzer analyzer = analyze(CAR_MODEL + "    GPS => Petrol\n");
    EXPECT_EQ(analyzer.dead_features(), names({"GPS"}));
    EXPECT_EQ(analyzer.variant_features(), names({"Radio", "Petrol", "Electric"}));
}

TEST(StructuralAnalyzer, UniqueFeatures) {
    StructuralAnalyzer analyzer = analyze(CAR_MODEL);
    std::vector<std::vector<std::string>> expected = {
        names({"Car", "Engine"}), names({"GPS"}), names({"Radio"}), names({"Petrol"}), names({"Electric"})};
    EXPECT_EQ(analyzer.atomic_sets(), expected);
    EXPECT_EQ(analyzer.unique_features(), names({"GPS", "Radio", "Petrol", "Electric"}));
}

TEST(StructuralAnalyzer, ContradictoryConstraints) {
    StructuralAnalyzer analyzer = analyze(CONTRADICTORY_MODEL);
    EXPECT_TRUE(analyzer.core_features().empty());
    EXPECT_EQ(analyzer.dead_features(), names({"Root", "A"}));
    EXPECT_TRUE(analyzer.variant_features().empty());
    EXPECT_TRUE(analyzer.atomic_sets().empty());
    EXPECT_TRUE(analyzer.unique_features().empty());
    EXPECT_DOUBLE_EQ(analyzer.commonality("A"), 0.0);
    EXPECT_DOUBLE_EQ(analyzer.homogeneity(), 0.0);
    EXPECT_DOUBLE_EQ(analyzer.variability(), 0.0);
}

// ============================================================================
// Shares
// ============================================================================

TEST(StructuralAnalyzer, CommonalityOfUnknownFeature) {
    StructuralAnalyzer analyzer = analyze(OPTIONAL_MODEL);
    EXPECT_THROW(analyzer.commonality("Missing"), UnknownFeatureError);
}

TEST(StructuralAnalyzer, CommonalityMatchesEnumeration) {
    auto handle = ModelHandle::parse(CAR_MODEL);
    StructuralAnalyzer analyzer(handle);
    auto all = handle->get_configuration_space().all_configurations();
    for (const auto& name : handle->get_configuration_space().get_feature_names()) {
        std::size_t selected = 0;
        for (const auto& configuration : all) {
            if (configuration.is_selected(name)) {
                ++selected;
            }
        }
        EXPECT_DOUBLE_EQ(analyzer.commonality(name),
                         static_cast<double>(selected) / static_cast<double>(all.size())) << name;
    }
}

TEST(StructuralAnalyzer, Homogeneity) {
    // One pair (Root, A) agreeing in one of two configurations
    EXPECT_DOUBLE_EQ(analyze(OPTIONAL_MODEL).homogeneity(), 0.5);
    EXPECT_DOUBLE_EQ(analyze("features\n    Root\n").homogeneity(), 1.0);
}

TEST(StructuralAnalyzer, HomogeneityOfUnsatisfiableSingleFeature) {
    StructuralAnalyzer analyzer = analyze(
        "features\n"
        "    Root\n"
        "constraints\n"
        "    !Root\n");
    EXPECT_DOUBLE_EQ(analyzer.homogeneity(), 0.0);
}

TEST(StructuralAnalyzer, HomogeneityMatchesEnumeration) {
    auto handle = ModelHandle::parse(CAR_MODEL);
    StructuralAnalyzer analyzer(handle);
    auto all = handle->get_configuration_space().all_configurations();
    std::size_t n = handle->get_configuration_space().get_feature_names().size();

    std::size_t agreements = 0;
    for (const auto& configuration : all) {
        const auto& values = configuration.get_values();
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j) {
                if (values[i] == values[j]) {
                    ++agreements;
                }
            }
        }
    }
    double expected = static_cast<double>(agreements) / static_cast<double>(all.size() * n * (n - 1) / 2);
    EXPECT_NEAR(analyzer.homogeneity(), expected, 1e-12);
}

TEST(StructuralAnalyzer, Variability) {
    EXPECT_DOUBLE_EQ(analyze(OPTIONAL_MODEL).variability(), 0.5);
    // GPS, Radio, Petrol and Electric vary; Car and Engine do not
    EXPECT_DOUBLE_EQ(analyze(CAR_MODEL).variability(), 4.0 / 6.0);
}

TEST(StructuralAnalyzer, FeatureInclusionProbability) {
    StructuralAnalyzer analyzer = analyze(OPTIONAL_MODEL);
    auto probabilities = analyzer.feature_inclusion_probability(2);
    ASSERT_EQ(probabilities.size(), 2u);
    EXPECT_DOUBLE_EQ(probabilities.at("Root"), 1.0);
    EXPECT_DOUBLE_EQ(probabilities.at("A"), 0.5);
}

TEST(StructuralAnalyzer, CancelledDeadline) {
    StructuralAnalyzer analyzer = analyze(CAR_MODEL);
    cnfsolver::Deadline deadline;
    deadline.cancel();
    EXPECT_THROW(analyzer.core_features(deadline), cnfsolver::TimeoutError);
    EXPECT_THROW(analyzer.commonality("GPS", deadline), cnfsolver::TimeoutError);
    // Tree metrics never solve
    EXPECT_NO_THROW(analyzer.max_depth());
}
