/**
 * @file test_configuration_space.cc
 * @brief Tests for configurations, counts, backbones and atomic sets
 */

#include "ModelErrors.hh"
#include "cnfsolver/Deadline.hh"
#include "fmanalyzer/ConfigurationSpace.hh"
#include "fmanalyzer/ModelHandle.hh"

#include <gtest/gtest.h>

#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fmanalyzer;

namespace {

const std::string CAR_MODEL =
    "features\n"
    "    Car\n"
    "        mandatory\n"
    "            Engine\n"
    "        optional\n"
    "            GPS\n"
    "        alternative\n"
    "            Manual\n"
    "            Automatic\n"
    "constraints\n"
    "    GPS => Automatic\n";

const std::string CONTRADICTORY_MODEL =
    "features\n"
    "    R\n"
    "        optional\n"
    "            A\n"
    "constraints\n"
    "    A\n"
    "    !A\n";

std::shared_ptr<const ModelHandle> load(const std::string& text,
                                        uvl2cnf::ConversionMode mode = uvl2cnf::ConversionMode::STRAIGHTFORWARD) {
    return ModelHandle::parse(text, mode);
}

std::vector<std::string> names(std::initializer_list<const char*> list) {
    return std::vector<std::string>(list.begin(), list.end());
}

} // namespace

// ============================================================================
// Configuration
// ============================================================================

TEST(Configuration, SelectedFeatures) {
    auto feature_names = std::make_shared<const std::vector<std::string>>(names({"R", "A", "B"}));
    Configuration configuration(feature_names, {true, false, true});
    EXPECT_TRUE(configuration.is_selected("B"));
    EXPECT_FALSE(configuration.is_selected("A"));
    EXPECT_EQ(configuration.get_selected_features(), names({"R", "B"}));
    EXPECT_EQ(configuration.to_string(), "[R, B]");
    EXPECT_THROW(configuration.is_selected("C"), UnknownFeatureError);
}

TEST(Configuration, SizeMismatchIsInternalError) {
    auto feature_names = std::make_shared<const std::vector<std::string>>(names({"R", "A"}));
    EXPECT_THROW({
        Configuration configuration(feature_names, {true});
        (void)configuration;
    }, std::logic_error);
}

TEST(PartialConfiguration, ParsesLines) {
    PartialConfiguration criteria = parse_partial_configuration(
        "# criteria\n"
        "GPS,True\n"
        "\n"
        "Manual, false\n"
        "Engine,1\n");
    ASSERT_EQ(criteria.size(), 3u);
    EXPECT_TRUE(criteria.at("GPS"));
    EXPECT_FALSE(criteria.at("Manual"));
    EXPECT_TRUE(criteria.at("Engine"));
}

TEST(PartialConfiguration, RejectsMalformedLines) {
    EXPECT_THROW(parse_partial_configuration("GPS\n"), std::invalid_argument);
    EXPECT_THROW(parse_partial_configuration(",True\n"), std::invalid_argument);
    EXPECT_THROW(parse_partial_configuration("GPS,maybe\n"), std::invalid_argument);
    EXPECT_THROW(parse_partial_configuration("GPS,True\nGPS,False\n"), std::invalid_argument);
    EXPECT_NO_THROW(parse_partial_configuration("GPS,True\nGPS,true\n"));
}

// ============================================================================
// Satisfiability and validity
// ============================================================================

TEST(ConfigurationSpace, Satisfiability) {
    EXPECT_TRUE(load(CAR_MODEL)->get_configuration_space().is_satisfiable());
    EXPECT_FALSE(load(CONTRADICTORY_MODEL)->get_configuration_space().is_satisfiable());
}

TEST(ConfigurationSpace, ConfigurationValidity) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    EXPECT_TRUE(space.is_configuration_valid({"Car", "Engine", "Manual"}));
    EXPECT_TRUE(space.is_configuration_valid({"Car", "Engine", "GPS", "Automatic"}));
    // GPS requires Automatic
    EXPECT_FALSE(space.is_configuration_valid({"Car", "Engine", "GPS", "Manual"}));
    // Unlisted features are unselected, so the alternative group is empty
    EXPECT_FALSE(space.is_configuration_valid({"Car", "Engine"}));
    EXPECT_THROW(space.is_configuration_valid({"Car", "Wings"}), UnknownFeatureError);
}

// ============================================================================
// Enumeration
// ============================================================================

TEST(ConfigurationSpace, AllConfigurationsInCanonicalOrder) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    std::vector<Configuration> all = space.all_configurations();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].get_selected_features(), names({"Car", "Engine", "Automatic"}));
    EXPECT_EQ(all[1].get_selected_features(), names({"Car", "Engine", "Manual"}));
    EXPECT_EQ(all[2].get_selected_features(), names({"Car", "Engine", "GPS", "Automatic"}));
}

TEST(ConfigurationSpace, ConfigurationsAreDistinctAndValid) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    std::set<std::vector<bool>> seen;
    for (const auto& configuration : space.all_configurations()) {
        EXPECT_TRUE(seen.insert(configuration.get_values()).second);
        auto selected = configuration.get_selected_features();
        EXPECT_TRUE(space.is_configuration_valid(std::set<std::string>(selected.begin(), selected.end())));
    }
}

TEST(ConfigurationSpace, SequenceRestartsOnBegin) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    ConfigurationSequence sequence = space.configurations();
    std::size_t first = 0;
    for (const auto& configuration : sequence) {
        (void)configuration;
        ++first;
    }
    std::size_t second = 0;
    for (auto it = sequence.begin(); it != sequence.end(); ++it) {
        ++second;
    }
    EXPECT_EQ(first, 3u);
    EXPECT_EQ(second, 3u);
}

TEST(ConfigurationSpace, NextAfterExhaustion) {
    auto handle = load("features\n    R\n");
    const ConfigurationSpace& space = handle->get_configuration_space();
    ConfigurationSequence sequence = space.configurations();
    ASSERT_TRUE(sequence.next().has_value());
    EXPECT_FALSE(sequence.next().has_value());
    sequence.reset();
    EXPECT_TRUE(sequence.next().has_value());
}

TEST(ConfigurationSpace, UnsatisfiableHasNoConfigurations) {
    auto handle = load(CONTRADICTORY_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    EXPECT_TRUE(space.all_configurations().empty());
    EXPECT_EQ(space.count_configurations(), 0);
}

// ============================================================================
// Counting
// ============================================================================

TEST(ConfigurationSpace, CountMatchesEnumeration) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    EXPECT_EQ(space.count_configurations(), 3);
    EXPECT_EQ(space.count_configurations(), static_cast<long>(space.all_configurations().size()));
}

TEST(ConfigurationSpace, CountWithCriteria) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    PartialConfiguration criteria;
    criteria["Automatic"] = true;
    EXPECT_EQ(space.count_configurations(criteria), 2);
    criteria["GPS"] = false;
    EXPECT_EQ(space.count_configurations(criteria), 1);
}

TEST(ConfigurationSpace, TseitinModeGivesSameAnswers) {
    const std::string text =
        "features\n"
        "    R\n"
        "        optional\n"
        "            A\n"
        "            B\n"
        "            C\n"
        "constraints\n"
        "    (A & B) | C\n"
        "    !(A & C)\n";
    auto plain_handle = load(text);
    auto tseitin_handle = load(text, uvl2cnf::ConversionMode::TSEITIN);
    const ConfigurationSpace& plain = plain_handle->get_configuration_space();
    const ConfigurationSpace& tseitin = tseitin_handle->get_configuration_space();
    EXPECT_EQ(plain.count_configurations(), tseitin.count_configurations());
    EXPECT_EQ(plain.all_configurations(), tseitin.all_configurations());
}

// ============================================================================
// Sampling and filtering
// ============================================================================

TEST(ConfigurationSpace, SampleIsPrefixOfEnumeration) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    std::vector<Configuration> all = space.all_configurations();
    std::vector<Configuration> sample = space.sample_configurations(2);
    ASSERT_EQ(sample.size(), 2u);
    EXPECT_EQ(sample[0], all[0]);
    EXPECT_EQ(sample[1], all[1]);
    EXPECT_EQ(space.sample_configurations(10).size(), 3u);
}

TEST(ConfigurationSpace, SampleSizeMustBePositive) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    EXPECT_THROW(space.sample_configurations(0), std::invalid_argument);
    EXPECT_THROW(space.sample_configurations(-3), std::invalid_argument);
}

TEST(ConfigurationSpace, FilterKeepsMatchingConfigurations) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    PartialConfiguration criteria;
    criteria["Manual"] = false;
    std::vector<Configuration> filtered = space.filter_configurations(criteria);
    ASSERT_EQ(filtered.size(), 2u);
    for (const auto& configuration : filtered) {
        EXPECT_FALSE(configuration.is_selected("Manual"));
    }
}

TEST(ConfigurationSpace, FilterWithUnknownFeature) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    PartialConfiguration criteria;
    criteria["Wings"] = true;
    EXPECT_THROW(space.filter_configurations(criteria), UnknownFeatureError);
}

TEST(ConfigurationSpace, FilterWithImpossibleCriteria) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    PartialConfiguration criteria;
    criteria["GPS"] = true;
    criteria["Manual"] = true;
    EXPECT_TRUE(space.filter_configurations(criteria).empty());
}

// ============================================================================
// Backbone and atomic sets
// ============================================================================

TEST(ConfigurationSpace, Backbone) {
    auto handle = load(
        "features\n"
        "    R\n"
        "        mandatory\n"
        "            M\n"
        "        optional\n"
        "            O\n"
        "            D\n"
        "constraints\n"
        "    D => !M\n");
    const ConfigurationSpace& space = handle->get_configuration_space();
    Backbone backbone = space.compute_backbone();
    EXPECT_TRUE(backbone.satisfiable);
    EXPECT_EQ(backbone.core, names({"R", "M"}));
    EXPECT_EQ(backbone.dead, names({"D"}));
}

TEST(ConfigurationSpace, BackboneOfUnsatisfiableModel) {
    auto handle = load(CONTRADICTORY_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    Backbone backbone = space.compute_backbone();
    EXPECT_FALSE(backbone.satisfiable);
    EXPECT_TRUE(backbone.core.empty());
    EXPECT_EQ(backbone.dead, names({"R", "A"}));
}

TEST(ConfigurationSpace, AtomicSets) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    std::vector<std::vector<std::string>> expected = {
        names({"Car", "Engine"}), names({"GPS"}), names({"Manual"}), names({"Automatic"})};
    EXPECT_EQ(space.compute_atomic_sets(), expected);
}

TEST(ConfigurationSpace, AtomicSetsJoinEquivalentFeatures) {
    auto handle = load(
        "features\n"
        "    R\n"
        "        optional\n"
        "            A\n"
        "            B\n"
        "            C\n"
        "constraints\n"
        "    A <=> C\n");
    const ConfigurationSpace& space = handle->get_configuration_space();
    std::vector<std::vector<std::string>> expected = {names({"R"}), names({"A", "C"}), names({"B"})};
    EXPECT_EQ(space.compute_atomic_sets(), expected);
}

TEST(ConfigurationSpace, AtomicSetsOfUnsatisfiableModel) {
    EXPECT_TRUE(load(CONTRADICTORY_MODEL)->get_configuration_space().compute_atomic_sets().empty());
}

// ============================================================================
// Inclusion probabilities
// ============================================================================

TEST(ConfigurationSpace, InclusionProbabilities) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    std::vector<double> probabilities = space.inclusion_probabilities(1);
    ASSERT_EQ(probabilities.size(), 5u);
    EXPECT_DOUBLE_EQ(probabilities[0], 1.0);
    EXPECT_DOUBLE_EQ(probabilities[1], 1.0);
    EXPECT_DOUBLE_EQ(probabilities[2], 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(probabilities[3], 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(probabilities[4], 2.0 / 3.0);
}

TEST(ConfigurationSpace, InclusionProbabilitiesDoNotDependOnThreads) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    std::ostringstream progress;
    EXPECT_EQ(space.inclusion_probabilities(1), space.inclusion_probabilities(3, cnfsolver::Deadline(), &progress));
    EXPECT_EQ(space.inclusion_probabilities(1), space.inclusion_probabilities(8));
    EXPECT_NE(progress.str().find("of 5 features"), std::string::npos);
}

TEST(ConfigurationSpace, InclusionProbabilitiesOfUnsatisfiableModel) {
    auto handle = load(CONTRADICTORY_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    std::vector<double> expected = {0.0, 0.0};
    EXPECT_EQ(space.inclusion_probabilities(2), expected);
}

TEST(ConfigurationSpace, InclusionProbabilitiesNeedAThread) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    EXPECT_THROW(space.inclusion_probabilities(0), std::invalid_argument);
}

TEST(ConfigurationSpace, CancelledDeadlineInWorkers) {
    auto handle = load(CAR_MODEL);
    const ConfigurationSpace& space = handle->get_configuration_space();
    cnfsolver::Deadline deadline;
    deadline.cancel();
    EXPECT_THROW(space.inclusion_probabilities(2, deadline), cnfsolver::TimeoutError);
    EXPECT_THROW(space.count_configurations(deadline), cnfsolver::TimeoutError);
}

TEST(ConfigurationSpace, AlternativeAllowsExactlyOneChild) {
    auto handle = load(
        "features\n"
        "    Root\n"
        "        alternative\n"
        "            X\n"
        "            Y\n");
    const ConfigurationSpace& space = handle->get_configuration_space();
    std::vector<Configuration> all = space.all_configurations();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].get_selected_features(), names({"Root", "Y"}));
    EXPECT_EQ(all[1].get_selected_features(), names({"Root", "X"}));
    EXPECT_FALSE(space.is_configuration_valid({"Root", "X", "Y"}));
    EXPECT_FALSE(space.is_configuration_valid({"X"}));
}
