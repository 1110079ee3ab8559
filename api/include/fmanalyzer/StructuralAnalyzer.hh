/**
 * @file StructuralAnalyzer.hh
 * @brief Tree metrics and constraint-driven feature classifications
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef FMANALYZER_STRUCTURALANALYZER_H
#define FMANALYZER_STRUCTURALANALYZER_H

#include "cnfsolver/Deadline.hh"
#include "fmanalyzer/ModelHandle.hh"

#include <gmpxx.h>

#include <cstddef>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fmanalyzer {

/**
 * @class StructuralAnalyzer
 * @brief Answers the structural questions about one model
 *
 * Tree metrics (leaves, depth, branching factor, ancestors and the
 * configuration estimate) only read the feature tree. Classifications (core,
 * dead, variant, false-optional, atomic sets, unique features) and the
 * configuration-share metrics solve or count over the model's configuration
 * space, which is built on first use.
 *
 * Every list of feature names is in canonical feature order.
 *
 * @code
 * fmanalyzer::StructuralAnalyzer analyzer(handle);
 * auto core = analyzer.core_features();
 * double share = analyzer.commonality("GPS");
 * @endcode
 */
class StructuralAnalyzer {
private:
    std::shared_ptr<const ModelHandle> handle_;

public:
    explicit StructuralAnalyzer(std::shared_ptr<const ModelHandle> handle);

    // ------------------------------------------------------------------------
    // Tree metrics
    // ------------------------------------------------------------------------

    /**
     * @brief Features without children
     */
    std::vector<std::string> leaf_features() const;

    std::size_t count_leaves() const;

    /**
     * @brief Number of edges on the longest root-to-leaf path
     */
    std::size_t max_depth() const;

    /**
     * @brief Mean number of children over features that have children
     *
     * 0.0 when the root is the only feature.
     */
    double average_branching_factor() const;

    /**
     * @brief Parent of @p name, then its parent, up to the root
     *
     * @throws UnknownFeatureError if @p name is not a feature of the model
     */
    std::vector<std::string> feature_ancestors(const std::string& name) const;

    /**
     * @brief Number of configurations the tree allows when constraints are ignored
     *
     * Computed bottom-up: a selected feature allows the product, over its
     * groups, of the selections each group allows. Never less than the exact
     * count, and equal to it when the model has no constraints.
     */
    mpz_class estimate_configuration_count() const;

    // ------------------------------------------------------------------------
    // Classifications
    // ------------------------------------------------------------------------

    std::vector<std::string> core_features(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;
    std::vector<std::string> dead_features(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Features that are neither core nor dead
     */
    std::vector<std::string> variant_features(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Core features declared in an optional group
     */
    std::vector<std::string> false_optional_features(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    std::vector<std::vector<std::string>> atomic_sets(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Features alone in their atomic set
     */
    std::vector<std::string> unique_features(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    // ------------------------------------------------------------------------
    // Configuration shares
    // ------------------------------------------------------------------------

    /**
     * @brief Share of valid configurations that select @p name
     *
     * 0.0 for an unsatisfiable model.
     *
     * @throws UnknownFeatureError if @p name is not a feature of the model
     */
    double commonality(const std::string& name,
                       const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Mean, over unordered feature pairs, of the share of configurations
     *        in which both features have the same status
     *
     * 1.0 with fewer than two features, 0.0 for an unsatisfiable model.
     */
    double homogeneity(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Variant features over all features
     */
    double variability(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Commonality of every feature
     *
     * @param num_threads Worker threads used for counting
     * @param deadline Time limit
     * @param progress If not null, receives progress lines
     */
    std::map<std::string, double> feature_inclusion_probability(int num_threads = 1,
                                                                const cnfsolver::Deadline& deadline = cnfsolver::Deadline(),
                                                                std::ostream* progress = nullptr) const;

private:
    const FeatureModel& model() const { return handle_->get_model(); }
    const ConfigurationSpace& space() const { return handle_->get_configuration_space(); }

    mpz_class estimate_feature(const Feature& feature) const;
};

} // namespace fmanalyzer

#endif // FMANALYZER_STRUCTURALANALYZER_H
