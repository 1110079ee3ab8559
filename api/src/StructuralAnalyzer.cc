/**
 * @file StructuralAnalyzer.cc
 * @brief Implementation of the structural analyses
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "fmanalyzer/StructuralAnalyzer.hh"
#include "cnfsolver/ModelCounter.hh"

#include <algorithm>
#include <set>

namespace fmanalyzer {

namespace {

double ratio(const mpz_class& numerator, const mpz_class& denominator) {
    mpq_class value(numerator, denominator);
    value.canonicalize();
    return value.get_d();
}

} // namespace

StructuralAnalyzer::StructuralAnalyzer(std::shared_ptr<const ModelHandle> handle)
    : handle_(std::move(handle)) {}

// ============================================================================
// Tree metrics
// ============================================================================

std::vector<std::string> StructuralAnalyzer::leaf_features() const {
    std::vector<std::string> leaves;
    for (const auto& feature : model().get_features()) {
        if (feature->is_leaf()) {
            leaves.push_back(feature->get_name());
        }
    }
    return leaves;
}

std::size_t StructuralAnalyzer::count_leaves() const {
    return leaf_features().size();
}

std::size_t StructuralAnalyzer::max_depth() const {
    std::size_t depth = 0;
    for (const auto& feature : model().get_features()) {
        depth = std::max(depth, model().depth_of(feature->get_name()));
    }
    return depth;
}

/**
 * @brief Mean number of children over the features that have any
 * @return 0.0 for a model that is only a root
 */
double StructuralAnalyzer::average_branching_factor() const {
    std::size_t parents = 0;
    std::size_t children = 0;
    for (const auto& feature : model().get_features()) {
        if (!feature->is_leaf()) {
            ++parents;
            children += feature->get_children().size();
        }
    }
    if (parents == 0) {
        return 0.0;
    }
    return static_cast<double>(children) / static_cast<double>(parents);
}

/**
 * @brief Ancestors of @p name from its parent up to the root
 * @throws UnknownFeatureError if @p name is not a feature of the model
 */
std::vector<std::string> StructuralAnalyzer::feature_ancestors(const std::string& name) const {
    std::vector<std::string> ancestors;
    std::shared_ptr<Feature> parent = model().get_feature(name)->get_parent();
    while (parent) {
        ancestors.push_back(parent->get_name());
        parent = parent->get_parent();
    }
    return ancestors;
}

mpz_class StructuralAnalyzer::estimate_configuration_count() const {
    return estimate_feature(*model().get_root());
}

/**
 * @brief Number of selections of the subtree of @p feature, given the feature
 *        is selected, with cross-tree constraints ignored
 *
 * Relations of one feature are independent, so their choice counts multiply.
 * A cardinality group adds the elementary symmetric sums of its children's
 * estimates for every allowed group size.
 */
mpz_class StructuralAnalyzer::estimate_feature(const Feature& feature) const {
    mpz_class product = 1;
    for (const auto& relation : feature.get_relations()) {
        std::vector<mpz_class> children;
        for (const auto& child : relation->get_children()) {
            children.push_back(estimate_feature(*child));
        }

        mpz_class choices = 0;
        switch (relation->get_type()) {
            case Relation::Type::MANDATORY:
                choices = children.front();
                break;
            case Relation::Type::OPTIONAL:
                choices = children.front() + 1;
                break;
            case Relation::Type::OR: {
                mpz_class all = 1;
                for (const auto& count : children) {
                    all *= count + 1;
                }
                choices = all - 1;
                break;
            }
            case Relation::Type::ALTERNATIVE:
                for (const auto& count : children) {
                    choices += count;
                }
                break;
            case Relation::Type::CARDINALITY: {
                // sums[k]: ways to select exactly k children
                std::vector<mpz_class> sums(children.size() + 1, 0);
                sums[0] = 1;
                for (const auto& count : children) {
                    for (std::size_t k = sums.size() - 1; k > 0; --k) {
                        sums[k] += sums[k - 1] * count;
                    }
                }
                int upper = std::min(relation->get_card_max(), static_cast<int>(children.size()));
                for (int k = std::max(relation->get_card_min(), 0); k <= upper; ++k) {
                    choices += sums[k];
                }
                break;
            }
        }
        product *= choices;
    }
    return product;
}

// ============================================================================
// Classifications
// ============================================================================

std::vector<std::string> StructuralAnalyzer::core_features(const cnfsolver::Deadline& deadline) const {
    return space().compute_backbone(deadline).core;
}

std::vector<std::string> StructuralAnalyzer::dead_features(const cnfsolver::Deadline& deadline) const {
    return space().compute_backbone(deadline).dead;
}

/**
 * @brief Features that are neither core nor dead, in canonical order
 */
std::vector<std::string> StructuralAnalyzer::variant_features(const cnfsolver::Deadline& deadline) const {
    Backbone backbone = space().compute_backbone(deadline);
    std::set<std::string> fixed(backbone.core.begin(), backbone.core.end());
    fixed.insert(backbone.dead.begin(), backbone.dead.end());

    std::vector<std::string> variant;
    for (const auto& name : space().get_feature_names()) {
        if (fixed.count(name) == 0) {
            variant.push_back(name);
        }
    }
    return variant;
}

/**
 * @brief Core features that are declared in an optional group
 *
 * Or and alternative groups are not optional declarations, so their
 * children never count as false-optional.
 *
 * @throws cnfsolver::TimeoutError if the deadline expires
 */
std::vector<std::string> StructuralAnalyzer::false_optional_features(const cnfsolver::Deadline& deadline) const {
    std::set<std::string> optional;
    for (const auto& relation : model().get_relations()) {
        if (relation->is_optional()) {
            for (const auto& child : relation->get_children()) {
                optional.insert(child->get_name());
            }
        }
    }

    std::vector<std::string> false_optional;
    for (const auto& name : core_features(deadline)) {
        if (optional.count(name) > 0) {
            false_optional.push_back(name);
        }
    }
    return false_optional;
}

std::vector<std::vector<std::string>> StructuralAnalyzer::atomic_sets(const cnfsolver::Deadline& deadline) const {
    return space().compute_atomic_sets(deadline);
}

std::vector<std::string> StructuralAnalyzer::unique_features(const cnfsolver::Deadline& deadline) const {
    std::vector<std::string> unique;
    for (const auto& atomic_set : atomic_sets(deadline)) {
        if (atomic_set.size() == 1) {
            unique.push_back(atomic_set.front());
        }
    }
    return unique;
}

// ============================================================================
// Configuration shares
// ============================================================================

/**
 * @brief Share of configurations that select @p name
 *
 * @return 0.0 for an unsatisfiable model
 * @throws UnknownFeatureError if @p name is not a feature of the model
 * @throws cnfsolver::TimeoutError if the deadline expires
 */
double StructuralAnalyzer::commonality(const std::string& name, const cnfsolver::Deadline& deadline) const {
    int var = space().variable_of(name);
    const CNFModel& cnf = space().get_cnf();

    cnfsolver::ModelCounter counter(cnf.get_num_variables(), cnf.get_clauses());
    mpz_class total = counter.count({}, deadline);
    if (total == 0) {
        return 0.0;
    }
    return ratio(counter.count({var}, deadline), total);
}

/**
 * @brief Mean over feature pairs of the share of configurations in which the
 *        two features are both selected or both unselected
 *
 * For a pair (i, j) that share is (2 * both + total - c_i - c_j) / total,
 * with c_i the configurations selecting i. Core and dead features make the
 * pairwise count available without another counter call.
 *
 * @return 0.0 for an unsatisfiable model, 1.0 for a single feature
 * @throws cnfsolver::TimeoutError if the deadline expires
 */
double StructuralAnalyzer::homogeneity(const cnfsolver::Deadline& deadline) const {
    const ConfigurationSpace& configurations = space();
    int n = configurations.get_num_features();

    const CNFModel& cnf = configurations.get_cnf();
    cnfsolver::ModelCounter counter(cnf.get_num_variables(), cnf.get_clauses());
    mpz_class total = counter.count({}, deadline);
    if (total == 0) {
        return 0.0;
    }
    if (n < 2) {
        return 1.0;
    }

    std::vector<mpz_class> selected(n);
    for (int var = 1; var <= n; ++var) {
        selected[var - 1] = counter.count({var}, deadline);
    }

    // Configurations where a pair agrees: both selected plus both unselected
    mpz_class agreements = 0;
    for (int i = 1; i <= n; ++i) {
        for (int j = i + 1; j <= n; ++j) {
            const mpz_class& first = selected[i - 1];
            const mpz_class& second = selected[j - 1];

            mpz_class both;
            if (first == 0 || second == 0) {
                both = 0;
            } else if (first == total) {
                both = second;
            } else if (second == total) {
                both = first;
            } else {
                both = counter.count({i, j}, deadline);
            }
            agreements += both + (total - first - second + both);
        }
    }

    mpz_class pairs = static_cast<unsigned long>(n) * static_cast<unsigned long>(n - 1) / 2;
    return ratio(agreements, total * pairs);
}

double StructuralAnalyzer::variability(const cnfsolver::Deadline& deadline) const {
    std::size_t num_features = model().get_features().size();
    return static_cast<double>(variant_features(deadline).size()) / static_cast<double>(num_features);
}

/**
 * @brief Inclusion probabilities keyed by feature name
 *
 * @param num_threads Worker threads for the per-feature counts
 * @param deadline Time limit
 * @param progress Progress stream, or nullptr
 */
std::map<std::string, double> StructuralAnalyzer::feature_inclusion_probability(int num_threads,
                                                                               const cnfsolver::Deadline& deadline,
                                                                               std::ostream* progress) const {
    const ConfigurationSpace& configurations = space();
    std::vector<double> probabilities = configurations.inclusion_probabilities(num_threads, deadline, progress);

    std::map<std::string, double> result;
    const auto& names = configurations.get_feature_names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        result.emplace(names[i], probabilities[i]);
    }
    return result;
}

} // namespace fmanalyzer
