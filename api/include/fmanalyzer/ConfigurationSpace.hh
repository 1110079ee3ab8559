/**
 * @file ConfigurationSpace.hh
 * @brief Satisfiability, enumeration and counting over the valid configurations of a model
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef FMANALYZER_CONFIGURATIONSPACE_H
#define FMANALYZER_CONFIGURATIONSPACE_H

#include "CNFModel.hh"
#include "FeatureModel.hh"
#include "cnfsolver/Deadline.hh"
#include "cnfsolver/SolutionEnumerator.hh"
#include "fmanalyzer/Configuration.hh"

#include <gmpxx.h>

#include <cstddef>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fmanalyzer {

/**
 * @struct Backbone
 * @brief Features fixed across all valid configurations
 */
struct Backbone {
    bool satisfiable;                ///< false if the model has no valid configuration
    std::vector<std::string> core;   ///< Selected in every configuration (canonical order)
    std::vector<std::string> dead;   ///< Selected in no configuration (canonical order)

    Backbone() : satisfiable(false) {}
};

/**
 * @class ConfigurationSequence
 * @brief Lazy, finite and restartable sequence of valid configurations
 *
 * Configurations come in lexicographic order over the canonical feature order,
 * unselected before selected. Each call to begin() restarts the enumeration,
 * so iterating twice yields the same configurations in the same order.
 * Advancing may throw cnfsolver::TimeoutError.
 *
 * @code
 * auto sequence = space.configurations();
 * for (const auto& configuration : sequence) {
 *     std::cout << configuration.to_string() << "\n";
 * }
 * @endcode
 */
class ConfigurationSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Configuration;
        using difference_type = std::ptrdiff_t;
        using pointer = const Configuration*;
        using reference = const Configuration&;

        iterator() : sequence_(nullptr) {}
        explicit iterator(ConfigurationSequence* sequence);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();

        bool operator==(const iterator& other) const { return sequence_ == other.sequence_; }
        bool operator!=(const iterator& other) const { return sequence_ != other.sequence_; }

    private:
        ConfigurationSequence* sequence_;
        std::optional<Configuration> current_;

        void advance();
    };

    ConfigurationSequence(std::shared_ptr<const std::vector<std::string>> names,
                          std::unique_ptr<cnfsolver::SolutionEnumerator> enumerator);

    /**
     * @brief Restarts the enumeration and returns an iterator on its first configuration
     */
    iterator begin();
    iterator end() { return iterator(); }

    /**
     * @brief Next configuration, or nothing once the sequence is exhausted
     */
    std::optional<Configuration> next();

    void reset();

private:
    std::shared_ptr<const std::vector<std::string>> names_;
    std::unique_ptr<cnfsolver::SolutionEnumerator> enumerator_;
};

/**
 * @class ConfigurationSpace
 * @brief The set of valid configurations of one feature model
 *
 * Built once from the model and its CNF encoding and read-only afterwards.
 * Every query creates its own solver or counter, so one space can serve
 * concurrent callers. Solving queries take a deadline and throw
 * cnfsolver::TimeoutError when it expires; they never return a partial result.
 *
 * An unsatisfiable model is a valid state: it has no configurations, a count
 * of 0, and every feature is dead.
 */
class ConfigurationSpace {
private:
    std::shared_ptr<const FeatureModel> model_;
    CNFModel cnf_;
    std::shared_ptr<const std::vector<std::string>> names_;
    int num_features_;

public:
    /**
     * @param model Parsed feature model
     * @param cnf Encoding of @p model (feature variables numbered in canonical order)
     * @throws std::logic_error if the encoding does not declare one variable per feature
     */
    ConfigurationSpace(std::shared_ptr<const FeatureModel> model, CNFModel cnf);

    const FeatureModel& get_model() const { return *model_; }
    const CNFModel& get_cnf() const { return cnf_; }
    const std::vector<std::string>& get_feature_names() const { return *names_; }
    int get_num_features() const { return num_features_; }

    bool is_satisfiable(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Whether selecting exactly @p selection gives a valid configuration
     *
     * Features not in @p selection are unselected.
     *
     * @throws UnknownFeatureError if a name is not a feature of the model
     */
    bool is_configuration_valid(const std::set<std::string>& selection,
                                const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Lazy sequence of the valid configurations consistent with @p criteria
     *
     * @throws UnknownFeatureError if @p criteria names an unknown feature
     */
    ConfigurationSequence configurations(const PartialConfiguration& criteria = PartialConfiguration(),
                                         const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    std::vector<Configuration> all_configurations(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Exact number of valid configurations, without enumerating them
     */
    mpz_class count_configurations(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Exact number of valid configurations consistent with @p criteria
     *
     * @throws UnknownFeatureError if @p criteria names an unknown feature
     */
    mpz_class count_configurations(const PartialConfiguration& criteria,
                                   const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief The first @p n configurations of the sequence (all of them if fewer exist)
     *
     * @throws std::invalid_argument if @p n < 1
     */
    std::vector<Configuration> sample_configurations(long long n,
                                                     const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Every valid configuration consistent with @p criteria
     *
     * @throws UnknownFeatureError if @p criteria names an unknown feature
     */
    std::vector<Configuration> filter_configurations(const PartialConfiguration& criteria,
                                                     const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Core and dead features
     *
     * For an unsatisfiable model core is empty and every feature is dead.
     */
    Backbone compute_backbone(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Maximal sets of features with equal status in every valid configuration
     *
     * Sets are ordered by their first feature, and features inside a set by
     * canonical order. Empty for an unsatisfiable model.
     */
    std::vector<std::vector<std::string>> compute_atomic_sets(const cnfsolver::Deadline& deadline = cnfsolver::Deadline()) const;

    /**
     * @brief Share of valid configurations selecting each feature (canonical order)
     *
     * One model count per feature, spread over @p num_threads workers. All zeros
     * for an unsatisfiable model.
     *
     * @param num_threads Worker threads (at least 1)
     * @param deadline Time limit shared by every worker
     * @param progress If not null, receives a progress line while counting
     * @throws std::invalid_argument if @p num_threads < 1
     */
    std::vector<double> inclusion_probabilities(int num_threads,
                                                const cnfsolver::Deadline& deadline = cnfsolver::Deadline(),
                                                std::ostream* progress = nullptr) const;

    /**
     * @brief Variable of feature @p name
     *
     * @throws UnknownFeatureError if @p name is not a feature of the model
     */
    int variable_of(const std::string& name) const;

private:
    std::vector<int> to_assumptions(const PartialConfiguration& criteria) const;
    std::vector<int> feature_variables() const;
};

} // namespace fmanalyzer

#endif // FMANALYZER_CONFIGURATIONSPACE_H
