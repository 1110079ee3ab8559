/**
 * @file ConfigurationSpace.cc
 * @brief Implementation of the configuration space queries
 *
 * Every query builds the solving engine it needs from the CNF encoding:
 * - SatSolver for satisfiability, validity checks and atomic sets,
 * - SolutionEnumerator for configuration sequences (sampling and filtering
 *   are prefixes or restrictions of the same sequence),
 * - ModelCounter for exact counts,
 * - BackboneDetector for core and dead features.
 *
 * The projection used for enumeration is the list of feature variables
 * 1..n, which are numbered in canonical feature order by the encoder. In
 * Tseitin mode the auxiliary variables are defined by equivalences, so
 * every configuration extends to exactly one model and counts over all
 * variables equal counts over feature variables.
 *
 * ## Inclusion probabilities
 *
 * Counting once per feature is the expensive part, so it is spread over
 * worker threads with static range partitioning. Each worker gets a
 * ModelCounter created in the calling thread (counters are not thread-safe
 * and keep a component cache each). Workers write disjoint ranges of the
 * result vector, and an error in any worker is re-thrown in the caller
 * after all of them have been joined.
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "fmanalyzer/ConfigurationSpace.hh"
#include "ModelErrors.hh"
#include "cnfsolver/BackboneDetector.hh"
#include "cnfsolver/ModelCounter.hh"
#include "cnfsolver/SatSolver.hh"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <map>
#include <ostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace fmanalyzer {

// ============================================================================
// ConfigurationSequence
// ============================================================================

ConfigurationSequence::iterator::iterator(ConfigurationSequence* sequence)
    : sequence_(sequence) {
    advance();
}

ConfigurationSequence::iterator& ConfigurationSequence::iterator::operator++() {
    advance();
    return *this;
}

void ConfigurationSequence::iterator::advance() {
    if (sequence_ == nullptr) {
        return;
    }
    current_ = sequence_->next();
    if (!current_) {
        sequence_ = nullptr;
    }
}

ConfigurationSequence::ConfigurationSequence(std::shared_ptr<const std::vector<std::string>> names,
                                             std::unique_ptr<cnfsolver::SolutionEnumerator> enumerator)
    : names_(std::move(names))
    , enumerator_(std::move(enumerator)) {}

ConfigurationSequence::iterator ConfigurationSequence::begin() {
    reset();
    return iterator(this);
}

std::optional<Configuration> ConfigurationSequence::next() {
    std::vector<bool> values;
    if (!enumerator_->next(values)) {
        return std::nullopt;
    }
    return Configuration(names_, std::move(values));
}

void ConfigurationSequence::reset() {
    enumerator_->reset();
}

// ============================================================================
// Inclusion probability workers
// ============================================================================

namespace {

/**
 * @struct CountWorker
 * @brief Counts the configurations selecting each feature of a range
 *
 * The counter is created by the calling thread and only used here.
 */
struct CountWorker {
    int thread_id;
    int start_idx;
    int end_idx;

    cnfsolver::ModelCounter* counter;

    // Shared data; each worker writes counts[start_idx..end_idx] only
    const cnfsolver::Deadline& deadline;
    std::vector<mpz_class>& counts;

    std::atomic<int>* progress_counter;
    std::atomic<int>* running_workers;

    std::exception_ptr error;

    CountWorker(int tid, int start, int end,
                cnfsolver::ModelCounter* model_counter,
                const cnfsolver::Deadline& limit,
                std::vector<mpz_class>& results,
                std::atomic<int>* progress,
                std::atomic<int>* running)
        : thread_id(tid), start_idx(start), end_idx(end),
          counter(model_counter), deadline(limit), counts(results),
          progress_counter(progress), running_workers(running) {}

    void run() {
        try {
            for (int idx = start_idx; idx <= end_idx; idx++) {
                counts[idx] = counter->count({idx + 1}, deadline);
                (*progress_counter)++;
            }
        } catch (...) {
            // Re-thrown by the caller once every worker has been joined
            error = std::current_exception();
        }
        (*running_workers)--;
    }
};

} // namespace

// ============================================================================
// ConfigurationSpace
// ============================================================================

/**
 * @brief Binds a feature model to its CNF encoding
 *
 * @param model Parsed feature model
 * @param cnf Encoding of @p model; variables 1..n must be its features in
 *            canonical order
 * @throws std::logic_error if the encoding does not number the features that way
 */
ConfigurationSpace::ConfigurationSpace(std::shared_ptr<const FeatureModel> model, CNFModel cnf)
    : model_(std::move(model))
    , cnf_(std::move(cnf))
    , names_(std::make_shared<const std::vector<std::string>>(model_->get_feature_names()))
    , num_features_(static_cast<int>(names_->size())) {
    if (cnf_.get_num_feature_variables() != num_features_) {
        throw std::logic_error("Encoding declares " + std::to_string(cnf_.get_num_feature_variables()) +
                               " feature variables for " + std::to_string(num_features_) + " features");
    }
    for (int var = 1; var <= num_features_; ++var) {
        if (cnf_.get_variable_name(var) != (*names_)[var - 1]) {
            throw std::logic_error("Variable " + std::to_string(var) + " is not bound to feature " +
                                   (*names_)[var - 1]);
        }
    }
}

/**
 * @throws UnknownFeatureError if @p name is not a feature of the model
 */
int ConfigurationSpace::variable_of(const std::string& name) const {
    return static_cast<int>(model_->index_of(name)) + 1;
}

std::vector<int> ConfigurationSpace::feature_variables() const {
    std::vector<int> vars(num_features_);
    for (int var = 1; var <= num_features_; ++var) {
        vars[var - 1] = var;
    }
    return vars;
}

/**
 * @brief One literal per criterion: v for selected, -v for unselected
 * @throws UnknownFeatureError if a criterion names an unknown feature
 */
std::vector<int> ConfigurationSpace::to_assumptions(const PartialConfiguration& criteria) const {
    std::vector<int> assumptions;
    assumptions.reserve(criteria.size());
    for (const auto& entry : criteria) {
        int var = variable_of(entry.first);
        assumptions.push_back(entry.second ? var : -var);
    }
    return assumptions;
}

bool ConfigurationSpace::is_satisfiable(const cnfsolver::Deadline& deadline) const {
    cnfsolver::SatSolver solver(cnf_.get_num_variables());
    if (!solver.add_clauses(cnf_.get_clauses())) {
        return false;
    }
    return solver.solve(deadline);
}

/**
 * @brief Checks a complete selection against the formula
 *
 * Every feature outside @p selection is assumed unselected, so only the
 * auxiliary variables of a Tseitin encoding are left to the solver.
 *
 * @param selection Names of the selected features
 * @param deadline Time limit
 * @return true if the selection is a configuration of the model
 * @throws UnknownFeatureError if @p selection names an unknown feature
 * @throws cnfsolver::TimeoutError if the deadline expires
 */
bool ConfigurationSpace::is_configuration_valid(const std::set<std::string>& selection,
                                                const cnfsolver::Deadline& deadline) const {
    std::vector<bool> values(num_features_, false);
    for (const auto& name : selection) {
        values[variable_of(name) - 1] = true;
    }

    std::vector<int> assumptions;
    assumptions.reserve(num_features_);
    for (int var = 1; var <= num_features_; ++var) {
        assumptions.push_back(values[var - 1] ? var : -var);
    }

    cnfsolver::SatSolver solver(cnf_.get_num_variables());
    if (!solver.add_clauses(cnf_.get_clauses())) {
        return false;
    }
    return solver.solve(assumptions, deadline);
}

/**
 * @brief Lazy sequence of the configurations matching @p criteria
 *
 * The sequence owns its enumerator, whose solver holds its own copy of the
 * clauses, so it stays usable after this space is gone.
 */
ConfigurationSequence ConfigurationSpace::configurations(const PartialConfiguration& criteria,
                                                         const cnfsolver::Deadline& deadline) const {
    auto enumerator = std::make_unique<cnfsolver::SolutionEnumerator>(
        cnf_.get_num_variables(), cnf_.get_clauses(), feature_variables(),
        to_assumptions(criteria), deadline);
    return ConfigurationSequence(names_, std::move(enumerator));
}

std::vector<Configuration> ConfigurationSpace::all_configurations(const cnfsolver::Deadline& deadline) const {
    return filter_configurations(PartialConfiguration(), deadline);
}

mpz_class ConfigurationSpace::count_configurations(const cnfsolver::Deadline& deadline) const {
    return count_configurations(PartialConfiguration(), deadline);
}

/**
 * @brief Exact number of configurations matching @p criteria
 *
 * @throws UnknownFeatureError if a criterion names an unknown feature
 * @throws cnfsolver::TimeoutError if the deadline expires
 */
mpz_class ConfigurationSpace::count_configurations(const PartialConfiguration& criteria,
                                                   const cnfsolver::Deadline& deadline) const {
    std::vector<int> assumptions = to_assumptions(criteria);
    cnfsolver::ModelCounter counter(cnf_.get_num_variables(), cnf_.get_clauses());
    return counter.count(assumptions, deadline);
}

/**
 * @brief First @p n configurations in enumeration order
 *
 * @param n Requested sample size; fewer are returned if the model has fewer
 * @param deadline Time limit
 * @throws std::invalid_argument if @p n < 1
 * @throws cnfsolver::TimeoutError if the deadline expires
 */
std::vector<Configuration> ConfigurationSpace::sample_configurations(long long n,
                                                                     const cnfsolver::Deadline& deadline) const {
    if (n < 1) {
        throw std::invalid_argument("Sample size must be at least 1, got " + std::to_string(n));
    }

    std::vector<Configuration> sample;
    ConfigurationSequence sequence = configurations(PartialConfiguration(), deadline);
    while (static_cast<long long>(sample.size()) < n) {
        auto configuration = sequence.next();
        if (!configuration) {
            break;
        }
        sample.push_back(std::move(*configuration));
    }
    return sample;
}

std::vector<Configuration> ConfigurationSpace::filter_configurations(const PartialConfiguration& criteria,
                                                                     const cnfsolver::Deadline& deadline) const {
    std::vector<Configuration> result;
    ConfigurationSequence sequence = configurations(criteria, deadline);
    for (const auto& configuration : sequence) {
        result.push_back(configuration);
    }
    return result;
}

/**
 * @brief Core and dead features from the backbone of the feature variables
 *
 * An unsatisfiable model has no configuration in which any feature is
 * selected, so all of its features are reported dead.
 */
Backbone ConfigurationSpace::compute_backbone(const cnfsolver::Deadline& deadline) const {
    Backbone backbone;
    cnfsolver::BackboneDetector detector(cnf_.get_num_variables(), cnf_.get_clauses());
    cnfsolver::BackboneResult result = detector.compute(feature_variables(), {}, deadline);

    if (!result.satisfiable) {
        backbone.dead = *names_;
        return backbone;
    }

    backbone.satisfiable = true;
    for (int literal : result.backbone) {
        if (literal > 0) {
            backbone.core.push_back((*names_)[literal - 1]);
        } else {
            backbone.dead.push_back((*names_)[-literal - 1]);
        }
    }
    return backbone;
}

/**
 * @brief Partitions the features into groups selected together in every model
 *
 * Features start in one group per value signature over the models seen so far.
 * For each unproven pair (representative, member) the solver looks for a model
 * separating them; a new model refines the signatures and the grouping starts
 * over, while two failed calls prove the pair equivalent.
 *
 * @return Groups in canonical order of their first feature; empty if the
 *         model is unsatisfiable
 * @throws cnfsolver::TimeoutError if the deadline expires
 */
std::vector<std::vector<std::string>> ConfigurationSpace::compute_atomic_sets(const cnfsolver::Deadline& deadline) const {
    std::vector<std::vector<std::string>> atomic_sets;

    cnfsolver::SatSolver solver(cnf_.get_num_variables());
    if (!solver.add_clauses(cnf_.get_clauses()) || !solver.solve(deadline)) {
        return atomic_sets;
    }

    // signatures[i] is the value of feature i in each model found so far
    std::vector<std::vector<bool>> signatures(num_features_);
    auto record_model = [&]() {
        for (int var = 1; var <= num_features_; ++var) {
            signatures[var - 1].push_back(solver.model_value(var));
        }
    };
    record_model();

    std::set<std::pair<int, int>> proven;
    std::vector<std::vector<int>> groups;
    bool refined = true;

    while (refined) {
        refined = false;

        // Features no model has told apart, in canonical order
        groups.clear();
        std::map<std::vector<bool>, std::size_t> group_of;
        for (int var = 1; var <= num_features_; ++var) {
            auto inserted = group_of.emplace(signatures[var - 1], groups.size());
            if (inserted.second) {
                groups.emplace_back();
            }
            groups[inserted.first->second].push_back(var);
        }

        for (const auto& group : groups) {
            int representative = group[0];
            for (std::size_t k = 1; k < group.size() && !refined; ++k) {
                int member = group[k];
                if (proven.count({representative, member}) > 0) {
                    continue;
                }
                for (int sign : {1, -1}) {
                    if (solver.solve({sign * representative, -sign * member}, deadline)) {
                        record_model();
                        refined = true;
                        break;
                    }
                }
                if (!refined) {
                    proven.emplace(representative, member);
                }
            }
            if (refined) {
                break;
            }
        }
    }

    for (const auto& group : groups) {
        std::vector<std::string> atomic_set;
        atomic_set.reserve(group.size());
        for (int var : group) {
            atomic_set.push_back((*names_)[var - 1]);
        }
        atomic_sets.push_back(std::move(atomic_set));
    }
    return atomic_sets;
}

/**
 * @brief Share of configurations selecting each feature
 *
 * @param num_threads Worker threads; capped at the number of features
 * @param deadline Time limit shared by all workers
 * @param progress Stream for the "\rProgress" line, or nullptr for none
 * @return One value per feature in canonical order; all 0 if unsatisfiable
 * @throws std::invalid_argument if @p num_threads < 1
 * @throws cnfsolver::TimeoutError if the deadline expires in any worker
 */
std::vector<double> ConfigurationSpace::inclusion_probabilities(int num_threads,
                                                                const cnfsolver::Deadline& deadline,
                                                                std::ostream* progress) const {
    if (num_threads < 1) {
        throw std::invalid_argument("num_threads must be at least 1");
    }

    std::vector<double> probabilities(num_features_, 0.0);
    if (num_features_ == 0) {
        return probabilities;
    }

    cnfsolver::ModelCounter main_counter(cnf_.get_num_variables(), cnf_.get_clauses());
    mpz_class total = main_counter.count({}, deadline);
    if (total == 0) {
        return probabilities;
    }

    std::vector<mpz_class> counts(num_features_);
    int effective_threads = std::min(num_threads, num_features_);

    if (effective_threads == 1) {
        for (int idx = 0; idx < num_features_; idx++) {
            if (progress != nullptr) {
                *progress << "\rProgress: " << (idx + 1) << " of " << num_features_ << " features" << std::flush;
            }
            counts[idx] = main_counter.count({idx + 1}, deadline);
        }
        if (progress != nullptr) {
            *progress << std::endl;
        }
    } else {
        std::atomic<int> progress_counter(0);
        std::atomic<int> running_workers(effective_threads);

        // Counters are created here, never inside a worker
        std::vector<std::unique_ptr<cnfsolver::ModelCounter>> counters;
        for (int t = 0; t < effective_threads; t++) {
            counters.emplace_back(std::make_unique<cnfsolver::ModelCounter>(
                cnf_.get_num_variables(), cnf_.get_clauses()));
        }

        std::vector<CountWorker> workers;
        workers.reserve(effective_threads);
        std::vector<std::thread> threads;
        threads.reserve(effective_threads);

        int per_thread = num_features_ / effective_threads;
        int remainder = num_features_ % effective_threads;
        int current_idx = 0;
        for (int t = 0; t < effective_threads; t++) {
            int start_idx = current_idx;
            int count = per_thread + (t < remainder ? 1 : 0);
            int end_idx = start_idx + count - 1;

            workers.emplace_back(t, start_idx, end_idx, counters[t].get(), deadline, counts,
                                 &progress_counter, &running_workers);
            current_idx = end_idx + 1;
        }

        for (auto& worker : workers) {
            threads.emplace_back([&worker]() { worker.run(); });
        }

        if (progress != nullptr) {
            while (running_workers > 0) {
                *progress << "\rProgress: " << progress_counter.load() << " of "
                          << num_features_ << " features" << std::flush;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        for (auto& thread : threads) {
            thread.join();
        }

        if (progress != nullptr) {
            *progress << "\rProgress: " << progress_counter.load() << " of "
                      << num_features_ << " features" << std::endl;
        }

        for (const auto& worker : workers) {
            if (worker.error) {
                std::rethrow_exception(worker.error);
            }
        }
    }

    for (int idx = 0; idx < num_features_; idx++) {
        mpq_class ratio(counts[idx], total);
        ratio.canonicalize();
        probabilities[idx] = ratio.get_d();
    }
    return probabilities;
}

} // namespace fmanalyzer
