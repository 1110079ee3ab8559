/**
 * @file FMAnalyzerAPI.cc
 * @brief Implementation of the FMAnalyzer query dispatcher
 *
 * This file implements the FMAnalyzerAPI class which routes a named operation
 * to the components that answer it and shapes the result.
 *
 * ## Query Pipeline
 *
 * 1. **Validation**: the operation name and the configuration are checked
 *    before any model is read.
 * 2. **Loading**: the model text is parsed into a ModelHandle, or the cached
 *    handle for the same text and conversion mode is reused.
 * 3. **Dispatch**: tree metrics go straight to the StructuralAnalyzer; the
 *    other operations build the configuration space on first use.
 * 4. **Error mapping**: MalformedModelError, UnknownFeatureError,
 *    cnfsolver::TimeoutError and std::invalid_argument become a failed
 *    QueryResult with the matching ErrorKind. Any other std::logic_error is
 *    an internal error and propagates to the caller.
 *
 * ## PIMPL Pattern
 *
 * The cache, the settings and the last result live in Impl, so the public
 * header does not depend on the cache or dispatch machinery.
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "fmanalyzer/FMAnalyzerAPI.hh"
#include "fmanalyzer/StructuralAnalyzer.hh"
#include "DimacsWriter.hh"
#include "ModelErrors.hh"
#include "cnfsolver/Deadline.hh"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <list>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>
#include <utility>

namespace fmanalyzer {

// ============================================================================
// Operations, error kinds and values
// ============================================================================

namespace {

const std::vector<std::pair<Operation, std::string>>& operation_table() {
    static const std::vector<std::pair<Operation, std::string>> table = {
        {Operation::CONFIGURATIONS, "configurations"},
        {Operation::CONFIGURATIONS_NUMBER, "configurations_number"},
        {Operation::ESTIMATED_NUMBER_OF_CONFIGURATIONS, "estimated_number_of_configurations"},
        {Operation::CORE_FEATURES, "core_features"},
        {Operation::DEAD_FEATURES, "dead_features"},
        {Operation::FALSE_OPTIONAL_FEATURES, "false_optional_features"},
        {Operation::LEAF_FEATURES, "leaf_features"},
        {Operation::COUNT_LEAFS, "count_leafs"},
        {Operation::FEATURE_ANCESTORS, "feature_ancestors"},
        {Operation::ATOMIC_SETS, "atomic_sets"},
        {Operation::AVERAGE_BRANCHING_FACTOR, "average_branching_factor"},
        {Operation::MAX_DEPTH, "max_depth"},
        {Operation::SATISFIABILITY, "satisfiability"},
        {Operation::SATISFIABLE_CONFIGURATION, "satisfiable_configuration"},
        {Operation::COMMONALITY, "commonality"},
        {Operation::HOMOGENEITY, "homogeneity"},
        {Operation::FILTER, "filter"},
        {Operation::SAMPLING, "sampling"},
        {Operation::UNIQUE_FEATURES, "unique_features"},
        {Operation::VARIANT_FEATURES, "variant_features"},
        {Operation::VARIABILITY, "variability"},
        {Operation::FEATURE_INCLUSION_PROBABILITY, "feature_inclusion_probability"},
        {Operation::DIMACS, "dimacs"},
    };
    return table;
}

std::string format_names(const std::vector<std::string>& names) {
    std::string text = "[";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += names[i];
    }
    return text + "]";
}

std::string format_double(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(6) << value;
    return out.str();
}

/**
 * @brief std::visit visitor behind format_value()
 */
struct ValueFormatter {
    std::string operator()(std::monostate) const { return ""; }
    std::string operator()(bool value) const { return value ? "true" : "false"; }
    std::string operator()(long long value) const { return std::to_string(value); }
    std::string operator()(const mpz_class& value) const { return value.get_str(); }
    std::string operator()(double value) const { return format_double(value); }
    std::string operator()(const std::string& value) const { return value; }
    std::string operator()(const std::vector<std::string>& value) const { return format_names(value); }

    std::string operator()(const std::vector<std::vector<std::string>>& value) const {
        std::string text = "[";
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (i > 0) {
                text += ", ";
            }
            text += format_names(value[i]);
        }
        return text + "]";
    }

    std::string operator()(const std::vector<Configuration>& value) const {
        if (value.empty()) {
            return "[]";
        }
        std::string text;
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (i > 0) {
                text += "\n";
            }
            text += value[i].to_string();
        }
        return text;
    }

    std::string operator()(const std::map<std::string, double>& value) const {
        std::string text;
        for (const auto& entry : value) {
            if (!text.empty()) {
                text += "\n";
            }
            text += entry.first + ": " + format_double(entry.second);
        }
        return text;
    }
};

} // namespace

/**
 * @return The operation called @p name, or std::nullopt for an unknown name
 */
std::optional<Operation> parse_operation(const std::string& name) {
    for (const auto& entry : operation_table()) {
        if (entry.second == name) {
            return entry.first;
        }
    }
    return std::nullopt;
}

std::string operation_name(Operation operation) {
    for (const auto& entry : operation_table()) {
        if (entry.first == operation) {
            return entry.second;
        }
    }
    throw std::logic_error("Operation without a name");
}

const std::vector<std::string>& operation_names() {
    static const std::vector<std::string> names = []() {
        std::vector<std::string> all;
        for (const auto& entry : operation_table()) {
            all.push_back(entry.second);
        }
        return all;
    }();
    return names;
}

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return "None";
        case ErrorKind::MALFORMED_MODEL:
            return "MalformedModel";
        case ErrorKind::UNKNOWN_FEATURE:
            return "UnknownFeature";
        case ErrorKind::TIMEOUT:
            return "Timeout";
        case ErrorKind::INVALID_ARGUMENT:
            return "InvalidArgument";
        case ErrorKind::UNKNOWN_OPERATION:
            return "UnknownOperation";
    }
    throw std::logic_error("Unhandled error kind");
}

std::string format_value(const QueryValue& value) {
    return std::visit(ValueFormatter(), value);
}

// ============================================================================
// Implementation
// ============================================================================

/**
 * @brief Internal implementation class (PIMPL idiom)
 *
 * Holds the settings, the bounded cache of parsed models (least recently
 * used first out) and the last result. The cache and the last result are
 * guarded by mutex; the analyses themselves run outside the lock.
 */
class FMAnalyzerAPI::Impl {
public:
    using CacheKey = std::pair<std::string, uvl2cnf::ConversionMode>;
    using CacheEntry = std::pair<CacheKey, std::shared_ptr<const ModelHandle>>;

    AnalysisConfig config;

    mutable std::mutex mutex;
    std::list<CacheEntry> cache;  // most recently used first
    std::map<CacheKey, std::list<CacheEntry>::iterator> cache_index;

    QueryResult last_result;

    /**
     * @brief Checks every setting before a query runs
     * @return Empty string if valid, descriptive error message if invalid
     */
    std::string validate_configuration(const AnalysisConfig& candidate) const {
        unsigned int max_threads = std::thread::hardware_concurrency();
        if (max_threads == 0) max_threads = 4; // Fallback if detection fails

        if (candidate.num_threads < 1) {
            return "Thread count must be at least 1";
        }
        if (candidate.num_threads > static_cast<int>(max_threads)) {
            return "Requested " + std::to_string(candidate.num_threads) +
                   " threads but only " + std::to_string(max_threads) +
                   " cores available. Reduce thread count.";
        }
        if (candidate.timeout_ms < 0) {
            return "Timeout must not be negative";
        }
        if (candidate.default_sample_size < 1) {
            return "Default sample size must be at least 1";
        }
        return ""; // Valid
    }

    AnalysisConfig snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return config;
    }

    std::shared_ptr<const ModelHandle> load_model(const std::string& text, const AnalysisConfig& settings) {
        CacheKey key(text, settings.conversion_mode);
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto found = cache_index.find(key);
            if (found != cache_index.end()) {
                cache.splice(cache.begin(), cache, found->second);
                if (settings.verbose) {
                    std::cout << "Reusing parsed model from cache\n";
                }
                return found->second->second;
            }
        }

        // Parse outside the lock; two threads may parse the same text once each
        std::shared_ptr<const ModelHandle> handle =
            ModelHandle::parse(text, settings.conversion_mode, settings.verbose);

        std::lock_guard<std::mutex> lock(mutex);
        if (settings.cache_capacity == 0) {
            return handle;
        }
        auto found = cache_index.find(key);
        if (found != cache_index.end()) {
            return found->second->second;
        }
        cache.emplace_front(key, handle);
        cache_index[key] = cache.begin();
        while (cache.size() > settings.cache_capacity) {
            cache_index.erase(cache.back().first);
            cache.pop_back();
        }
        return handle;
    }

    void record(const QueryResult& result) {
        std::lock_guard<std::mutex> lock(mutex);
        last_result = result;
    }

    static void fail(QueryResult& result, ErrorKind kind, const std::string& message, bool verbose) {
        result.success = false;
        result.error_kind = kind;
        result.error_message = message;
        result.value = std::monostate();
        if (verbose) {
            std::cerr << "Error (" << error_kind_name(kind) << "): " << message << std::endl;
        }
    }

    static const std::string& required_feature(const QueryRequest& request) {
        if (request.feature.empty()) {
            throw std::invalid_argument("Operation " + request.operation + " needs a feature name");
        }
        return request.feature;
    }

    /**
     * @brief Computes the value of one operation
     *
     * Every operation is handled; the switch has no default so that a new
     * Operation that is not dispatched fails to compile.
     */
    QueryValue dispatch(Operation operation,
                        const std::shared_ptr<const ModelHandle>& handle,
                        const QueryRequest& request,
                        const AnalysisConfig& settings,
                        const cnfsolver::Deadline& deadline) const {
        StructuralAnalyzer analyzer(handle);

        switch (operation) {
            case Operation::CONFIGURATIONS:
                return handle->get_configuration_space().all_configurations(deadline);
            case Operation::CONFIGURATIONS_NUMBER:
                return handle->get_configuration_space().count_configurations(deadline);
            case Operation::ESTIMATED_NUMBER_OF_CONFIGURATIONS:
                return analyzer.estimate_configuration_count();
            case Operation::CORE_FEATURES:
                return analyzer.core_features(deadline);
            case Operation::DEAD_FEATURES:
                return analyzer.dead_features(deadline);
            case Operation::FALSE_OPTIONAL_FEATURES:
                return analyzer.false_optional_features(deadline);
            case Operation::LEAF_FEATURES:
                return analyzer.leaf_features();
            case Operation::COUNT_LEAFS:
                return static_cast<long long>(analyzer.count_leaves());
            case Operation::FEATURE_ANCESTORS:
                return analyzer.feature_ancestors(required_feature(request));
            case Operation::ATOMIC_SETS:
                return analyzer.atomic_sets(deadline);
            case Operation::AVERAGE_BRANCHING_FACTOR:
                return analyzer.average_branching_factor();
            case Operation::MAX_DEPTH:
                return static_cast<long long>(analyzer.max_depth());
            case Operation::SATISFIABILITY:
                return handle->get_configuration_space().is_satisfiable(deadline);
            case Operation::SATISFIABLE_CONFIGURATION: {
                std::set<std::string> selection(request.selection.begin(), request.selection.end());
                return handle->get_configuration_space().is_configuration_valid(selection, deadline);
            }
            case Operation::COMMONALITY:
                return analyzer.commonality(required_feature(request), deadline);
            case Operation::HOMOGENEITY:
                return analyzer.homogeneity(deadline);
            case Operation::FILTER: {
                PartialConfiguration criteria = parse_partial_configuration(request.criteria);
                return handle->get_configuration_space().filter_configurations(criteria, deadline);
            }
            case Operation::SAMPLING: {
                long long size = request.sample_size ? *request.sample_size : settings.default_sample_size;
                return handle->get_configuration_space().sample_configurations(size, deadline);
            }
            case Operation::UNIQUE_FEATURES:
                return analyzer.unique_features(deadline);
            case Operation::VARIANT_FEATURES:
                return analyzer.variant_features(deadline);
            case Operation::VARIABILITY:
                return analyzer.variability(deadline);
            case Operation::FEATURE_INCLUSION_PROBABILITY:
                return analyzer.feature_inclusion_probability(settings.num_threads, deadline,
                                                              settings.verbose ? &std::cout : nullptr);
            case Operation::DIMACS:
                return DimacsWriter(handle->get_configuration_space().get_cnf()).write_to_string();
        }
        throw std::logic_error("Unhandled operation " + request.operation);
    }

    QueryResult perform_query(const std::shared_ptr<const ModelHandle>& handle,
                              const QueryRequest& request,
                              Operation operation,
                              const AnalysisConfig& settings) const {
        QueryResult result;
        result.operation = request.operation;

        if (settings.verbose) {
            std::cout << "=================================================\n";
            std::cout << "Operation: " << request.operation << "\n";
            std::cout << "=================================================\n";
        }

        auto start = std::chrono::steady_clock::now();
        try {
            cnfsolver::Deadline deadline = cnfsolver::Deadline::from_timeout_ms(settings.timeout_ms);
            result.value = dispatch(operation, handle, request, settings, deadline);
            result.success = true;
            result.error_kind = ErrorKind::NONE;
        } catch (const UnknownFeatureError& e) {
            fail(result, ErrorKind::UNKNOWN_FEATURE, e.what(), settings.verbose);
        } catch (const cnfsolver::TimeoutError& e) {
            fail(result, ErrorKind::TIMEOUT,
                 std::string(e.what()) + " (" + std::to_string(settings.timeout_ms) + " ms)",
                 settings.verbose);
        } catch (const std::invalid_argument& e) {
            // Must come before any std::logic_error handler: invalid_argument derives from it
            fail(result, ErrorKind::INVALID_ARGUMENT, e.what(), settings.verbose);
        }

        if (settings.verbose && result.success) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            std::cout << "Completed in " << elapsed.count() << " ms\n";
        }
        return result;
    }
};

// ============================================================================
// FMAnalyzerAPI Public Interface Implementation
// ============================================================================

FMAnalyzerAPI::FMAnalyzerAPI()
    : pimpl_(new Impl()) {}

FMAnalyzerAPI::~FMAnalyzerAPI() = default;

/**
 * @brief Parses @p model_text into a handle, going through the model cache
 * @throws MalformedModelError if the text is not a well-formed model
 */
std::shared_ptr<const ModelHandle> FMAnalyzerAPI::load(const std::string& model_text) {
    return pimpl_->load_model(model_text, pimpl_->snapshot());
}

/**
 * @brief Runs one query on the model text carried by @p request
 *
 * The configuration is validated first, then the operation name, then the
 * model. Every failure that belongs to the query ends up in the result with
 * its ErrorKind; std::logic_error is left to the caller.
 *
 * @param request Operation, model text and parameters
 * @return Result, also stored for get_last_result()
 */
QueryResult FMAnalyzerAPI::run(const QueryRequest& request) {
    AnalysisConfig settings = pimpl_->snapshot();
    QueryResult result;
    result.operation = request.operation;

    std::string validation_error = pimpl_->validate_configuration(settings);
    if (!validation_error.empty()) {
        Impl::fail(result, ErrorKind::INVALID_ARGUMENT, validation_error, settings.verbose);
        pimpl_->record(result);
        return result;
    }

    std::optional<Operation> operation = parse_operation(request.operation);
    if (!operation) {
        Impl::fail(result, ErrorKind::UNKNOWN_OPERATION, "Unknown operation: " + request.operation,
                   settings.verbose);
        pimpl_->record(result);
        return result;
    }

    std::shared_ptr<const ModelHandle> handle;
    try {
        handle = pimpl_->load_model(request.model_text, settings);
    } catch (const MalformedModelError& e) {
        Impl::fail(result, ErrorKind::MALFORMED_MODEL, e.what(), settings.verbose);
        pimpl_->record(result);
        return result;
    }

    result = pimpl_->perform_query(handle, request, *operation, settings);
    pimpl_->record(result);
    return result;
}

/**
 * @brief Runs one query on an already loaded model
 *
 * request.model_text is ignored.
 *
 * @throws std::logic_error if @p handle is null
 */
QueryResult FMAnalyzerAPI::run(const std::shared_ptr<const ModelHandle>& handle, const QueryRequest& request) {
    if (!handle) {
        throw std::logic_error("run() called without a model handle");
    }

    AnalysisConfig settings = pimpl_->snapshot();
    QueryResult result;
    result.operation = request.operation;

    std::string validation_error = pimpl_->validate_configuration(settings);
    if (!validation_error.empty()) {
        Impl::fail(result, ErrorKind::INVALID_ARGUMENT, validation_error, settings.verbose);
        pimpl_->record(result);
        return result;
    }

    std::optional<Operation> operation = parse_operation(request.operation);
    if (!operation) {
        Impl::fail(result, ErrorKind::UNKNOWN_OPERATION, "Unknown operation: " + request.operation,
                   settings.verbose);
        pimpl_->record(result);
        return result;
    }

    result = pimpl_->perform_query(handle, request, *operation, settings);
    pimpl_->record(result);
    return result;
}

void FMAnalyzerAPI::set_verbose(bool verbose) {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->config.verbose = verbose;
}

bool FMAnalyzerAPI::get_verbose() const {
    return pimpl_->snapshot().verbose;
}

void FMAnalyzerAPI::set_default_conversion_mode(uvl2cnf::ConversionMode mode) {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->config.conversion_mode = mode;
}

uvl2cnf::ConversionMode FMAnalyzerAPI::get_default_conversion_mode() const {
    return pimpl_->snapshot().conversion_mode;
}

void FMAnalyzerAPI::set_default_threads(int num_threads) {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->config.num_threads = num_threads;
}

int FMAnalyzerAPI::get_default_threads() const {
    return pimpl_->snapshot().num_threads;
}

void FMAnalyzerAPI::set_timeout_ms(long long timeout_ms) {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->config.timeout_ms = timeout_ms;
}

long long FMAnalyzerAPI::get_timeout_ms() const {
    return pimpl_->snapshot().timeout_ms;
}

void FMAnalyzerAPI::set_default_sample_size(long long sample_size) {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->config.default_sample_size = sample_size;
}

long long FMAnalyzerAPI::get_default_sample_size() const {
    return pimpl_->snapshot().default_sample_size;
}

/**
 * @brief Replaces the whole configuration
 *
 * The cache is shrunk to the new capacity, dropping the least recently
 * used models.
 *
 * @throws std::invalid_argument if validate_config() rejects @p config
 */
void FMAnalyzerAPI::set_config(const AnalysisConfig& config) {
    std::string validation_error = pimpl_->validate_configuration(config);
    if (!validation_error.empty()) {
        throw std::invalid_argument(validation_error);
    }
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->config = config;
    while (pimpl_->cache.size() > config.cache_capacity) {
        pimpl_->cache_index.erase(pimpl_->cache.back().first);
        pimpl_->cache.pop_back();
    }
}

AnalysisConfig FMAnalyzerAPI::get_config() const {
    return pimpl_->snapshot();
}

/**
 * @return Empty string if valid, otherwise a description of the first problem
 */
std::string FMAnalyzerAPI::validate_config(const AnalysisConfig& config) const {
    return pimpl_->validate_configuration(config);
}

std::size_t FMAnalyzerAPI::get_cache_size() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->cache.size();
}

QueryResult FMAnalyzerAPI::get_last_result() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->last_result;
}

} // namespace fmanalyzer
