/**
 * @file FMAnalyzerAPI.hh
 * @brief Unified API for FMAnalyzer - feature model analysis
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

/**
 * @mainpage FMAnalyzer API Documentation
 *
 * FMAnalyzer answers a fixed catalogue of questions about UVL feature models:
 * how many valid configurations exist, which features are core or dead,
 * which features always appear together, what the tree looks like, and so on.
 *
 * ## Pipeline
 *
 * 1. **Parsing**: UVL text is read into a FeatureModel (uvl2cnf)
 * 2. **Encoding**: the model becomes a CNF formula with one variable per feature (uvl2cnf)
 * 3. **Solving**: SAT, enumeration, counting and backbones (cnfsolver)
 * 4. **Analysis**: metrics and classifications (StructuralAnalyzer)
 *
 * ## Quick Start
 *
 * @code{.cpp}
 * #include "fmanalyzer/FMAnalyzerAPI.hh"
 *
 * fmanalyzer::FMAnalyzerAPI api;
 * fmanalyzer::QueryRequest request;
 * request.operation = "configurations_number";
 * request.model_text = uvl_text;
 *
 * auto result = api.run(request);
 * if (result.success) {
 *     std::cout << fmanalyzer::format_value(result.value) << "\n";
 * } else {
 *     std::cerr << result.error_message << "\n";
 * }
 * @endcode
 */

#ifndef FMANALYZER_API_H
#define FMANALYZER_API_H

#include "fmanalyzer/Configuration.hh"
#include "fmanalyzer/ModelHandle.hh"
#include "uvl2cnf/UVL2CNF.hh"

#include <gmpxx.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fmanalyzer {

/**
 * @brief Named analyses understood by the dispatcher
 */
enum class Operation {
    CONFIGURATIONS,
    CONFIGURATIONS_NUMBER,
    ESTIMATED_NUMBER_OF_CONFIGURATIONS,
    CORE_FEATURES,
    DEAD_FEATURES,
    FALSE_OPTIONAL_FEATURES,
    LEAF_FEATURES,
    COUNT_LEAFS,
    FEATURE_ANCESTORS,
    ATOMIC_SETS,
    AVERAGE_BRANCHING_FACTOR,
    MAX_DEPTH,
    SATISFIABILITY,
    SATISFIABLE_CONFIGURATION,
    COMMONALITY,
    HOMOGENEITY,
    FILTER,
    SAMPLING,
    UNIQUE_FEATURES,
    VARIANT_FEATURES,
    VARIABILITY,
    FEATURE_INCLUSION_PROBABILITY,
    DIMACS
};

/**
 * @brief Operation for a name such as "core_features"
 */
std::optional<Operation> parse_operation(const std::string& name);

std::string operation_name(Operation operation);

/**
 * @brief Names of every operation, in declaration order
 */
const std::vector<std::string>& operation_names();

/**
 * @brief Category of a failed query
 */
enum class ErrorKind {
    NONE,               ///< The query succeeded
    MALFORMED_MODEL,    ///< The model text could not be parsed
    UNKNOWN_FEATURE,    ///< A parameter names a feature the model does not have
    TIMEOUT,            ///< Solving ran past the configured time limit
    INVALID_ARGUMENT,   ///< A parameter is missing or malformed
    UNKNOWN_OPERATION   ///< The operation name is not recognised
};

std::string error_kind_name(ErrorKind kind);

/**
 * @brief Value returned by an operation
 */
using QueryValue = std::variant<std::monostate,
                                bool,
                                long long,
                                mpz_class,
                                double,
                                std::string,
                                std::vector<std::string>,
                                std::vector<std::vector<std::string>>,
                                std::vector<Configuration>,
                                std::map<std::string, double>>;

/**
 * @brief Renders a value as text
 *
 * Booleans as true/false, integers in decimal, floats with 6 decimals, name
 * lists as "[A, B]", configurations one per line.
 */
std::string format_value(const QueryValue& value);

/**
 * @struct AnalysisConfig
 * @brief Configuration for analysis queries
 */
struct AnalysisConfig {
    uvl2cnf::ConversionMode conversion_mode;  ///< CNF encoding of the models
    long long timeout_ms;                     ///< Time limit per query (0 = none)
    int num_threads;                          ///< Worker threads for inclusion probabilities
    long long default_sample_size;            ///< Sample size when a request gives none
    std::size_t cache_capacity;               ///< Parsed models kept for reuse
    bool verbose;                             ///< Progress output on std::cout

    AnalysisConfig()
        : conversion_mode(uvl2cnf::ConversionMode::STRAIGHTFORWARD)
        , timeout_ms(0)
        , num_threads(1)
        , default_sample_size(10)
        , cache_capacity(16)
        , verbose(false) {}
};

/**
 * @struct QueryRequest
 * @brief One operation on one model
 *
 * Only the parameter the operation needs is read.
 */
struct QueryRequest {
    std::string operation;              ///< Operation name, e.g. "commonality"
    std::string model_text;             ///< UVL source (ignored when a handle is given)
    std::string feature;                ///< feature_ancestors, commonality
    std::vector<std::string> selection; ///< satisfiable_configuration
    std::string criteria;               ///< filter, in partial configuration text form
    std::optional<long long> sample_size; ///< sampling (unset = default sample size)
};

/**
 * @struct QueryResult
 * @brief Result of a query
 */
struct QueryResult {
    bool success;                ///< Whether the query succeeded
    ErrorKind error_kind;        ///< Why it failed
    std::string error_message;   ///< Error message if the query failed
    std::string operation;       ///< Operation that was requested
    QueryValue value;            ///< Result value if the query succeeded

    QueryResult()
        : success(false)
        , error_kind(ErrorKind::NONE) {}
};

/**
 * @class FMAnalyzerAPI
 * @brief Dispatches named analyses to the parser, solver and analyzer
 *
 * Failures caused by the input (malformed models, unknown features, bad
 * parameters, time limits) are reported in QueryResult. Internal invariant
 * violations are std::logic_error and are not caught.
 *
 * Parsed models are cached by (text, conversion mode), up to the configured
 * capacity, so repeated queries on the same text reuse the encoding. The
 * cache is guarded by a mutex; one API object may serve several threads.
 *
 * @see AnalysisConfig for configuration options
 * @see QueryResult for result structure
 */
class FMAnalyzerAPI {
public:
    FMAnalyzerAPI();
    ~FMAnalyzerAPI();

    FMAnalyzerAPI(const FMAnalyzerAPI&) = delete;
    FMAnalyzerAPI& operator=(const FMAnalyzerAPI&) = delete;

    /**
     * @brief Parses a model, or returns the cached handle for the same text
     *
     * @throws MalformedModelError if the text is not a well-formed model
     */
    std::shared_ptr<const ModelHandle> load(const std::string& model_text);

    /**
     * @brief Runs an operation on request.model_text
     */
    QueryResult run(const QueryRequest& request);

    /**
     * @brief Runs an operation on an already parsed model
     */
    QueryResult run(const std::shared_ptr<const ModelHandle>& handle, const QueryRequest& request);

    void set_verbose(bool verbose);
    bool get_verbose() const;

    void set_default_conversion_mode(uvl2cnf::ConversionMode mode);
    uvl2cnf::ConversionMode get_default_conversion_mode() const;

    void set_default_threads(int num_threads);
    int get_default_threads() const;

    void set_timeout_ms(long long timeout_ms);
    long long get_timeout_ms() const;

    void set_default_sample_size(long long sample_size);
    long long get_default_sample_size() const;

    /**
     * @brief Replaces every setting at once
     *
     * @throws std::invalid_argument if validate_config() rejects @p config
     */
    void set_config(const AnalysisConfig& config);
    AnalysisConfig get_config() const;

    /**
     * @brief Validate configuration
     * @param config Configuration to validate
     * @return Empty string if valid, error message otherwise
     */
    std::string validate_config(const AnalysisConfig& config) const;

    /**
     * @brief Number of parsed models currently cached
     */
    std::size_t get_cache_size() const;

    /**
     * @brief Get last query result (for debugging)
     */
    QueryResult get_last_result() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace fmanalyzer

#endif // FMANALYZER_API_H
