/**
 * @file UVL2CNF.hh
 * @brief High-level API for reading UVL models and encoding them as CNF
 */

/**
 * @defgroup UVL2CNF UVL to CNF Conversion
 * @brief Parsing of UVL feature models and their propositional encoding
 *
 * ## Overview
 *
 * The UVL2CNF component reads Universal Variability Language (UVL) feature
 * models into a FeatureModel and encodes them as a CNF formula with one
 * variable per feature, numbered in canonical feature order (breadth-first,
 * by name within a depth).
 *
 * **Group Types:**
 * - **Mandatory**: child selected iff parent selected
 * - **Optional**: child may be selected only if parent selected
 * - **Or**: at least one child selected iff parent selected
 * - **Alternative**: exactly one child selected iff parent selected
 * - **Cardinality [m..n]**: between m and n children selected when the parent is
 *
 * **Example UVL Model:**
 * ```
 * features
 *     Car
 *         mandatory
 *             Engine
 *         optional
 *             GPS
 *         alternative
 *             Gasoline
 *             Electric
 *
 * constraints
 *     Electric => GPS
 * ```
 *
 * ## Limitations
 *
 * - `imports` are rejected (no other files are read)
 * - Arithmetic constraints are filtered out (they need an SMT solver)
 * - Feature cardinalities and attributes are recorded but carry no boolean semantics
 *
 * @see UVL2CNF Main API class
 * @see ConversionResult Structure containing conversion statistics
 */

#ifndef UVL2CNF_API_H
#define UVL2CNF_API_H

#include "CNFModel.hh"
#include "CNFMode.hh"
#include "FeatureModel.hh"

#include <memory>
#include <string>

namespace uvl2cnf {

/**
 * @enum ConversionMode
 * @ingroup UVL2CNF
 * @brief Conversion mode for CNF generation
 */
enum class ConversionMode {
    STRAIGHTFORWARD,  ///< Feature variables only
    TSEITIN           ///< Auxiliary variables for constraint sub-formulas
};

/**
 * @struct ConversionResult
 * @ingroup UVL2CNF
 * @brief Result of a conversion operation
 */
struct ConversionResult {
    bool success;                   ///< Whether the conversion was successful
    std::string error_message;      ///< Error message if conversion failed

    // Statistics from the input feature model
    int num_features;               ///< Number of features in the input model
    int num_relations;              ///< Number of parent-child relations
    int num_constraints;            ///< Number of propositional cross-tree constraints
    int num_filtered_constraints;   ///< Arithmetic constraints that were dropped

    // Statistics from the output CNF
    int num_variables;              ///< Number of variables in the CNF
    int num_clauses;                ///< Number of clauses in the CNF

    ConversionResult()
        : success(false)
        , error_message("")
        , num_features(0)
        , num_relations(0)
        , num_constraints(0)
        , num_filtered_constraints(0)
        , num_variables(0)
        , num_clauses(0) {}
};

/**
 * @class UVL2CNF
 * @ingroup UVL2CNF
 * @brief Reads UVL models and encodes them as CNF
 *
 * parse() and encode() throw (MalformedModelError, std::runtime_error for
 * unreadable files); convert() catches those and reports them through
 * ConversionResult instead.
 *
 * @code
 * uvl2cnf::UVL2CNF converter;
 * auto model = converter.parse(text);
 * CNFModel cnf = converter.encode(model);
 * @endcode
 */
class UVL2CNF {
private:
    bool verbose_;
    ConversionMode mode_;

public:
    /**
     * @param verbose Whether to print progress messages and warnings (default: false)
     */
    explicit UVL2CNF(bool verbose = false);

    void set_verbose(bool verbose);
    void set_mode(ConversionMode mode);
    ConversionMode get_mode() const;

    /**
     * @brief Parses UVL text into a feature model
     *
     * @param text UVL source
     * @return The feature model (never nullptr)
     * @throws MalformedModelError if the text is not a well-formed model
     */
    std::shared_ptr<FeatureModel> parse(const std::string& text) const;

    /**
     * @brief Reads and parses a UVL file
     *
     * @throws std::runtime_error if the file cannot be read
     * @throws MalformedModelError if the text is not a well-formed model
     */
    std::shared_ptr<FeatureModel> parse_file(const std::string& input_file) const;

    /**
     * @brief Encodes a feature model with the current mode
     */
    CNFModel encode(const std::shared_ptr<const FeatureModel>& model) const;

    /**
     * @brief Encodes a feature model with the given mode
     */
    CNFModel encode(const std::shared_ptr<const FeatureModel>& model, ConversionMode mode) const;

    /**
     * @brief Convert a UVL file to a DIMACS file
     * @param input_file Path to input UVL file
     * @param output_file Path to output DIMACS file
     * @return ConversionResult with success status and statistics
     */
    ConversionResult convert(const std::string& input_file,
                             const std::string& output_file);

    ConversionResult convert(const std::string& input_file,
                             const std::string& output_file,
                             ConversionMode mode);

    static CNFMode to_cnf_mode(ConversionMode mode);
};

} // namespace uvl2cnf

#endif // UVL2CNF_API_H
