/**
 * @file ModelErrors.hh
 * @brief Exception types raised while reading and querying feature models
 *
 * Two conditions are reported to callers as distinct errors:
 * - MalformedModelError: the UVL text cannot be turned into a feature model
 *   (syntax errors, duplicated names, undefined references, zero or several roots).
 *   Always carries a line/column hint.
 * - UnknownFeatureError: an operation names a feature the model does not declare.
 *
 * Broken internal invariants are reported with std::logic_error instead and are
 * never converted into one of these.
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef MODELERRORS_H
#define MODELERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @class MalformedModelError
 * @brief The UVL input is not a well-formed feature model
 */
class MalformedModelError : public std::runtime_error {
private:
    std::size_t line_;
    std::size_t column_;

public:
    /**
     * @brief Constructs the error with a location hint
     *
     * @param message Description of the problem
     * @param line 1-based line of the offending element (0 if unknown)
     * @param column 0-based column of the offending element
     */
    MalformedModelError(const std::string& message, std::size_t line, std::size_t column)
        : std::runtime_error(format(message, line, column))
        , line_(line)
        , column_(column) {}

    std::size_t get_line() const { return line_; }
    std::size_t get_column() const { return column_; }

private:
    static std::string format(const std::string& message, std::size_t line, std::size_t column) {
        if (line == 0) {
            return "The UVL model is malformed: " + message;
        }
        return "The UVL model is malformed: Line " + std::to_string(line) + ":" +
               std::to_string(column) + " - " + message;
    }
};

/**
 * @class UnknownFeatureError
 * @brief A feature name does not exist in the model
 */
class UnknownFeatureError : public std::runtime_error {
private:
    std::string feature_name_;

public:
    explicit UnknownFeatureError(const std::string& feature_name)
        : std::runtime_error("Feature '" + feature_name + "' does not exist in the model")
        , feature_name_(feature_name) {}

    const std::string& get_feature_name() const { return feature_name_; }
};

#endif // MODELERRORS_H
