/**
 * @file DimacsWriter.hh
 * @brief DIMACS CNF serialisation of a CNFModel
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef DIMACSWRITER_H
#define DIMACSWRITER_H

#include "CNFModel.hh"

#include <ostream>
#include <string>

/**
 * @class DimacsWriter
 * @brief Writes a CNF model in DIMACS format
 *
 * Output layout:
 * @code
 * c 1 Car
 * c 2 Engine
 * p cnf 2 3
 * 1 0
 * -1 2 0
 * -2 1 0
 * @endcode
 * One "c <var> <name>" line per variable (features, then auxiliaries), the
 * problem line, then one clause per line terminated by 0.
 */
class DimacsWriter {
private:
    const CNFModel& cnf_model;

public:
    explicit DimacsWriter(const CNFModel& model);

    void write(std::ostream& out) const;
    std::string write_to_string() const;

    /**
     * @throws std::runtime_error if the file cannot be written
     */
    void write_to_file(const std::string& filename) const;
};

#endif // DIMACSWRITER_H
