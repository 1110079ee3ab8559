/**
 * @file DimacsWriter.cc
 * @brief DIMACS CNF serialisation
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "DimacsWriter.hh"

#include <fstream>
#include <sstream>
#include <stdexcept>

DimacsWriter::DimacsWriter(const CNFModel& model)
    : cnf_model(model) {
}

void DimacsWriter::write(std::ostream& out) const {
    for (int var = 1; var <= cnf_model.get_num_variables(); ++var) {
        out << "c " << var << " " << cnf_model.get_variable_name(var) << "\n";
    }

    out << "p cnf " << cnf_model.get_num_variables() << " " << cnf_model.get_num_clauses() << "\n";

    for (const auto& clause : cnf_model.get_clauses()) {
        for (int literal : clause) {
            out << literal << " ";
        }
        out << "0\n";
    }
}

std::string DimacsWriter::write_to_string() const {
    std::ostringstream out;
    write(out);
    return out.str();
}

void DimacsWriter::write_to_file(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open output file: " + filename);
    }
    write(out);
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + filename);
    }
}
