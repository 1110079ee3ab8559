/**
 * @file CNFModel.cc
 * @brief Variable bookkeeping and clause storage
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "CNFModel.hh"

#include <cstdlib>
#include <stdexcept>

CNFModel::CNFModel()
    : num_feature_variables(0)
    , num_auxiliary_variables(0) {
}

int CNFModel::add_variable(const std::string& name) {
    if (num_auxiliary_variables > 0) {
        throw std::logic_error("Feature variable '" + name + "' declared after auxiliary variables");
    }
    int var = static_cast<int>(names.size()) + 1;
    if (!variables.emplace(name, var).second) {
        throw std::logic_error("Variable '" + name + "' declared twice");
    }
    names.push_back(name);
    ++num_feature_variables;
    return var;
}

int CNFModel::get_variable(const std::string& name) const {
    auto it = variables.find(name);
    if (it == variables.end()) {
        throw std::logic_error("Reference to undeclared variable '" + name + "'");
    }
    return it->second;
}

int CNFModel::new_auxiliary_variable() {
    ++num_auxiliary_variables;
    std::string name = "aux_" + std::to_string(num_auxiliary_variables);
    int var = static_cast<int>(names.size()) + 1;
    variables.emplace(name, var);
    names.push_back(name);
    return var;
}

const std::string& CNFModel::get_variable_name(int var) const {
    if (var < 1 || var > get_num_variables()) {
        throw std::logic_error("Variable " + std::to_string(var) + " out of range");
    }
    return names[var - 1];
}

void CNFModel::add_clause(const std::vector<int>& clause) {
    if (clause.empty()) {
        throw std::logic_error("Empty clause added to CNF model");
    }
    for (int literal : clause) {
        if (literal == 0 || std::abs(literal) > get_num_variables()) {
            throw std::logic_error("Clause literal " + std::to_string(literal) + " references an undeclared variable");
        }
    }
    clauses.push_back(clause);
}
