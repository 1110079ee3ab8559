/**
 * @file CNFModel.hh
 * @brief Propositional formula in conjunctive normal form
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef CNFMODEL_H
#define CNFMODEL_H

#include <map>
#include <string>
#include <vector>

/**
 * @class CNFModel
 * @brief Clauses over named variables, numbered DIMACS style from 1
 *
 * Feature variables are declared first, so variables 1..get_num_feature_variables()
 * are exactly the features in canonical order. Auxiliary variables introduced
 * by the Tseitin encoding follow and are named "aux_<n>".
 *
 * Literals are non-zero ints: v for the variable, -v for its negation.
 */
class CNFModel {
private:
    std::map<std::string, int> variables;
    std::vector<std::string> names;  ///< names[v - 1] is the name of variable v
    std::vector<std::vector<int>> clauses;
    int num_feature_variables;
    int num_auxiliary_variables;

public:
    CNFModel();

    /**
     * @brief Declares a feature variable
     *
     * @return The variable number
     * @throws std::logic_error if the name is already declared or an auxiliary
     *         variable was already introduced
     */
    int add_variable(const std::string& name);

    /**
     * @brief Variable number of a declared name
     *
     * @throws std::logic_error if the name is not declared; the encoder only
     *         references declared features, so this is a broken invariant
     */
    int get_variable(const std::string& name) const;

    bool has_variable(const std::string& name) const { return variables.count(name) > 0; }

    /**
     * @brief Introduces a fresh auxiliary variable
     */
    int new_auxiliary_variable();

    /**
     * @brief Name of variable @p var (1-based)
     */
    const std::string& get_variable_name(int var) const;

    bool is_auxiliary(int var) const { return var > num_feature_variables; }

    /**
     * @brief Appends a clause
     *
     * @throws std::logic_error on an empty clause or a literal outside 1..num_variables
     */
    void add_clause(const std::vector<int>& clause);

    const std::vector<std::vector<int>>& get_clauses() const { return clauses; }
    int get_num_variables() const { return static_cast<int>(names.size()); }
    int get_num_clauses() const { return static_cast<int>(clauses.size()); }
    int get_num_feature_variables() const { return num_feature_variables; }
    int get_num_auxiliary_variables() const { return num_auxiliary_variables; }
};

#endif // CNFMODEL_H
