/**
 * @file FMToCNF.cc
 * @brief Feature model to CNF transformation
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "FMToCNF.hh"
#include "RelationEncoder.hh"

#include <stdexcept>

FMToCNF::FMToCNF(std::shared_ptr<const FeatureModel> model)
    : feature_model(std::move(model)) {
    if (!feature_model) {
        throw std::logic_error("FMToCNF requires a feature model");
    }
}

/**
 * @brief Encodes the whole model
 *
 * Features get variables 1..n in canonical order, followed by the root unit
 * clause, the relation clauses and the constraint clauses. Tseitin auxiliary
 * variables are numbered after the features.
 *
 * @param mode How cross-tree constraints are turned into clauses
 * @return The CNF of the model
 */
CNFModel FMToCNF::transform(CNFMode mode) {
    cnf_model = CNFModel();

    for (const auto& feature : feature_model->get_features()) {
        cnf_model.add_variable(feature->get_name());
    }

    cnf_model.add_clause({cnf_model.get_variable(feature_model->get_root()->get_name())});

    RelationEncoder encoder(cnf_model);
    for (const auto& relation : feature_model->get_relations()) {
        encoder.encode_relation(relation);
    }

    for (const auto& constraint : feature_model->get_constraints()) {
        switch (mode) {
            case CNFMode::STRAIGHTFORWARD:
                encode_constraint_straightforward(constraint);
                break;
            case CNFMode::TSEITIN:
                encode_constraint_tseitin(constraint);
                break;
        }
    }

    return cnf_model;
}

/**
 * @brief Adds the clauses of the constraint's own CNF expansion
 */
void FMToCNF::encode_constraint_straightforward(const Constraint& constraint) {
    for (const auto& named_clause : constraint.get_ast()->get_clauses()) {
        std::vector<int> clause;
        clause.reserve(named_clause.size());
        for (const auto& literal : named_clause) {
            int var = cnf_model.get_variable(literal.first);
            clause.push_back(literal.second ? var : -var);
        }
        cnf_model.add_clause(clause);
    }
}

void FMToCNF::encode_constraint_tseitin(const Constraint& constraint) {
    assert_tseitin(constraint.get_ast()->to_nnf());
}

/**
 * @brief Asserts an NNF formula: conjunctions split, every other node
 *        becomes one clause over its flattened disjuncts
 */
void FMToCNF::assert_tseitin(const std::shared_ptr<const ASTNode>& node) {
    if (node->get_type() == ASTNode::Type::AND) {
        assert_tseitin(node->get_left());
        assert_tseitin(node->get_right());
        return;
    }

    std::vector<std::shared_ptr<const ASTNode>> operands;
    flatten(node, ASTNode::Type::OR, operands);
    std::vector<int> clause;
    for (const auto& operand : operands) {
        clause.push_back(tseitin_literal(operand));
    }
    cnf_model.add_clause(clause);
}

/**
 * @brief Literal standing for @p node, defining an auxiliary variable by an
 *        equivalence for every nested AND or OR
 *
 * @throws std::logic_error if @p node is not in negation normal form
 */
int FMToCNF::tseitin_literal(const std::shared_ptr<const ASTNode>& node) {
    switch (node->get_type()) {
        case ASTNode::Type::FEATURE:
            return cnf_model.get_variable(node->get_name());
        case ASTNode::Type::NOT:
            return -tseitin_literal(node->get_left());
        case ASTNode::Type::AND:
        case ASTNode::Type::OR: {
            std::vector<std::shared_ptr<const ASTNode>> operands;
            flatten(node, node->get_type(), operands);
            std::vector<int> literals;
            for (const auto& operand : operands) {
                literals.push_back(tseitin_literal(operand));
            }

            int aux = cnf_model.new_auxiliary_variable();
            if (node->get_type() == ASTNode::Type::AND) {
                // aux <=> l1 & ... & ln
                std::vector<int> back = {aux};
                for (int literal : literals) {
                    cnf_model.add_clause({-aux, literal});
                    back.push_back(-literal);
                }
                cnf_model.add_clause(back);
            } else {
                // aux <=> l1 | ... | ln
                std::vector<int> forth = {-aux};
                for (int literal : literals) {
                    cnf_model.add_clause({aux, -literal});
                    forth.push_back(literal);
                }
                cnf_model.add_clause(forth);
            }
            return aux;
        }
        case ASTNode::Type::IMPLIES:
        case ASTNode::Type::IFF:
            break;
    }
    throw std::logic_error("Tseitin encoding expects a formula in negation normal form");
}

void FMToCNF::flatten(const std::shared_ptr<const ASTNode>& node,
                      ASTNode::Type type,
                      std::vector<std::shared_ptr<const ASTNode>>& operands) {
    if (node->get_type() == type) {
        flatten(node->get_left(), type, operands);
        flatten(node->get_right(), type, operands);
    } else {
        operands.push_back(node);
    }
}
