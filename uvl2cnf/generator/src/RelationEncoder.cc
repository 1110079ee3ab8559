/**
 * @file RelationEncoder.cc
 * @brief Implementation of relation type encodings to CNF
 *
 * - **MANDATORY**: child <=> parent (2 clauses)
 * - **OPTIONAL**: child => parent (1 clause)
 * - **OR**: parent <=> some child (n + 1 clauses)
 * - **ALTERNATIVE**: parent <=> exactly one child (pairwise, O(n^2) clauses)
 * - **CARDINALITY**: parent => min..max children (subset enumeration)
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "RelationEncoder.hh"
#include "Feature.hh"

#include <functional>
#include <stdexcept>

/**
 * @param model CNF whose variable table already holds every feature
 */
RelationEncoder::RelationEncoder(CNFModel& model)
    : cnf_model(model) {
}

/**
 * @brief Appends the clauses of one parent-child relation
 *
 * The switch covers every Relation::Type, so a new type fails to compile
 * (-Werror=switch) instead of being skipped.
 *
 * @param relation Relation whose parent and children are feature variables
 * @throws std::logic_error if the relation has the wrong number of children
 */
void RelationEncoder::encode_relation(const std::shared_ptr<Relation>& relation) {
    switch (relation->get_type()) {
        case Relation::Type::MANDATORY:
            encode_mandatory(relation);
            break;
        case Relation::Type::OPTIONAL:
            encode_optional(relation);
            break;
        case Relation::Type::OR:
            encode_or(relation);
            break;
        case Relation::Type::ALTERNATIVE:
            encode_alternative(relation);
            break;
        case Relation::Type::CARDINALITY:
            encode_cardinality(relation);
            break;
    }
}

/**
 * @brief Variables of the relation's children, in child order
 */
std::vector<int> RelationEncoder::child_variables(const std::shared_ptr<Relation>& relation) const {
    std::vector<int> vars;
    for (const auto& child : relation->get_children()) {
        vars.push_back(cnf_model.get_variable(child->get_name()));
    }
    return vars;
}

/**
 * @brief parent <=> child
 *
 * Clauses: (-parent | child) and (-child | parent).
 *
 * @throws std::logic_error unless the relation has exactly one child
 */
void RelationEncoder::encode_mandatory(const std::shared_ptr<Relation>& relation) {
    if (relation->get_children().size() != 1) {
        throw std::logic_error("Mandatory relation must have exactly 1 child");
    }

    int parent_var = cnf_model.get_variable(relation->get_parent()->get_name());
    int child_var = child_variables(relation)[0];

    cnf_model.add_clause({-parent_var, child_var});
    cnf_model.add_clause({-child_var, parent_var});
}

/**
 * @brief child => parent, as the single clause (-child | parent)
 *
 * @throws std::logic_error unless the relation has exactly one child
 */
void RelationEncoder::encode_optional(const std::shared_ptr<Relation>& relation) {
    if (relation->get_children().size() != 1) {
        throw std::logic_error("Optional relation must have exactly 1 child");
    }

    int parent_var = cnf_model.get_variable(relation->get_parent()->get_name());
    int child_var = child_variables(relation)[0];

    cnf_model.add_clause({-child_var, parent_var});
}

/**
 * @brief parent <=> (child_1 | ... | child_n)
 *
 * One clause asks for some child when the parent is selected; one binary
 * clause per child ties it back to the parent.
 *
 * @throws std::logic_error if the group is empty
 */
void RelationEncoder::encode_or(const std::shared_ptr<Relation>& relation) {
    if (relation->get_children().empty()) {
        throw std::logic_error("Or relation must have at least 1 child");
    }

    int parent_var = cnf_model.get_variable(relation->get_parent()->get_name());
    std::vector<int> children = child_variables(relation);

    // -parent OR child1 OR ... OR childN
    std::vector<int> or_clause = {-parent_var};
    or_clause.insert(or_clause.end(), children.begin(), children.end());
    cnf_model.add_clause(or_clause);

    for (int child_var : children) {
        cnf_model.add_clause({-child_var, parent_var});
    }
}

/**
 * @brief The or-group clauses plus a pairwise at-most-one
 *
 * @throws std::logic_error if the group is empty
 */
void RelationEncoder::encode_alternative(const std::shared_ptr<Relation>& relation) {
    if (relation->get_children().empty()) {
        throw std::logic_error("Alternative relation must have at least 1 child");
    }

    encode_or(relation);

    // At most one: -child_i OR -child_j for every pair
    std::vector<int> children = child_variables(relation);
    for (size_t i = 0; i < children.size(); ++i) {
        for (size_t j = i + 1; j < children.size(); ++j) {
            cnf_model.add_clause({-children[i], -children[j]});
        }
    }
}

/**
 * @brief parent => between card_min and card_max children, child => parent
 *
 * Both bounds are binomial encodings over child subsets. An unsatisfiable
 * interval (min above the child count or above max) only forbids the parent.
 *
 * @param relation Group with normalized bounds (max is never -1 here)
 */
void RelationEncoder::encode_cardinality(const std::shared_ptr<Relation>& relation) {
    int parent_var = cnf_model.get_variable(relation->get_parent()->get_name());
    std::vector<int> children = child_variables(relation);
    int num_children = static_cast<int>(children.size());
    int card_min = relation->get_card_min();
    int card_max = relation->get_card_max();

    for (int child_var : children) {
        cnf_model.add_clause({-child_var, parent_var});
    }

    if (card_min > num_children || card_min > card_max) {
        // No legal selection: the parent can never be selected
        cnf_model.add_clause({-parent_var});
        return;
    }

    // At least card_min: among any k - m + 1 children one is selected
    if (card_min > 0) {
        for (const auto& subset : generate_combinations(num_children, num_children - card_min + 1)) {
            std::vector<int> clause = {-parent_var};
            for (int index : subset) {
                clause.push_back(children[index]);
            }
            cnf_model.add_clause(clause);
        }
    }

    // At most card_max: among any card_max + 1 children one is unselected
    if (card_max < num_children) {
        for (const auto& subset : generate_combinations(num_children, card_max + 1)) {
            std::vector<int> clause;
            for (int index : subset) {
                clause.push_back(-children[index]);
            }
            cnf_model.add_clause(clause);
        }
    }
}

/**
 * @brief All k-element subsets of {0, ..., n - 1} in lexicographic order
 *
 * @return One empty subset for k == 0, nothing when k is out of [0, n]
 */
std::vector<std::vector<int>> RelationEncoder::generate_combinations(int n, int k) {
    std::vector<std::vector<int>> result;

    if (k > n || k < 0) {
        return result;
    }

    if (k == 0) {
        result.push_back({});
        return result;
    }

    std::vector<int> current;
    std::function<void(int, int)> backtrack = [&](int start, int depth) {
        if (depth == k) {
            result.push_back(current);
            return;
        }

        for (int i = start; i < n; ++i) {
            current.push_back(i);
            backtrack(i + 1, depth + 1);
            current.pop_back();
        }
    };

    backtrack(0, 0);
    return result;
}
