/**
 * @file FMToCNF.hh
 * @brief Transformation of a feature model into CNF
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef FMTOCNF_H
#define FMTOCNF_H

#include "CNFMode.hh"
#include "CNFModel.hh"
#include "FeatureModel.hh"

#include <memory>
#include <vector>

/**
 * @class FMToCNF
 * @brief Encodes a feature model as a CNF formula
 *
 * The formula is the conjunction of:
 * 1. a unit clause selecting the root,
 * 2. the clauses of every relation (see RelationEncoder),
 * 3. the clauses of every cross-tree constraint, produced according to the
 *    chosen CNFMode.
 *
 * The result is deterministic: the same model always yields the same
 * variables, numbered in canonical feature order, and the same clauses.
 *
 * @code
 * FMToCNF transformer(feature_model);
 * CNFModel cnf = transformer.transform(CNFMode::STRAIGHTFORWARD);
 * @endcode
 */
class FMToCNF {
private:
    std::shared_ptr<const FeatureModel> feature_model;
    CNFModel cnf_model;

public:
    explicit FMToCNF(std::shared_ptr<const FeatureModel> model);

    /**
     * @brief Builds the CNF formula of the model
     *
     * @param mode Encoding used for the cross-tree constraints
     * @return The CNF model; each call starts from scratch
     */
    CNFModel transform(CNFMode mode);

private:
    void encode_constraint_straightforward(const Constraint& constraint);
    void encode_constraint_tseitin(const Constraint& constraint);

    /**
     * @brief Asserts an NNF formula, splitting top-level conjunctions and
     *        writing top-level disjunctions as one clause
     */
    void assert_tseitin(const std::shared_ptr<const ASTNode>& node);

    /**
     * @brief Literal equivalent to an NNF formula, introducing one auxiliary
     *        variable per maximal AND/OR chain
     */
    int tseitin_literal(const std::shared_ptr<const ASTNode>& node);

    static void flatten(const std::shared_ptr<const ASTNode>& node,
                        ASTNode::Type type,
                        std::vector<std::shared_ptr<const ASTNode>>& operands);
};

#endif // FMTOCNF_H
