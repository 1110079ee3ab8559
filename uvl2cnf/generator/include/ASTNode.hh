/**
 * @file ASTNode.hh
 * @brief Abstract syntax tree of propositional constraints
 *
 * Constraints are lowered to CNF in two steps: the tree is first rewritten to
 * negation normal form (implications and equivalences expanded, negations
 * pushed to the leaves) and then distributed into clauses. The Tseitin
 * encoding lives in FMToCNF because it needs fresh variables.
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef ASTNODE_H
#define ASTNODE_H

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

/**
 * @brief A literal over feature names: (name, positive)
 */
using NamedLiteral = std::pair<std::string, bool>;

/**
 * @brief A clause over feature names
 */
using NamedClause = std::vector<NamedLiteral>;

/**
 * @class ASTNode
 * @brief Node of a propositional formula over feature names
 *
 * Nodes are immutable once built; rewriting produces new nodes and shares
 * unchanged subtrees.
 */
class ASTNode {
public:
    enum class Type {
        FEATURE,
        NOT,
        AND,
        OR,
        IMPLIES,
        IFF
    };

private:
    Type type;
    std::string name;
    std::shared_ptr<const ASTNode> left;
    std::shared_ptr<const ASTNode> right;

public:
    ASTNode(Type type,
            std::string name,
            std::shared_ptr<const ASTNode> left,
            std::shared_ptr<const ASTNode> right);

    static std::shared_ptr<const ASTNode> feature(const std::string& name);
    static std::shared_ptr<const ASTNode> negation(std::shared_ptr<const ASTNode> operand);
    static std::shared_ptr<const ASTNode> binary(Type type,
                                                 std::shared_ptr<const ASTNode> left,
                                                 std::shared_ptr<const ASTNode> right);

    Type get_type() const { return type; }
    const std::string& get_name() const { return name; }
    const std::shared_ptr<const ASTNode>& get_left() const { return left; }
    const std::shared_ptr<const ASTNode>& get_right() const { return right; }

    /**
     * @brief Negation normal form: only FEATURE, NOT(FEATURE), AND and OR nodes
     */
    std::shared_ptr<const ASTNode> to_nnf() const;

    /**
     * @brief CNF of the formula by NNF conversion and distribution
     *
     * Tautological clauses are dropped and duplicated literals merged. The
     * result can grow exponentially with the nesting of OR over AND.
     *
     * @return Clauses over feature names; an empty vector means "true"
     */
    std::vector<NamedClause> get_clauses() const;

    /**
     * @brief Infix rendering with UVL operators, fully parenthesised
     */
    std::string to_string() const;

    /**
     * @brief Adds every feature name the formula references to @p names
     */
    void collect_features(std::set<std::string>& names) const;

    /**
     * @brief Truth value under an assignment (missing names are false)
     */
    bool evaluate(const std::map<std::string, bool>& assignment) const;

private:
    std::shared_ptr<const ASTNode> to_nnf(bool negated) const;
    std::vector<NamedClause> nnf_clauses() const;
};

#endif // ASTNODE_H
