/**
 * @file ASTNode.cc
 * @brief Constraint AST rewriting and clause generation
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "ASTNode.hh"

#include <stdexcept>

namespace {

/**
 * @brief Appends a literal to a clause unless already present
 *
 * @return false if the clause now holds both polarities of the variable
 */
bool append_literal(NamedClause& clause, const NamedLiteral& literal) {
    for (const auto& existing : clause) {
        if (existing.first == literal.first) {
            return existing.second == literal.second;
        }
    }
    clause.push_back(literal);
    return true;
}

} // namespace

ASTNode::ASTNode(Type type,
                 std::string name,
                 std::shared_ptr<const ASTNode> left,
                 std::shared_ptr<const ASTNode> right)
    : type(type)
    , name(std::move(name))
    , left(std::move(left))
    , right(std::move(right)) {
}

std::shared_ptr<const ASTNode> ASTNode::feature(const std::string& name) {
    return std::make_shared<const ASTNode>(Type::FEATURE, name, nullptr, nullptr);
}

std::shared_ptr<const ASTNode> ASTNode::negation(std::shared_ptr<const ASTNode> operand) {
    return std::make_shared<const ASTNode>(Type::NOT, "", std::move(operand), nullptr);
}

std::shared_ptr<const ASTNode> ASTNode::binary(Type type,
                                               std::shared_ptr<const ASTNode> left,
                                               std::shared_ptr<const ASTNode> right) {
    if (type == Type::FEATURE || type == Type::NOT) {
        throw std::logic_error("ASTNode::binary called with a non-binary node type");
    }
    return std::make_shared<const ASTNode>(type, "", std::move(left), std::move(right));
}

std::shared_ptr<const ASTNode> ASTNode::to_nnf() const {
    return to_nnf(false);
}

/**
 * @brief Negation normal form of this node, or of its negation if @p negated
 *
 * Implications and equivalences are expanded, and negations are pushed down
 * to the features with De Morgan's laws.
 */
std::shared_ptr<const ASTNode> ASTNode::to_nnf(bool negated) const {
    switch (type) {
        case Type::FEATURE: {
            auto leaf = feature(name);
            return negated ? negation(leaf) : leaf;
        }
        case Type::NOT:
            return left->to_nnf(!negated);
        case Type::AND:
            // De Morgan when negated
            return binary(negated ? Type::OR : Type::AND,
                          left->to_nnf(negated), right->to_nnf(negated));
        case Type::OR:
            return binary(negated ? Type::AND : Type::OR,
                          left->to_nnf(negated), right->to_nnf(negated));
        case Type::IMPLIES:
            // a => b  ==  !a | b ;  !(a => b)  ==  a & !b
            if (negated) {
                return binary(Type::AND, left->to_nnf(false), right->to_nnf(true));
            }
            return binary(Type::OR, left->to_nnf(true), right->to_nnf(false));
        case Type::IFF: {
            // a <=> b  ==  (!a | b) & (a | !b) ;  !(a <=> b)  ==  (a | b) & (!a | !b)
            auto pos_left = left->to_nnf(false);
            auto neg_left = left->to_nnf(true);
            auto pos_right = right->to_nnf(false);
            auto neg_right = right->to_nnf(true);
            if (negated) {
                return binary(Type::AND,
                              binary(Type::OR, pos_left, pos_right),
                              binary(Type::OR, neg_left, neg_right));
            }
            return binary(Type::AND,
                          binary(Type::OR, neg_left, pos_right),
                          binary(Type::OR, pos_left, neg_right));
        }
    }
    throw std::logic_error("Unhandled constraint node type");
}

std::vector<NamedClause> ASTNode::get_clauses() const {
    return to_nnf()->nnf_clauses();
}

/**
 * @brief Clauses of an NNF formula, distributing OR over AND
 *
 * Only valid on a node returned by to_nnf().
 */
std::vector<NamedClause> ASTNode::nnf_clauses() const {
    switch (type) {
        case Type::FEATURE:
            return {NamedClause{{name, true}}};
        case Type::NOT:
            if (left->get_type() != Type::FEATURE) {
                throw std::logic_error("Constraint is not in negation normal form");
            }
            return {NamedClause{{left->get_name(), false}}};
        case Type::AND: {
            auto clauses = left->nnf_clauses();
            auto right_clauses = right->nnf_clauses();
            clauses.insert(clauses.end(), right_clauses.begin(), right_clauses.end());
            return clauses;
        }
        case Type::OR: {
            // Distribution: (A1 & A2) | (B1 & B2) = (A1|B1) & (A1|B2) & (A2|B1) & (A2|B2)
            auto left_clauses = left->nnf_clauses();
            auto right_clauses = right->nnf_clauses();
            std::vector<NamedClause> clauses;
            for (const auto& lc : left_clauses) {
                for (const auto& rc : right_clauses) {
                    NamedClause merged = lc;
                    bool tautology = false;
                    for (const auto& literal : rc) {
                        if (!append_literal(merged, literal)) {
                            tautology = true;
                            break;
                        }
                    }
                    if (!tautology) {
                        clauses.push_back(std::move(merged));
                    }
                }
            }
            return clauses;
        }
        case Type::IMPLIES:
        case Type::IFF:
            throw std::logic_error("Constraint is not in negation normal form");
    }
    throw std::logic_error("Unhandled constraint node type");
}

std::string ASTNode::to_string() const {
    switch (type) {
        case Type::FEATURE:
            return name;
        case Type::NOT:
            return "!" + left->to_string();
        case Type::AND:
            return "(" + left->to_string() + " & " + right->to_string() + ")";
        case Type::OR:
            return "(" + left->to_string() + " | " + right->to_string() + ")";
        case Type::IMPLIES:
            return "(" + left->to_string() + " => " + right->to_string() + ")";
        case Type::IFF:
            return "(" + left->to_string() + " <=> " + right->to_string() + ")";
    }
    return "";
}

void ASTNode::collect_features(std::set<std::string>& names) const {
    if (type == Type::FEATURE) {
        names.insert(name);
        return;
    }
    if (left) {
        left->collect_features(names);
    }
    if (right) {
        right->collect_features(names);
    }
}

bool ASTNode::evaluate(const std::map<std::string, bool>& assignment) const {
    switch (type) {
        case Type::FEATURE: {
            auto it = assignment.find(name);
            return it != assignment.end() && it->second;
        }
        case Type::NOT:
            return !left->evaluate(assignment);
        case Type::AND:
            return left->evaluate(assignment) && right->evaluate(assignment);
        case Type::OR:
            return left->evaluate(assignment) || right->evaluate(assignment);
        case Type::IMPLIES:
            return !left->evaluate(assignment) || right->evaluate(assignment);
        case Type::IFF:
            return left->evaluate(assignment) == right->evaluate(assignment);
    }
    return false;
}
