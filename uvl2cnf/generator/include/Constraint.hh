/**
 * @file Constraint.hh
 * @brief Cross-tree constraint of a feature model
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef CONSTRAINT_H
#define CONSTRAINT_H

#include "ASTNode.hh"

#include <cstddef>
#include <memory>
#include <string>

/**
 * @class Constraint
 * @brief A propositional constraint together with its source location
 */
class Constraint {
private:
    std::shared_ptr<const ASTNode> ast;
    std::size_t line;

public:
    Constraint(std::shared_ptr<const ASTNode> ast, std::size_t line)
        : ast(std::move(ast))
        , line(line) {}

    const std::shared_ptr<const ASTNode>& get_ast() const { return ast; }
    std::size_t get_line() const { return line; }
    std::string to_string() const { return ast->to_string(); }
};

#endif // CONSTRAINT_H
