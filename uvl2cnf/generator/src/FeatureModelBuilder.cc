/**
 * @file FeatureModelBuilder.cc
 * @brief Construction of feature models from UVL parse trees
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "FeatureModelBuilder.hh"
#include "ModelErrors.hh"

#include <stdexcept>

namespace {

std::size_t line_of(antlr4::ParserRuleContext* ctx) {
    return ctx->getStart()->getLine();
}

std::size_t column_of(antlr4::ParserRuleContext* ctx) {
    return ctx->getStart()->getCharPositionInLine();
}

Feature::Type to_feature_type(UVLCppParser::FeatureTypeContext* ctx) {
    if (ctx == nullptr || ctx->BOOLEAN_KEY()) {
        return Feature::Type::BOOLEAN;
    }
    if (ctx->INTEGER_KEY()) {
        return Feature::Type::INTEGER;
    }
    if (ctx->REAL_KEY()) {
        return Feature::Type::REAL;
    }
    return Feature::Type::STRING;
}

} // namespace

FeatureModelBuilder::FeatureModelBuilder()
    : num_filtered_constraints(0) {
}

void FeatureModelBuilder::enterNamespaceDecl(UVLCppParser::NamespaceDeclContext* ctx) {
    namespace_name = ctx->reference()->getText();
}

void FeatureModelBuilder::enterImports(UVLCppParser::ImportsContext* ctx) {
    throw MalformedModelError("imports are not supported", line_of(ctx), column_of(ctx));
}

/**
 * @brief Declares a feature and attaches it to the innermost open group
 *
 * A feature outside any group is the root; there can only be one.
 *
 * @throws MalformedModelError on a duplicate name or a second root
 */
void FeatureModelBuilder::enterFeature(UVLCppParser::FeatureContext* ctx) {
    std::string name = ctx->reference()->getText();
    std::size_t line = line_of(ctx);

    auto previous = declared.find(name);
    if (previous != declared.end()) {
        throw MalformedModelError("feature '" + name + "' is already declared at line " +
                                      std::to_string(previous->second),
                                  line, column_of(ctx));
    }
    declared.emplace(name, line);

    auto feature = std::make_shared<Feature>(name, to_feature_type(ctx->featureType()), line);

    if (ctx->featureCardinality()) {
        int min = 0;
        int max = 0;
        parse_cardinality(ctx->featureCardinality()->CARDINALITY(), min, max);
        feature->set_feature_cardinality(min, max);
    }
    if (ctx->attributes()) {
        add_attributes(feature, ctx->attributes());
    }

    if (group_stack.empty()) {
        if (root) {
            throw MalformedModelError("feature '" + name + "' is a second root; the model must have exactly one root (first root: '" +
                                          root->get_name() + "')",
                                      line, column_of(ctx));
        }
        root = feature;
    } else {
        PendingGroup& group = group_stack.back();
        feature->set_parent(group.parent);
        group.children.push_back(feature);
    }

    feature_stack.push_back(feature);
}

void FeatureModelBuilder::exitFeature(UVLCppParser::FeatureContext* ctx) {
    (void)ctx;
    feature_stack.pop_back();
}

void FeatureModelBuilder::enterOrGroup(UVLCppParser::OrGroupContext* ctx) {
    (void)ctx;
    open_group(Relation::Type::OR, 1, -1);
}

void FeatureModelBuilder::exitOrGroup(UVLCppParser::OrGroupContext* ctx) {
    (void)ctx;
    close_group();
}

void FeatureModelBuilder::enterAlternativeGroup(UVLCppParser::AlternativeGroupContext* ctx) {
    (void)ctx;
    open_group(Relation::Type::ALTERNATIVE, 1, 1);
}

void FeatureModelBuilder::exitAlternativeGroup(UVLCppParser::AlternativeGroupContext* ctx) {
    (void)ctx;
    close_group();
}

void FeatureModelBuilder::enterOptionalGroup(UVLCppParser::OptionalGroupContext* ctx) {
    (void)ctx;
    open_group(Relation::Type::OPTIONAL, 0, 1);
}

void FeatureModelBuilder::exitOptionalGroup(UVLCppParser::OptionalGroupContext* ctx) {
    (void)ctx;
    close_group();
}

void FeatureModelBuilder::enterMandatoryGroup(UVLCppParser::MandatoryGroupContext* ctx) {
    (void)ctx;
    open_group(Relation::Type::MANDATORY, 1, 1);
}

void FeatureModelBuilder::exitMandatoryGroup(UVLCppParser::MandatoryGroupContext* ctx) {
    (void)ctx;
    close_group();
}

void FeatureModelBuilder::enterCardinalityGroup(UVLCppParser::CardinalityGroupContext* ctx) {
    int min = 0;
    int max = 0;
    parse_cardinality(ctx->CARDINALITY(), min, max);
    open_group(Relation::Type::CARDINALITY, min, max);
}

void FeatureModelBuilder::exitCardinalityGroup(UVLCppParser::CardinalityGroupContext* ctx) {
    (void)ctx;
    close_group();
}

void FeatureModelBuilder::exitConstraintLine(UVLCppParser::ConstraintLineContext* ctx) {
    add_constraint(ctx->constraint());
}

/**
 * @brief Checks constraint references and creates the FeatureModel
 *
 * References are only checked here because a constraint may name features
 * declared anywhere in the tree.
 *
 * @throws MalformedModelError if there is no root or a constraint names an
 *         undeclared feature
 */
void FeatureModelBuilder::exitFeatureModel(UVLCppParser::FeatureModelContext* ctx) {
    if (!root) {
        throw MalformedModelError("the model declares no root feature", line_of(ctx), column_of(ctx));
    }

    for (const auto& constraint : constraints) {
        std::set<std::string> referenced;
        constraint.get_ast()->collect_features(referenced);
        for (const auto& name : referenced) {
            if (declared.count(name) == 0) {
                throw MalformedModelError("constraint '" + constraint.to_string() +
                                              "' references undefined feature '" + name + "'",
                                          constraint.get_line(), 0);
            }
        }
    }

    feature_model = std::make_shared<FeatureModel>(root, constraints, namespace_name,
                                                   num_filtered_constraints);
}

void FeatureModelBuilder::open_group(Relation::Type type, int card_min, int card_max) {
    if (feature_stack.empty()) {
        throw std::logic_error("Group opened outside of a feature");
    }
    group_stack.push_back(PendingGroup{type, feature_stack.back(), {}, card_min, card_max});
}

/**
 * @brief Turns the innermost pending group into relations of its parent
 *
 * Mandatory and optional groups give one relation per child.
 */
void FeatureModelBuilder::close_group() {
    PendingGroup group = std::move(group_stack.back());
    group_stack.pop_back();

    switch (group.type) {
        case Relation::Type::MANDATORY:
            for (const auto& child : group.children) {
                group.parent->add_relation(Relation::make_mandatory(group.parent, child));
            }
            break;
        case Relation::Type::OPTIONAL:
            for (const auto& child : group.children) {
                group.parent->add_relation(Relation::make_optional(group.parent, child));
            }
            break;
        case Relation::Type::OR:
            group.parent->add_relation(Relation::make_or(group.parent, std::move(group.children)));
            break;
        case Relation::Type::ALTERNATIVE:
            group.parent->add_relation(Relation::make_alternative(group.parent, std::move(group.children)));
            break;
        case Relation::Type::CARDINALITY:
            group.parent->add_relation(Relation::make_cardinality(group.parent, std::move(group.children),
                                                                  group.card_min, group.card_max));
            break;
    }
}

void FeatureModelBuilder::add_attributes(const std::shared_ptr<Feature>& feature,
                                         UVLCppParser::AttributesContext* ctx) {
    for (auto* attribute : ctx->attribute()) {
        if (auto* value_attribute = attribute->valueAttribute()) {
            std::string key = value_attribute->key()->getText();
            std::string value = value_attribute->value() ? value_attribute->value()->getText() : "true";
            feature->set_attribute(key, value);
        } else if (auto* constraint_attribute = attribute->constraintAttribute()) {
            add_constraint(constraint_attribute->constraint());
        }
    }
}

/**
 * @brief Records a propositional constraint, or counts and reports an
 *        arithmetic one as filtered
 */
void FeatureModelBuilder::add_constraint(UVLCppParser::ConstraintContext* ctx) {
    auto ast = to_ast(ctx);
    if (!ast) {
        ++num_filtered_constraints;
        warnings.push_back("Line " + std::to_string(line_of(ctx)) +
                           ": arithmetic constraint '" + ctx->getText() +
                           "' filtered out (requires an SMT solver)");
        return;
    }
    constraints.emplace_back(ast, line_of(ctx));
}

std::shared_ptr<const ASTNode> FeatureModelBuilder::to_ast(UVLCppParser::ConstraintContext* ctx) const {
    if (dynamic_cast<UVLCppParser::EquationConstraintContext*>(ctx)) {
        return nullptr;
    }
    if (auto* literal = dynamic_cast<UVLCppParser::LiteralConstraintContext*>(ctx)) {
        return ASTNode::feature(literal->reference()->getText());
    }
    if (auto* parenthesis = dynamic_cast<UVLCppParser::ParenthesisConstraintContext*>(ctx)) {
        return to_ast(parenthesis->constraint());
    }
    if (auto* negation = dynamic_cast<UVLCppParser::NotConstraintContext*>(ctx)) {
        auto operand = to_ast(negation->constraint());
        return operand ? ASTNode::negation(operand) : nullptr;
    }

    ASTNode::Type type;
    std::vector<UVLCppParser::ConstraintContext*> operands;
    if (auto* conjunction = dynamic_cast<UVLCppParser::AndConstraintContext*>(ctx)) {
        type = ASTNode::Type::AND;
        operands = conjunction->constraint();
    } else if (auto* disjunction = dynamic_cast<UVLCppParser::OrConstraintContext*>(ctx)) {
        type = ASTNode::Type::OR;
        operands = disjunction->constraint();
    } else if (auto* implication = dynamic_cast<UVLCppParser::ImplicationConstraintContext*>(ctx)) {
        type = ASTNode::Type::IMPLIES;
        operands = implication->constraint();
    } else if (auto* equivalence = dynamic_cast<UVLCppParser::EquivalenceConstraintContext*>(ctx)) {
        type = ASTNode::Type::IFF;
        operands = equivalence->constraint();
    } else {
        throw std::logic_error("Unhandled constraint alternative: " + ctx->getText());
    }

    auto left = to_ast(operands.at(0));
    auto right = to_ast(operands.at(1));
    if (!left || !right) {
        return nullptr;
    }
    return ASTNode::binary(type, left, right);
}

/**
 * @brief Reads the bounds of a CARDINALITY token
 *
 * @param token "[n]", "[n..m]" or "[n..*]"
 * @param min Lower bound
 * @param max Upper bound, -1 for '*'
 * @throws MalformedModelError at the token position if a bound overflows an int
 */
void FeatureModelBuilder::parse_cardinality(antlr4::tree::TerminalNode* token, int& min, int& max) {
    std::string text = token->getText();
    std::string body = text.substr(1, text.size() - 2);
    std::size_t dots = body.find("..");
    try {
        if (dots == std::string::npos) {
            min = std::stoi(body);
            max = min;
            return;
        }
        min = std::stoi(body.substr(0, dots));
        std::string upper = body.substr(dots + 2);
        max = (upper == "*") ? -1 : std::stoi(upper);
    } catch (const std::out_of_range&) {
        throw MalformedModelError("cardinality " + text + " is out of range",
                                  token->getSymbol()->getLine(),
                                  token->getSymbol()->getCharPositionInLine());
    }
}
