/**
 * @file FeatureModelBuilder.hh
 * @brief Parse-tree listener that builds a FeatureModel
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef FEATUREMODELBUILDER_H
#define FEATUREMODELBUILDER_H

#include "FeatureModel.hh"
#include "UVLCppParserBaseListener.h"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

/**
 * @class FeatureModelBuilder
 * @brief Walks a UVL parse tree and assembles the feature model
 *
 * Besides the syntax, which the grammar already checks, the builder enforces
 * the semantic rules of a well-formed model and throws MalformedModelError
 * with the location of the offending element when one is violated:
 * - exactly one root feature,
 * - feature names are unique,
 * - constraints only reference declared features,
 * - no imports (the engine never reads other files).
 *
 * Arithmetic constraints are dropped with a warning, as they need an SMT
 * solver. Constraints given as feature attributes are added to the
 * constraint set.
 *
 * Example:
 * @code
 * FeatureModelBuilder builder;
 * antlr4::tree::ParseTreeWalker::DEFAULT.walk(&builder, parser.featureModel());
 * auto model = builder.get_feature_model();
 * @endcode
 */
class FeatureModelBuilder : public UVLCppParserBaseListener {
private:
    /**
     * @brief Group whose children are still being read
     */
    struct PendingGroup {
        Relation::Type type;
        std::shared_ptr<Feature> parent;
        std::vector<std::shared_ptr<Feature>> children;
        int card_min;
        int card_max;
    };

    std::shared_ptr<FeatureModel> feature_model;
    std::shared_ptr<Feature> root;
    std::string namespace_name;
    std::vector<std::shared_ptr<Feature>> feature_stack;
    std::vector<PendingGroup> group_stack;
    std::map<std::string, std::size_t> declared;
    std::vector<Constraint> constraints;
    int num_filtered_constraints;
    std::vector<std::string> warnings;

public:
    FeatureModelBuilder();

    /**
     * @brief The model built by the last walk, or nullptr before a walk
     */
    std::shared_ptr<FeatureModel> get_feature_model() const { return feature_model; }

    /**
     * @brief Non-fatal findings (filtered constraints), in source order
     */
    const std::vector<std::string>& get_warnings() const { return warnings; }

    void enterNamespaceDecl(UVLCppParser::NamespaceDeclContext* ctx) override;
    void enterImports(UVLCppParser::ImportsContext* ctx) override;

    void enterFeature(UVLCppParser::FeatureContext* ctx) override;
    void exitFeature(UVLCppParser::FeatureContext* ctx) override;

    void enterOrGroup(UVLCppParser::OrGroupContext* ctx) override;
    void exitOrGroup(UVLCppParser::OrGroupContext* ctx) override;
    void enterAlternativeGroup(UVLCppParser::AlternativeGroupContext* ctx) override;
    void exitAlternativeGroup(UVLCppParser::AlternativeGroupContext* ctx) override;
    void enterOptionalGroup(UVLCppParser::OptionalGroupContext* ctx) override;
    void exitOptionalGroup(UVLCppParser::OptionalGroupContext* ctx) override;
    void enterMandatoryGroup(UVLCppParser::MandatoryGroupContext* ctx) override;
    void exitMandatoryGroup(UVLCppParser::MandatoryGroupContext* ctx) override;
    void enterCardinalityGroup(UVLCppParser::CardinalityGroupContext* ctx) override;
    void exitCardinalityGroup(UVLCppParser::CardinalityGroupContext* ctx) override;

    void exitConstraintLine(UVLCppParser::ConstraintLineContext* ctx) override;

    void exitFeatureModel(UVLCppParser::FeatureModelContext* ctx) override;

private:
    void open_group(Relation::Type type, int card_min, int card_max);
    void close_group();

    void add_attributes(const std::shared_ptr<Feature>& feature, UVLCppParser::AttributesContext* ctx);
    void add_constraint(UVLCppParser::ConstraintContext* ctx);

    /**
     * @brief Lowers a constraint parse tree to an AST
     * @return nullptr if the constraint contains an arithmetic equation
     */
    std::shared_ptr<const ASTNode> to_ast(UVLCppParser::ConstraintContext* ctx) const;

    /**
     * @brief Reads "[n]", "[n..m]" or "[n..*]"; '*' yields max = -1
     */
    static void parse_cardinality(antlr4::tree::TerminalNode* token, int& min, int& max);
};

#endif // FEATUREMODELBUILDER_H
