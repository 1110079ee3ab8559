/**
 * @file Relation.hh
 * @brief Parent-child relation (group) of a feature tree
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef RELATION_H
#define RELATION_H

#include <memory>
#include <string>
#include <vector>

class Feature;

/**
 * @class Relation
 * @brief A group of children attached to a parent feature
 *
 * MANDATORY and OPTIONAL relations always have exactly one child: a UVL
 * "mandatory" block with three features becomes three relations. OR,
 * ALTERNATIVE and CARDINALITY relations hold every feature of their block.
 *
 * Cardinality semantics:
 * | Type        | card_min | card_max       |
 * |-------------|----------|----------------|
 * | MANDATORY   | 1        | 1              |
 * | OPTIONAL    | 0        | 1              |
 * | OR          | 1        | #children      |
 * | ALTERNATIVE | 1        | 1              |
 * | CARDINALITY | m        | n              |
 */
class Relation {
public:
    enum class Type {
        MANDATORY,
        OPTIONAL,
        OR,
        ALTERNATIVE,
        CARDINALITY
    };

private:
    Type type;
    std::weak_ptr<Feature> parent;
    std::vector<std::shared_ptr<Feature>> children;
    int card_min;
    int card_max;

public:
    Relation(Type type,
             const std::shared_ptr<Feature>& parent,
             std::vector<std::shared_ptr<Feature>> children,
             int card_min,
             int card_max);

    static std::shared_ptr<Relation> make_mandatory(const std::shared_ptr<Feature>& parent,
                                                    const std::shared_ptr<Feature>& child);
    static std::shared_ptr<Relation> make_optional(const std::shared_ptr<Feature>& parent,
                                                   const std::shared_ptr<Feature>& child);
    static std::shared_ptr<Relation> make_or(const std::shared_ptr<Feature>& parent,
                                             std::vector<std::shared_ptr<Feature>> children);
    static std::shared_ptr<Relation> make_alternative(const std::shared_ptr<Feature>& parent,
                                                      std::vector<std::shared_ptr<Feature>> children);

    /**
     * @brief Creates a group cardinality relation [min..max]
     *
     * max = -1 stands for '*' (all children). [1..1] is normalised to an
     * ALTERNATIVE and [1..n] with n covering every child to an OR relation.
     */
    static std::shared_ptr<Relation> make_cardinality(const std::shared_ptr<Feature>& parent,
                                                      std::vector<std::shared_ptr<Feature>> children,
                                                      int min,
                                                      int max);

    Type get_type() const { return type; }
    std::shared_ptr<Feature> get_parent() const { return parent.lock(); }
    const std::vector<std::shared_ptr<Feature>>& get_children() const { return children; }
    int get_card_min() const { return card_min; }
    int get_card_max() const { return card_max; }

    bool is_mandatory() const { return type == Type::MANDATORY; }
    bool is_optional() const { return type == Type::OPTIONAL; }

    /**
     * @brief Keyword of the relation type ("mandatory", "or", "[2..3]", ...)
     */
    std::string type_name() const;
};

#endif // RELATION_H
