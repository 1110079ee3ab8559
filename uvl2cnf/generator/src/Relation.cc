/**
 * @file Relation.cc
 * @brief Implementation of feature relations and their factories
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "Relation.hh"
#include "Feature.hh"

Relation::Relation(Type type,
                   const std::shared_ptr<Feature>& parent,
                   std::vector<std::shared_ptr<Feature>> children,
                   int card_min,
                   int card_max)
    : type(type)
    , parent(parent)
    , children(std::move(children))
    , card_min(card_min)
    , card_max(card_max) {
}

std::shared_ptr<Relation> Relation::make_mandatory(const std::shared_ptr<Feature>& parent,
                                                   const std::shared_ptr<Feature>& child) {
    return std::make_shared<Relation>(Type::MANDATORY, parent,
                                      std::vector<std::shared_ptr<Feature>>{child}, 1, 1);
}

std::shared_ptr<Relation> Relation::make_optional(const std::shared_ptr<Feature>& parent,
                                                  const std::shared_ptr<Feature>& child) {
    return std::make_shared<Relation>(Type::OPTIONAL, parent,
                                      std::vector<std::shared_ptr<Feature>>{child}, 0, 1);
}

std::shared_ptr<Relation> Relation::make_or(const std::shared_ptr<Feature>& parent,
                                            std::vector<std::shared_ptr<Feature>> children) {
    int max = static_cast<int>(children.size());
    return std::make_shared<Relation>(Type::OR, parent, std::move(children), 1, max);
}

std::shared_ptr<Relation> Relation::make_alternative(const std::shared_ptr<Feature>& parent,
                                                     std::vector<std::shared_ptr<Feature>> children) {
    return std::make_shared<Relation>(Type::ALTERNATIVE, parent, std::move(children), 1, 1);
}

std::shared_ptr<Relation> Relation::make_cardinality(const std::shared_ptr<Feature>& parent,
                                                     std::vector<std::shared_ptr<Feature>> children,
                                                     int min,
                                                     int max) {
    int num_children = static_cast<int>(children.size());
    if (max < 0 || max > num_children) {
        max = num_children;
    }

    // [1..1] and [1..n] are the classic group kinds
    if (min == 1 && max == 1) {
        return make_alternative(parent, std::move(children));
    }
    if (min == 1 && max == num_children) {
        return make_or(parent, std::move(children));
    }

    return std::make_shared<Relation>(Type::CARDINALITY, parent, std::move(children), min, max);
}

std::string Relation::type_name() const {
    switch (type) {
        case Type::MANDATORY:
            return "mandatory";
        case Type::OPTIONAL:
            return "optional";
        case Type::OR:
            return "or";
        case Type::ALTERNATIVE:
            return "alternative";
        case Type::CARDINALITY:
            return "[" + std::to_string(card_min) + ".." + std::to_string(card_max) + "]";
    }
    return "unknown";
}
