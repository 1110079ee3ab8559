/**
 * @file Feature.cc
 * @brief Implementation of the Feature class
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "Feature.hh"
#include "Relation.hh"

Feature::Feature(const std::string& name, Type type, std::size_t line)
    : name(name)
    , type(type)
    , line(line)
    , has_cardinality(false)
    , card_min(0)
    , card_max(0) {
}

void Feature::add_relation(std::shared_ptr<Relation> relation) {
    relations.push_back(std::move(relation));
}

std::vector<std::shared_ptr<Feature>> Feature::get_children() const {
    std::vector<std::shared_ptr<Feature>> result;
    for (const auto& relation : relations) {
        const auto& children = relation->get_children();
        result.insert(result.end(), children.begin(), children.end());
    }
    return result;
}

void Feature::set_attribute(const std::string& key, const std::string& value) {
    attributes[key] = value;
}

bool Feature::is_abstract() const {
    auto it = attributes.find("abstract");
    return it != attributes.end() && it->second != "false";
}

void Feature::set_feature_cardinality(int min, int max) {
    has_cardinality = true;
    card_min = min;
    card_max = max;
}
