/**
 * @file FeatureModel.cc
 * @brief Canonical ordering and lookups of a feature model
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "FeatureModel.hh"
#include "ModelErrors.hh"

#include <algorithm>
#include <stdexcept>

FeatureModel::FeatureModel(std::shared_ptr<Feature> root,
                           std::vector<Constraint> constraints,
                           std::string namespace_name,
                           int num_filtered_constraints)
    : namespace_name(std::move(namespace_name))
    , root(std::move(root))
    , constraints(std::move(constraints))
    , num_filtered_constraints(num_filtered_constraints) {
    if (!this->root) {
        throw std::logic_error("FeatureModel requires a root feature");
    }

    auto by_name = [](const std::shared_ptr<Feature>& a, const std::shared_ptr<Feature>& b) {
        return a->get_name() < b->get_name();
    };

    // Breadth-first, one depth level at a time, sorted by name inside a level
    std::vector<std::shared_ptr<Feature>> level = {this->root};
    std::size_t depth = 0;
    while (!level.empty()) {
        std::sort(level.begin(), level.end(), by_name);
        std::vector<std::shared_ptr<Feature>> next_level;
        for (const auto& feature : level) {
            if (!positions.emplace(feature->get_name(), features.size()).second) {
                throw std::logic_error("Duplicated feature name in feature tree: " + feature->get_name());
            }
            features.push_back(feature);
            depths.push_back(depth);
            for (const auto& relation : feature->get_relations()) {
                relations.push_back(relation);
                const auto& children = relation->get_children();
                next_level.insert(next_level.end(), children.begin(), children.end());
            }
        }
        level = std::move(next_level);
        ++depth;
    }
}

std::shared_ptr<Feature> FeatureModel::find_feature(const std::string& name) const {
    auto it = positions.find(name);
    if (it == positions.end()) {
        return nullptr;
    }
    return features[it->second];
}

std::shared_ptr<Feature> FeatureModel::get_feature(const std::string& name) const {
    return features[index_of(name)];
}

std::size_t FeatureModel::index_of(const std::string& name) const {
    auto it = positions.find(name);
    if (it == positions.end()) {
        throw UnknownFeatureError(name);
    }
    return it->second;
}

std::size_t FeatureModel::depth_of(const std::string& name) const {
    return depths[index_of(name)];
}

std::vector<std::string> FeatureModel::get_feature_names() const {
    std::vector<std::string> names;
    names.reserve(features.size());
    for (const auto& feature : features) {
        names.push_back(feature->get_name());
    }
    return names;
}
