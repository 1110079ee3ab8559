/**
 * @file FeatureModel.hh
 * @brief Feature tree plus cross-tree constraints
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef FEATUREMODEL_H
#define FEATUREMODEL_H

#include "Constraint.hh"
#include "Feature.hh"
#include "Relation.hh"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * @class FeatureModel
 * @brief Immutable, fully linked feature model
 *
 * Features are kept in canonical order: breadth-first by depth, ascending by
 * name within a depth. The root comes first. Every list the model hands out
 * (features, relations) follows this order, and the encoder numbers the CNF
 * variables with it, so the canonical order is also the order in which the
 * solving layer breaks ties.
 *
 * Example:
 * @code
 * features
 *     Car
 *         mandatory
 *             Engine
 *         optional
 *             Radio
 *             Alarm
 * @endcode
 * has canonical order Car, Alarm, Engine, Radio.
 */
class FeatureModel {
private:
    std::string namespace_name;
    std::shared_ptr<Feature> root;
    std::vector<std::shared_ptr<Feature>> features;
    std::map<std::string, std::size_t> positions;
    std::vector<std::size_t> depths;
    std::vector<std::shared_ptr<Relation>> relations;
    std::vector<Constraint> constraints;
    int num_filtered_constraints;

public:
    /**
     * @brief Links a feature tree with its constraints
     *
     * @param root Root feature; the tree below it must be complete
     * @param constraints Propositional cross-tree constraints
     * @param namespace_name Value of the namespace declaration (may be empty)
     * @param num_filtered_constraints Constraints dropped because they are not propositional
     * @throws std::logic_error if the tree holds two features with the same name
     */
    FeatureModel(std::shared_ptr<Feature> root,
                 std::vector<Constraint> constraints,
                 std::string namespace_name = "",
                 int num_filtered_constraints = 0);

    const std::string& get_namespace() const { return namespace_name; }
    const std::shared_ptr<Feature>& get_root() const { return root; }

    /**
     * @brief All features in canonical order
     */
    const std::vector<std::shared_ptr<Feature>>& get_features() const { return features; }

    /**
     * @brief All relations, grouped by parent in canonical order
     */
    const std::vector<std::shared_ptr<Relation>>& get_relations() const { return relations; }

    const std::vector<Constraint>& get_constraints() const { return constraints; }
    int get_num_filtered_constraints() const { return num_filtered_constraints; }

    /**
     * @brief Looks a feature up by name
     * @return The feature, or nullptr if absent
     */
    std::shared_ptr<Feature> find_feature(const std::string& name) const;

    /**
     * @brief Looks a feature up by name
     * @throws UnknownFeatureError if absent
     */
    std::shared_ptr<Feature> get_feature(const std::string& name) const;

    bool has_feature(const std::string& name) const { return positions.count(name) > 0; }

    /**
     * @brief Position of a feature in canonical order (root = 0)
     * @throws UnknownFeatureError if absent
     */
    std::size_t index_of(const std::string& name) const;

    /**
     * @brief Number of edges between the root and the feature
     * @throws UnknownFeatureError if absent
     */
    std::size_t depth_of(const std::string& name) const;

    /**
     * @brief Names of all features in canonical order
     */
    std::vector<std::string> get_feature_names() const;
};

#endif // FEATUREMODEL_H
