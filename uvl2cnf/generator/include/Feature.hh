/**
 * @file Feature.hh
 * @brief A named node of a feature tree
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef FEATURE_H
#define FEATURE_H

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

class Relation;

/**
 * @class Feature
 * @brief A feature of a variability model
 *
 * A feature owns the relations (groups) that attach its children. The parent
 * link is non-owning. Type, feature cardinality and attributes are recorded as
 * read from the model; only the relations take part in the boolean semantics.
 */
class Feature {
public:
    /**
     * @enum Type
     * @brief UVL feature type keyword (Boolean when omitted)
     */
    enum class Type {
        BOOLEAN,
        INTEGER,
        REAL,
        STRING
    };

private:
    std::string name;
    Type type;
    std::size_t line;
    std::weak_ptr<Feature> parent;
    std::vector<std::shared_ptr<Relation>> relations;
    std::map<std::string, std::string> attributes;
    bool has_cardinality;
    int card_min;
    int card_max;

public:
    /**
     * @brief Creates a feature
     *
     * @param name Feature name, verbatim (quoted names keep their quotes)
     * @param type Feature type
     * @param line Source line of the declaration
     */
    explicit Feature(const std::string& name, Type type = Type::BOOLEAN, std::size_t line = 0);

    const std::string& get_name() const { return name; }
    Type get_type() const { return type; }
    std::size_t get_line() const { return line; }

    /**
     * @brief Parent feature, or nullptr for the root
     */
    std::shared_ptr<Feature> get_parent() const { return parent.lock(); }
    void set_parent(const std::shared_ptr<Feature>& feature) { parent = feature; }

    bool is_root() const { return parent.expired(); }
    bool is_leaf() const { return relations.empty(); }

    /**
     * @brief Relations whose parent is this feature, in declaration order
     */
    const std::vector<std::shared_ptr<Relation>>& get_relations() const { return relations; }
    void add_relation(std::shared_ptr<Relation> relation);

    /**
     * @brief Children over all relations, in declaration order
     */
    std::vector<std::shared_ptr<Feature>> get_children() const;

    void set_attribute(const std::string& key, const std::string& value);
    const std::map<std::string, std::string>& get_attributes() const { return attributes; }

    /**
     * @brief Whether the feature carries the "abstract" attribute
     */
    bool is_abstract() const;

    /**
     * @brief Records a feature cardinality [min..max]; max is -1 for '*'
     */
    void set_feature_cardinality(int min, int max);
    bool has_feature_cardinality() const { return has_cardinality; }
    int get_card_min() const { return card_min; }
    int get_card_max() const { return card_max; }
};

#endif // FEATURE_H
