/**
 * @file Configuration.hh
 * @brief Complete and partial feature selections
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef FMANALYZER_CONFIGURATION_H
#define FMANALYZER_CONFIGURATION_H

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fmanalyzer {

/**
 * @brief Features forced selected (true) or unselected (false)
 */
using PartialConfiguration = std::map<std::string, bool>;

/**
 * @class Configuration
 * @brief Immutable total assignment of every feature of a model
 *
 * Values are stored in canonical feature order. The list of names is shared
 * between all configurations produced for the same model.
 */
class Configuration {
private:
    std::shared_ptr<const std::vector<std::string>> names_;
    std::vector<bool> values_;

public:
    /**
     * @param names Feature names in canonical order
     * @param values values[i] tells whether names[i] is selected
     * @throws std::logic_error if the sizes differ
     */
    Configuration(std::shared_ptr<const std::vector<std::string>> names, std::vector<bool> values);

    /**
     * @throws UnknownFeatureError if the model has no feature @p name
     */
    bool is_selected(const std::string& name) const;

    /**
     * @brief Names of the selected features, in canonical order
     */
    std::vector<std::string> get_selected_features() const;

    const std::vector<std::string>& get_feature_names() const { return *names_; }
    const std::vector<bool>& get_values() const { return values_; }
    std::size_t size() const { return values_.size(); }

    /**
     * @brief Selected feature names as "[A, B, C]"
     */
    std::string to_string() const;

    bool operator==(const Configuration& other) const;
    bool operator!=(const Configuration& other) const { return !(*this == other); }
};

/**
 * @brief Reads a partial configuration from its textual form
 *
 * One `name,value` entry per line. Values are `True`/`False`, `1`/`0` or
 * `selected`/`unselected`, case-insensitive. Blank lines and lines starting
 * with `#` are skipped. Names are not checked against any model here.
 *
 * @code
 * auto criteria = fmanalyzer::parse_partial_configuration("GPS,True\nElectric,False\n");
 * @endcode
 *
 * @throws std::invalid_argument on a malformed line, an unknown value, or a
 *         feature listed twice with different values
 */
PartialConfiguration parse_partial_configuration(const std::string& text);

} // namespace fmanalyzer

#endif // FMANALYZER_CONFIGURATION_H
