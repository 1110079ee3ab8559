/**
 * @file Configuration.cc
 * @brief Implementation of configurations and the partial configuration reader
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "fmanalyzer/Configuration.hh"
#include "ModelErrors.hh"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace fmanalyzer {

namespace {

std::string trim(const std::string& text) {
    std::size_t first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

} // namespace

Configuration::Configuration(std::shared_ptr<const std::vector<std::string>> names,
                             std::vector<bool> values)
    : names_(std::move(names))
    , values_(std::move(values)) {
    if (!names_ || names_->size() != values_.size()) {
        throw std::logic_error("Configuration size does not match the number of features");
    }
}

bool Configuration::is_selected(const std::string& name) const {
    auto it = std::find(names_->begin(), names_->end(), name);
    if (it == names_->end()) {
        throw UnknownFeatureError(name);
    }
    return values_[static_cast<std::size_t>(it - names_->begin())];
}

std::vector<std::string> Configuration::get_selected_features() const {
    std::vector<std::string> selected;
    for (std::size_t i = 0; i < values_.size(); ++i) {
        if (values_[i]) {
            selected.push_back((*names_)[i]);
        }
    }
    return selected;
}

std::string Configuration::to_string() const {
    std::string text = "[";
    bool first = true;
    for (const auto& name : get_selected_features()) {
        if (!first) {
            text += ", ";
        }
        text += name;
        first = false;
    }
    return text + "]";
}

bool Configuration::operator==(const Configuration& other) const {
    return values_ == other.values_ && *names_ == *other.names_;
}

/**
 * @brief Reads "feature,value" lines
 *
 * Values are true/false, 1/0 or selected/unselected, in any case. Blank lines
 * and lines starting with '#' are skipped. Feature names are not checked
 * against a model here.
 *
 * @throws std::invalid_argument on a malformed line or a feature given both values
 */
PartialConfiguration parse_partial_configuration(const std::string& text) {
    PartialConfiguration criteria;
    std::istringstream stream(text);
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::size_t comma = line.rfind(',');
        if (comma == std::string::npos) {
            throw std::invalid_argument("Line " + std::to_string(line_number) +
                                        ": expected 'feature,value' but got '" + line + "'");
        }
        std::string name = trim(line.substr(0, comma));
        std::string value = to_lower(trim(line.substr(comma + 1)));
        if (name.empty()) {
            throw std::invalid_argument("Line " + std::to_string(line_number) + ": missing feature name");
        }

        bool selected;
        if (value == "true" || value == "1" || value == "selected") {
            selected = true;
        } else if (value == "false" || value == "0" || value == "unselected") {
            selected = false;
        } else {
            throw std::invalid_argument("Line " + std::to_string(line_number) +
                                        ": unknown value '" + value + "' for feature " + name);
        }

        auto inserted = criteria.emplace(name, selected);
        if (!inserted.second && inserted.first->second != selected) {
            throw std::invalid_argument("Feature " + name + " is both selected and unselected");
        }
    }
    return criteria;
}

} // namespace fmanalyzer
