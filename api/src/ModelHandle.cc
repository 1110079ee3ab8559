/**
 * @file ModelHandle.cc
 * @brief Implementation of model handles
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "fmanalyzer/ModelHandle.hh"

namespace fmanalyzer {

ModelHandle::ModelHandle(std::shared_ptr<const FeatureModel> model, uvl2cnf::ConversionMode mode)
    : model_(std::move(model))
    , mode_(mode) {}

/**
 * @brief Parses @p text with the UVL front end; encoding is deferred
 * @throws MalformedModelError if the text is not a well-formed model
 */
std::shared_ptr<const ModelHandle> ModelHandle::parse(const std::string& text,
                                                      uvl2cnf::ConversionMode mode,
                                                      bool verbose) {
    uvl2cnf::UVL2CNF converter(verbose);
    std::shared_ptr<const FeatureModel> model = converter.parse(text);
    return std::make_shared<const ModelHandle>(std::move(model), mode);
}

/**
 * @brief Builds the configuration space on first use
 *
 * Concurrent first callers block until one of them has built it, and all of
 * them receive the same object.
 */
const ConfigurationSpace& ModelHandle::get_configuration_space() const {
    // A throwing encoder leaves the flag unset, so the next caller retries
    std::call_once(space_once_, [this]() {
        uvl2cnf::UVL2CNF converter;
        space_ = std::make_unique<const ConfigurationSpace>(model_, converter.encode(model_, mode_));
    });
    return *space_;
}

} // namespace fmanalyzer
