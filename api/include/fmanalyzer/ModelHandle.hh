/**
 * @file ModelHandle.hh
 * @brief Immutable handle on a parsed feature model
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#ifndef FMANALYZER_MODELHANDLE_H
#define FMANALYZER_MODELHANDLE_H

#include "FeatureModel.hh"
#include "fmanalyzer/ConfigurationSpace.hh"
#include "uvl2cnf/UVL2CNF.hh"

#include <memory>
#include <mutex>
#include <string>

namespace fmanalyzer {

/**
 * @class ModelHandle
 * @brief A parsed model plus its lazily built configuration space
 *
 * Handles are created by parsing and passed to every analysis; there is no
 * process-wide current model. The feature model never changes after parsing.
 * The CNF encoding and configuration space are built on first use, exactly
 * once even when several threads ask at the same time, and shared read-only
 * afterwards.
 *
 * @code
 * auto handle = fmanalyzer::ModelHandle::parse(text);
 * const auto& space = handle->get_configuration_space();
 * bool ok = space.is_satisfiable();
 * @endcode
 */
class ModelHandle {
private:
    std::shared_ptr<const FeatureModel> model_;
    uvl2cnf::ConversionMode mode_;

    mutable std::once_flag space_once_;
    mutable std::unique_ptr<const ConfigurationSpace> space_;

public:
    ModelHandle(std::shared_ptr<const FeatureModel> model, uvl2cnf::ConversionMode mode);

    ModelHandle(const ModelHandle&) = delete;
    ModelHandle& operator=(const ModelHandle&) = delete;

    /**
     * @brief Parses UVL text into a new handle
     *
     * @param text UVL source
     * @param mode Encoding used when the configuration space is built
     * @param verbose Whether the parser reports warnings on std::cout
     * @throws MalformedModelError if the text is not a well-formed model
     */
    static std::shared_ptr<const ModelHandle> parse(const std::string& text,
                                                    uvl2cnf::ConversionMode mode = uvl2cnf::ConversionMode::STRAIGHTFORWARD,
                                                    bool verbose = false);

    const FeatureModel& get_model() const { return *model_; }
    const std::shared_ptr<const FeatureModel>& get_model_ptr() const { return model_; }
    uvl2cnf::ConversionMode get_mode() const { return mode_; }

    /**
     * @brief Configuration space of the model, encoding it on first call
     */
    const ConfigurationSpace& get_configuration_space() const;
};

} // namespace fmanalyzer

#endif // FMANALYZER_MODELHANDLE_H
