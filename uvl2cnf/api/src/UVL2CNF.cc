/**
 * @file UVL2CNF.cc
 * @brief Implementation of the UVL2CNF API
 *
 * @author FMAnalyzer Team
 * @date 2024
 */

#include "uvl2cnf/UVL2CNF.hh"

#include "DimacsWriter.hh"
#include "FMToCNF.hh"
#include "FeatureModelBuilder.hh"
#include "ModelErrors.hh"
#include "UVLCppLexer.h"
#include "UVLCppParser.h"
#include "UVLErrorListener.hh"
#include "antlr4-runtime.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace antlr4;
using namespace antlr4::tree;

namespace uvl2cnf {

namespace {

/**
 * @brief Copies model and CNF sizes into @p result
 */
void fill_statistics(const FeatureModel& model, const CNFModel& cnf, ConversionResult& result) {
    result.num_features = static_cast<int>(model.get_features().size());
    result.num_relations = static_cast<int>(model.get_relations().size());
    result.num_constraints = static_cast<int>(model.get_constraints().size());
    result.num_filtered_constraints = model.get_num_filtered_constraints();
    result.num_variables = cnf.get_num_variables();
    result.num_clauses = cnf.get_num_clauses();
}

} // namespace

UVL2CNF::UVL2CNF(bool verbose)
    : verbose_(verbose)
    , mode_(ConversionMode::STRAIGHTFORWARD) {
}

void UVL2CNF::set_verbose(bool verbose) {
    verbose_ = verbose;
}

void UVL2CNF::set_mode(ConversionMode mode) {
    mode_ = mode;
}

ConversionMode UVL2CNF::get_mode() const {
    return mode_;
}

CNFMode UVL2CNF::to_cnf_mode(ConversionMode mode) {
    switch (mode) {
        case ConversionMode::STRAIGHTFORWARD:
            return CNFMode::STRAIGHTFORWARD;
        case ConversionMode::TSEITIN:
            return CNFMode::TSEITIN;
    }
    throw std::logic_error("Unknown conversion mode");
}

/**
 * @brief Runs the generated lexer and parser, then the model builder
 *
 * The default ANTLR console listeners are replaced by UVLErrorListener, so
 * the first syntax error surfaces as a MalformedModelError.
 *
 * @param text UVL source
 * @return Feature model in canonical order
 * @throws MalformedModelError on syntax or semantic errors
 */
std::shared_ptr<FeatureModel> UVL2CNF::parse(const std::string& text) const {
    ANTLRInputStream input(text);

    UVLErrorListener error_listener;

    UVLCppLexer lexer(&input);
    lexer.removeErrorListeners();
    lexer.addErrorListener(&error_listener);

    CommonTokenStream tokens(&lexer);

    UVLCppParser parser(&tokens);
    parser.removeErrorListeners();
    parser.addErrorListener(&error_listener);

    if (verbose_) std::cout << "Parsing UVL syntax..." << std::endl;
    ParseTree* tree = parser.featureModel();

    if (verbose_) std::cout << "Building feature model..." << std::endl;
    FeatureModelBuilder builder;
    ParseTreeWalker::DEFAULT.walk(&builder, tree);

    auto feature_model = builder.get_feature_model();
    if (!feature_model) {
        throw std::logic_error("Feature model builder finished without a model");
    }

    if (verbose_) {
        for (const auto& warning : builder.get_warnings()) {
            std::cerr << "Warning: " << warning << std::endl;
        }
        std::cout << "  Features:    " << feature_model->get_features().size() << std::endl;
        std::cout << "  Relations:   " << feature_model->get_relations().size() << std::endl;
        std::cout << "  Constraints: " << feature_model->get_constraints().size() << std::endl;
        if (feature_model->get_num_filtered_constraints() > 0) {
            std::cout << "  Filtered:    " << feature_model->get_num_filtered_constraints()
                      << " arithmetic constraint(s)" << std::endl;
        }
    }

    return feature_model;
}

/**
 * @brief Reads @p input_file completely and parses it
 * @throws std::runtime_error if the file cannot be opened
 */
std::shared_ptr<FeatureModel> UVL2CNF::parse_file(const std::string& input_file) const {
    if (verbose_) std::cout << "Reading UVL file " << input_file << "..." << std::endl;
    std::ifstream stream(input_file);
    if (!stream.is_open()) {
        throw std::runtime_error("Could not open file: " + input_file);
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();
    return parse(buffer.str());
}

CNFModel UVL2CNF::encode(const std::shared_ptr<const FeatureModel>& model) const {
    return encode(model, mode_);
}

CNFModel UVL2CNF::encode(const std::shared_ptr<const FeatureModel>& model, ConversionMode mode) const {
    if (verbose_) {
        std::cout << "Transforming to CNF ("
                  << (mode == ConversionMode::TSEITIN ? "Tseitin" : "straightforward") << ")..." << std::endl;
    }
    FMToCNF transformer(model);
    CNFModel cnf_model = transformer.transform(to_cnf_mode(mode));
    if (verbose_) {
        std::cout << "  Variables:   " << cnf_model.get_num_variables() << std::endl;
        std::cout << "  Clauses:     " << cnf_model.get_num_clauses() << std::endl;
    }
    return cnf_model;
}

ConversionResult UVL2CNF::convert(const std::string& input_file,
                                  const std::string& output_file) {
    return convert(input_file, output_file, mode_);
}

/**
 * @brief Parses, encodes and writes one DIMACS file
 *
 * Input and output errors end up in ConversionResult::error_message. Internal
 * errors (std::logic_error) are not caught.
 *
 * @param input_file UVL file to read
 * @param output_file DIMACS file to write
 * @param mode CNF encoding of the constraints
 * @return Statistics of the model and the CNF when successful
 */
ConversionResult UVL2CNF::convert(const std::string& input_file,
                                  const std::string& output_file,
                                  ConversionMode mode) {
    ConversionResult result;
    try {
        auto model = parse_file(input_file);
        CNFModel cnf_model = encode(model, mode);

        if (verbose_) std::cout << "Writing DIMACS file " << output_file << "..." << std::endl;
        DimacsWriter writer(cnf_model);
        writer.write_to_file(output_file);

        fill_statistics(*model, cnf_model, result);
        result.success = true;
    } catch (const std::logic_error&) {
        throw;
    } catch (const std::exception& e) {
        result.error_message = e.what();
    }
    return result;
}

} // namespace uvl2cnf
