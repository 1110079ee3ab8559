/**
 * @file simple_analysis.cc
 * @brief Simple example of using the FMAnalyzer API
 *
 * Loads a model once and runs a handful of analyses on the same handle.
 */

#include <fstream>
#include <iostream>
#include <sstream>
#include "fmanalyzer/FMAnalyzerAPI.hh"

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <model.uvl>\n";
        std::cerr << "\nExample:\n";
        std::cerr << "  " << argv[0] << " model.uvl\n";
        return 1;
    }

    std::ifstream file(argv[1]);
    if (!file) {
        std::cerr << "Cannot open " << argv[1] << "\n";
        return 1;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    fmanalyzer::FMAnalyzerAPI api;
    api.set_verbose(false);

    // Parse once; every query below reuses the same handle and encoding
    std::shared_ptr<const fmanalyzer::ModelHandle> handle;
    try {
        handle = api.load(buffer.str());
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    const char* operations[] = {
        "satisfiability",
        "configurations_number",
        "estimated_number_of_configurations",
        "core_features",
        "dead_features",
        "false_optional_features",
        "max_depth",
        "average_branching_factor",
        "variability",
    };

    std::cout << "Analyzing: " << argv[1] << "\n";
    std::cout << "  Features: " << handle->get_model().get_features().size() << "\n\n";

    for (const char* operation : operations) {
        fmanalyzer::QueryRequest request;
        request.operation = operation;

        auto result = api.run(handle, request);
        if (!result.success) {
            std::cerr << operation << " failed: " << result.error_message << "\n";
            return 1;
        }
        std::cout << "  " << operation << ": " << fmanalyzer::format_value(result.value) << "\n";
    }

    return 0;
}
