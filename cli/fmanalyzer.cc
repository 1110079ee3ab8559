/**
 * @file fmanalyzer.cc
 * @brief FMAnalyzer - command-line front end for feature model analyses
 *
 * Reads a UVL model, runs one named operation on it and prints the result.
 *
 * Usage:
 *   fmanalyzer <model.uvl> <operation> [options]
 *
 * Exit codes: 0 on success, 1 when the query fails (malformed model, unknown
 * feature, time limit, bad parameter), 2 on an internal error.
 */

#include "fmanalyzer/FMAnalyzerAPI.hh"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// ANSI color codes
const std::string COLOR_GREEN = "\033[32m";
const std::string COLOR_YELLOW = "\033[33m";
const std::string COLOR_RESET = "\033[0m";

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <model.uvl> <operation> [options]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  model.uvl            Feature model in UVL format\n";
    std::cout << "  operation            Analysis to run (see below)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -f, --feature NAME   Feature for feature_ancestors and commonality\n";
    std::cout << "  -s, --select A,B     Selected features for satisfiable_configuration\n";
    std::cout << "  -c, --criteria FILE  Partial configuration for filter (name,True|False per line)\n";
    std::cout << "  -n, --samples N      Number of configurations for sampling (default: 10)\n";
    std::cout << "  -T, --timeout MS     Time limit in milliseconds (default: none)\n";
    std::cout << "  -j, --threads N      Threads for feature_inclusion_probability (default: 1)\n";
    std::cout << "  -e, --enable-tseitin Tseitin transformation for the CNF encoding\n";
    std::cout << "  -q, --quiet          Print the result only\n";
    std::cout << "  -h, --help           Display this help message\n\n";
    std::cout << "Operations:\n";
    for (const auto& name : fmanalyzer::operation_names()) {
        std::cout << "  " << name << "\n";
    }
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " model.uvl configurations_number\n";
    std::cout << "  " << program_name << " model.uvl commonality -f GPS\n";
    std::cout << "  " << program_name << " model.uvl satisfiable_configuration -s Car,Engine,GPS\n";
    std::cout << "  " << program_name << " model.uvl filter -c criteria.csvconf\n";
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> split_names(const std::string& list) {
    std::vector<std::string> names;
    std::stringstream stream(list);
    std::string name;
    while (std::getline(stream, name, ',')) {
        if (!name.empty()) {
            names.push_back(name);
        }
    }
    return names;
}

long long parse_number(const std::string& option, const std::string& text) {
    try {
        std::size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::invalid_argument&) {
        // reported below
    } catch (const std::out_of_range&) {
        // reported below
    }
    throw std::runtime_error("Option " + option + " expects a number, got '" + text + "'");
}

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    fmanalyzer::QueryRequest request;
    fmanalyzer::AnalysisConfig config;
    config.verbose = true;
    std::string criteria_file;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "-q" || arg == "--quiet") {
                config.verbose = false;
            } else if (arg == "-e" || arg == "--enable-tseitin") {
                config.conversion_mode = uvl2cnf::ConversionMode::TSEITIN;
            } else if ((arg == "-f" || arg == "--feature") && has_value) {
                request.feature = argv[++i];
            } else if ((arg == "-s" || arg == "--select") && has_value) {
                request.selection = split_names(argv[++i]);
            } else if ((arg == "-c" || arg == "--criteria") && has_value) {
                criteria_file = argv[++i];
            } else if ((arg == "-n" || arg == "--samples") && has_value) {
                request.sample_size = parse_number(arg, argv[++i]);
            } else if ((arg == "-T" || arg == "--timeout") && has_value) {
                config.timeout_ms = parse_number(arg, argv[++i]);
            } else if ((arg == "-j" || arg == "--threads") && has_value) {
                config.num_threads = static_cast<int>(parse_number(arg, argv[++i]));
            } else if (arg[0] != '-') {
                positional.push_back(arg);
            } else {
                std::cerr << "Error: Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (positional.size() != 2) {
        std::cerr << "Error: Expected a model file and an operation\n";
        print_usage(argv[0]);
        return 1;
    }

    const std::string& model_file = positional[0];
    request.operation = positional[1];

    if (!fs::exists(model_file)) {
        std::cerr << "Error: Input file not found: " << model_file << "\n";
        return 1;
    }

    try {
        request.model_text = read_file(model_file);
        if (!criteria_file.empty()) {
            request.criteria = read_file(criteria_file);
        }

        fmanalyzer::FMAnalyzerAPI api;
        std::string validation_error = api.validate_config(config);
        if (!validation_error.empty()) {
            std::cerr << "Error: " << validation_error << "\n";
            return 1;
        }
        api.set_config(config);

        if (config.verbose) {
            std::cout << COLOR_YELLOW << "Model: " << COLOR_RESET << model_file << "\n";
            std::cout << "  Mode: "
                      << (config.conversion_mode == uvl2cnf::ConversionMode::TSEITIN ? "Tseitin" : "Straightforward")
                      << "\n";
        }

        fmanalyzer::QueryResult result = api.run(request);

        if (!result.success) {
            std::cerr << "\nError [" << fmanalyzer::error_kind_name(result.error_kind) << "]: "
                      << result.error_message << "\n";
            return 1;
        }

        if (config.verbose) {
            std::cout << COLOR_GREEN << "\nResult:\n" << COLOR_RESET;
        }
        std::cout << fmanalyzer::format_value(result.value) << "\n";
        return 0;

    } catch (const std::logic_error& e) {
        std::cerr << "Internal error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
