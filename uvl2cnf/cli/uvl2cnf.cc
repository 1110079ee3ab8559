/**
 * @file uvl2cnf.cc
 * @brief Command-line interface for the UVL to DIMACS CNF converter
 *
 * This program encodes Universal Variability Language (UVL) feature models
 * as DIMACS CNF for SAT solver input.
 */

#include "uvl2cnf/UVL2CNF.hh"
#include "DimacsWriter.hh"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

/**
 * @brief Print usage information
 * @param program_name Name of the program executable
 */
void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [-t|-s] [-q] <input.uvl> [output.dimacs]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Description:" << std::endl;
    std::cerr << "  Encodes a UVL (Universal Variability Language) feature model" << std::endl;
    std::cerr << "  as DIMACS CNF. Without an output file the CNF goes to stdout." << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  -s            Straightforward conversion without auxiliary variables (default)" << std::endl;
    std::cerr << "  -t            Tseitin transformation with auxiliary variables" << std::endl;
    std::cerr << "  -q            Quiet: no progress messages" << std::endl;
}

int main(int argc, char* argv[]) {
    uvl2cnf::ConversionMode mode = uvl2cnf::ConversionMode::STRAIGHTFORWARD;
    bool verbose = true;

    int arg_index = 1;
    while (arg_index < argc && argv[arg_index][0] == '-') {
        std::string flag = argv[arg_index];
        if (flag == "-t") {
            mode = uvl2cnf::ConversionMode::TSEITIN;
        } else if (flag == "-s") {
            mode = uvl2cnf::ConversionMode::STRAIGHTFORWARD;
        } else if (flag == "-q") {
            verbose = false;
        } else {
            std::cerr << "Error: Unknown flag '" << flag << "'" << std::endl;
            print_usage(argv[0]);
            return 1;
        }
        arg_index++;
    }

    int remaining = argc - arg_index;
    if (remaining < 1 || remaining > 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string input_file = argv[arg_index];
    std::string output_file = remaining == 2 ? argv[arg_index + 1] : "";

    // Progress goes to stderr when the CNF itself is written to stdout
    bool to_stdout = output_file.empty();
    std::ostream& log = to_stdout ? std::cerr : std::cout;

    auto start_time = std::chrono::steady_clock::now();

    try {
        if (verbose) {
            log << "UVL to CNF Converter" << std::endl;
            log << "====================" << std::endl;
            log << "CNF Mode: " << (mode == uvl2cnf::ConversionMode::TSEITIN
                                        ? "Tseitin (with auxiliary variables)"
                                        : "Straightforward (no auxiliary variables)") << std::endl;
            log << "Input:  " << input_file << std::endl;
            log << "Output: " << (to_stdout ? "<stdout>" : output_file) << std::endl;
            log << std::endl;
        }

        uvl2cnf::UVL2CNF converter(verbose && !to_stdout);
        converter.set_mode(mode);

        auto feature_model = converter.parse_file(input_file);
        CNFModel cnf_model = converter.encode(feature_model);

        DimacsWriter writer(cnf_model);
        if (to_stdout) {
            writer.write(std::cout);
        } else {
            writer.write_to_file(output_file);
        }

        if (verbose) {
            auto end_time = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
            log << std::endl;
            log << "Features: " << feature_model->get_features().size()
                << ", variables: " << cnf_model.get_num_variables()
                << ", clauses: " << cnf_model.get_num_clauses() << std::endl;
            if (feature_model->get_num_filtered_constraints() > 0) {
                log << "Filtered arithmetic constraints: "
                    << feature_model->get_num_filtered_constraints() << std::endl;
            }
            log << "Time elapsed: " << duration.count() << " ms" << std::endl;
        }

        return 0;

    } catch (const std::logic_error& e) {
        std::cerr << "Internal error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
