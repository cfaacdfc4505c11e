// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#pragma once

#include "mwm/common.hpp"
#include "mwm/model.hpp"
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace mwm {
namespace synth {

// Process exit codes of the driver
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;    // Bad command line
constexpr int EXIT_FAILED = 2;   // Input, fit or sampling error

/**
 * @brief Driver configuration, filled from the command line.
 */
struct SynthConfig {
    std::string input_path;          // Series to fit ("-" reads stdin)
    std::string output_path;         // Empty writes paths to the output stream
    FitConfig fit;                   // Blocks or scales selection
    bool has_scales = false;         // --scales given, even as 0
    int paths = 1;                   // Number of synthetic paths to draw
    bool has_seed = false;
    std::uint64_t seed = 0;          // Seed for reproducible paths
    bool model_only = false;         // Fit and report, draw nothing
    bool quiet = false;
    bool verbose = false;
    bool show_help = false;
};

/**
 * @brief Print usage information.
 *
 * @param out Stream to write to
 * @param program_name Name shown in the usage line
 */
void print_usage(std::ostream& out, const char* program_name);

/**
 * @brief Parse command-line arguments.
 *
 * @param argc Argument count
 * @param argv Argument vector, argv[0] being the program name
 * @return SynthConfig Parsed configuration
 * @throws std::invalid_argument on unknown options, missing or malformed values
 */
SynthConfig parse_args(int argc, const char* const argv[]);

/**
 * @brief Read a whitespace-separated series; '#' starts a comment.
 *
 * @param in Stream to read
 * @return std::vector<scalar_t> Values in order of appearance
 * @throws std::runtime_error on a token that is not a finite number
 */
std::vector<scalar_t> read_series(std::istream& in);

/**
 * @brief Read a series from a file, or from stdin for "-".
 */
std::vector<scalar_t> load_series(const std::string& path);

/**
 * @brief Write one path as a line of comma-separated values.
 */
void write_path(std::ostream& out, const std::vector<scalar_t>& path);

/**
 * @brief Fit a series as selected by the configuration.
 *
 * An explicit --scales (zero included) fits with that many scales; otherwise
 * the block count is used.
 */
Model fit_series(const std::vector<scalar_t>& series, const SynthConfig& config);

/**
 * @brief Fit, report and sample according to a parsed configuration.
 *
 * @param config Parsed configuration
 * @param out Destination of the paths when no output file is set
 * @param log Destination of the report and error messages
 * @return int EXIT_OK or EXIT_FAILED
 */
int run(const SynthConfig& config, std::ostream& out, std::ostream& log);

/**
 * @brief Full driver: parse, then run.
 *
 * @return int EXIT_OK, EXIT_USAGE or EXIT_FAILED
 */
int run_cli(int argc, const char* const argv[], std::ostream& out, std::ostream& log);

} // namespace synth
} // namespace mwm
