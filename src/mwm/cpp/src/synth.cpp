// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "mwm/synth.hpp"
#include "mwm/decomposition.hpp"
#include "mwm/random_source.hpp"
#include "mwm/sampler.hpp"
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace mwm {
namespace synth {

namespace {

// Timing of the two stages
struct PerformanceMetrics {
    double read_time_ms = 0.0;
    double fit_time_ms = 0.0;
    double sample_time_ms = 0.0;
    int num_paths = 0;

    void print(std::ostream& log) const {
        log << "Performance Metrics:" << std::endl;
        log << "  Read time: " << read_time_ms << " ms" << std::endl;
        log << "  Fit time: " << fit_time_ms << " ms" << std::endl;
        log << "  Sample time: " << sample_time_ms << " ms" << std::endl;
        if (num_paths > 0) {
            log << "  Time per path: " << (sample_time_ms / num_paths) << " ms" << std::endl;
        }
    }
};

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

int parse_int(const std::string& option, const std::string& value) {
    try {
        std::size_t pos = 0;
        const long parsed = std::stol(value, &pos);
        if (pos != value.size() || parsed < 0 || parsed > 1000000000L) {
            throw std::invalid_argument(value);
        }
        return static_cast<int>(parsed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
}

void report_model(std::ostream& log, const std::vector<scalar_t>& series, const Model& model,
                  bool verbose) {
    const ScaleLayout layout = ScaleLayout::for_scales(series.size(), model.scales());

    log << "Series: " << series.size() << " samples, using " << layout.size()
        << " (" << layout.blocks << " blocks x 2^" << layout.scales << ")" << std::endl;
    log << "Coarse Gaussian: mu = " << model.mean() << ", sd = " << model.sd() << std::endl;
    for (index_t i = 0; i < model.scales(); ++i) {
        log << "  scale " << i << ": beta = " << model.betas()[i] << std::endl;
    }

    if (verbose) {
        const Decomposition decomposition(series, layout, HaarWavelet());
        const std::vector<scalar_t> energies = decomposition.energies();
        log << "Energies:" << std::endl;
        for (std::size_t k = 0; k < energies.size(); ++k) {
            log << "  E_" << k << " = " << energies[k] << std::endl;
        }
    }
}

} // namespace

void print_usage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " --input FILE [options]\n";
    out << "Fit a multifractal wavelet model to a series and draw synthetic paths.\n";
    out << "Options:\n";
    out << "  --input FILE      Whitespace-separated series, '#' starts a comment (- for stdin)\n";
    out << "  --blocks N        Minimum number of coarse coefficients (default: " << DEFAULT_BLOCKS << ")\n";
    out << "  --scales N        Number of dyadic scales (overrides --blocks)\n";
    out << "  --paths K         Number of paths to draw (default: 1)\n";
    out << "  --seed SEED       Random seed for reproducibility\n";
    out << "  --output FILE     Write paths to FILE instead of stdout\n";
    out << "  --model-only      Fit and report the model without sampling\n";
    out << "  --quiet           Only write the paths\n";
    out << "  --verbose         Also report energies and timings\n";
    out << "  --help            Display this help message\n";
}

SynthConfig parse_args(int argc, const char* const argv[]) {
    SynthConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            config.show_help = true;
            return config;
        } else if (arg == "--model-only") {
            config.model_only = true;
        } else if (arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (i + 1 < argc) {
            if (arg == "--input") {
                config.input_path = argv[++i];
            } else if (arg == "--output") {
                config.output_path = argv[++i];
            } else if (arg == "--blocks") {
                config.fit.blocks = parse_int(arg, argv[++i]);
            } else if (arg == "--scales") {
                config.fit.scales = parse_int(arg, argv[++i]);
                config.has_scales = true;
            } else if (arg == "--paths") {
                config.paths = parse_int(arg, argv[++i]);
            } else if (arg == "--seed") {
                const std::string value = argv[++i];
                try {
                    std::size_t pos = 0;
                    config.seed = std::stoull(value, &pos);
                    if (pos != value.size() || value[0] == '-') {
                        throw std::invalid_argument(value);
                    }
                } catch (const std::exception&) {
                    throw std::invalid_argument("Invalid value for --seed: " + value);
                }
                config.has_seed = true;
            } else {
                throw std::invalid_argument("Unknown option: " + arg);
            }
        } else {
            throw std::invalid_argument("Missing argument for option: " + arg);
        }
    }

    if (config.input_path.empty()) {
        throw std::invalid_argument("--input is required");
    }
    if (config.quiet && config.verbose) {
        throw std::invalid_argument("--quiet and --verbose are mutually exclusive");
    }
    return config;
}

std::vector<scalar_t> read_series(std::istream& in) {
    std::vector<scalar_t> series;
    std::string line;
    int line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        const std::size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }

        std::istringstream iss(line);
        std::string token;
        while (iss >> token) {
            std::size_t pos = 0;
            scalar_t value = 0.0;
            try {
                value = std::stod(token, &pos);
            } catch (const std::exception&) {
                pos = 0;
            }
            if (pos != token.size() || !std::isfinite(value)) {
                std::ostringstream oss;
                oss << "Invalid value '" << token << "' on line " << line_number;
                throw std::runtime_error(oss.str());
            }
            series.push_back(value);
        }
    }
    return series;
}

std::vector<scalar_t> load_series(const std::string& path) {
    if (path == "-") {
        return read_series(std::cin);
    }
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open input file: " + path);
    }
    return read_series(in);
}

void write_path(std::ostream& out, const std::vector<scalar_t>& path) {
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) {
            out << ",";
        }
        out << path[i];
    }
    out << "\n";
}

Model fit_series(const std::vector<scalar_t>& series, const SynthConfig& config) {
    if (config.has_scales) {
        return Model::fit_with_scales(series, config.fit.scales);
    }
    return Model::fit(series, config.fit.blocks);
}

int run(const SynthConfig& config, std::ostream& out, std::ostream& log) {
    PerformanceMetrics metrics;

    try {
        auto start = std::chrono::steady_clock::now();
        const std::vector<scalar_t> series = load_series(config.input_path);
        metrics.read_time_ms = elapsed_ms(start);

        start = std::chrono::steady_clock::now();
        const Model model = fit_series(series, config);
        metrics.fit_time_ms = elapsed_ms(start);

        log << std::setprecision(15);
        if (!config.quiet) {
            report_model(log, series, model, config.verbose);
        }

        if (config.model_only) {
            if (config.verbose) {
                metrics.print(log);
            }
            return EXIT_OK;
        }

        std::unique_ptr<RandomSource> source;
        if (config.has_seed) {
            source = std::make_unique<Mt19937Source>(config.seed);
        } else {
            source = Mt19937Source::from_entropy();
        }

        std::ofstream file;
        if (!config.output_path.empty()) {
            file.open(config.output_path);
            if (!file) {
                throw std::runtime_error("Failed to open output file: " + config.output_path);
            }
        }
        std::ostream& paths_out = config.output_path.empty() ? out : file;
        paths_out << std::setprecision(17);

        const Sampler sampler(model);
        start = std::chrono::steady_clock::now();
        for (int p = 0; p < config.paths; ++p) {
            write_path(paths_out, sampler.sample(*source));
            ++metrics.num_paths;
        }
        metrics.sample_time_ms = elapsed_ms(start);

        if (!config.quiet) {
            log << "Wrote " << metrics.num_paths << " path(s) of length "
                << sampler.path_length();
            if (!config.output_path.empty()) {
                log << " to " << config.output_path;
            }
            log << std::endl;
        }
        if (config.verbose) {
            metrics.print(log);
        }
    } catch (const Error& e) {
        log << "Error (" << to_string(e.kind()) << "): " << e.what() << std::endl;
        return EXIT_FAILED;
    } catch (const std::exception& e) {
        log << "Error: " << e.what() << std::endl;
        return EXIT_FAILED;
    }

    return EXIT_OK;
}

int run_cli(int argc, const char* const argv[], std::ostream& out, std::ostream& log) {
    const char* program_name = argc > 0 ? argv[0] : "mwm_synth";

    SynthConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        log << e.what() << "\n";
        print_usage(log, program_name);
        return EXIT_USAGE;
    }

    if (config.show_help) {
        print_usage(out, program_name);
        return EXIT_OK;
    }
    return run(config, out, log);
}

} // namespace synth
} // namespace mwm
