#pragma once
// cmdbench - CLI parsing module


#include "types.hpp"
#include "version.hpp"
#include "tokenize.hpp"
#include "parameter_sweep.hpp"
#include <string>
#include <vector>
#include <iostream>
#include <cstring>
#include <cmath>
#include <stdexcept>

// Print version information
inline void print_version() {
    std::cout << version::get_full_version_string() << "\n";
}

// Print usage help
inline void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] COMMAND...\n\n";
    std::cout << "Expands parameter sweeps into a command plan and compares results\n";
    std::cout << "measured by the benchmark runner.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --parameter-list=NAME=V1,V2     Sweep {NAME} in each COMMAND over the values.\n";
    std::cout << "                                  Use \\, for a literal comma and \\\\ for a backslash\n";
    std::cout << "  --result=MEAN,STDDEV,COMMAND    A measured result in seconds. Repeatable\n";
    std::cout << "  --style=STYLE                   Output style: basic, full, nocolor, color, none\n";
    std::cout << "                                  (default: full)\n";
    std::cout << "  --no-color                      Disable colored summary output\n";
    std::cout << "  --quiet, -q                     Only print the comparison summary\n";
    std::cout << "  --version, -v                   Show version information\n";
    std::cout << "  --help, -h                      Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " --parameter-list=threads=1,2,4 'make -j {threads}'\n";
    std::cout << "  " << program_name << " --result=0.512,0.02,'grep foo' --result=0.233,0.01,'rg foo'\n";
}

// Parse result structure
struct ParseResult {
    Config config;
    bool success = true;
    bool show_help = false;
    bool show_version = false;
    std::string error_message;
};

// Helper to extract value from --key=value argument
inline bool extract_arg_value(const char* arg, const char* key, std::string& value) {
    size_t key_len = std::strlen(key);
    if (std::strncmp(arg, key, key_len) == 0 && arg[key_len] == '=') {
        value = arg + key_len + 1;
        return true;
    }
    return false;
}

// Parse "MEAN,STDDEV,COMMAND" into a BenchmarkResult.
// Fields are split with tokenize(); everything after STDDEV is the command
// label, so unescaped commas there are kept as well.
// Throws std::invalid_argument on malformed or out-of-range numbers.
inline BenchmarkResult parse_result_arg(const std::string& text) {
    std::vector<std::string> fields = tokenize(text);
    if (fields.size() < 3) {
        throw std::invalid_argument("Expected MEAN,STDDEV,COMMAND but got '" + text + "'");
    }

    BenchmarkResult result;
    size_t consumed = 0;
    result.mean = std::stod(fields[0], &consumed);
    if (consumed != fields[0].size()) {
        throw std::invalid_argument("Invalid mean: " + fields[0]);
    }
    result.stddev = std::stod(fields[1], &consumed);
    if (consumed != fields[1].size()) {
        throw std::invalid_argument("Invalid stddev: " + fields[1]);
    }

    if (!std::isfinite(result.mean) || result.mean <= 0.0) {
        throw std::invalid_argument("Mean must be a positive finite number of seconds: " + fields[0]);
    }
    if (!std::isfinite(result.stddev) || result.stddev < 0.0) {
        throw std::invalid_argument("Stddev must be a non-negative finite number of seconds: " + fields[1]);
    }

    result.command = fields[2];
    for (size_t i = 3; i < fields.size(); ++i) {
        result.command += "," + fields[i];
    }

    // Only aggregates are known; fill the order statistics with the mean
    result.median = result.mean;
    result.min = result.mean;
    result.max = result.mean;
    return result;
}

// Validate config
inline bool validate_config(const Config& config, std::string& error) {
    if (config.commands.empty() && config.results.empty()) {
        error = "At least one COMMAND or --result is required";
        return false;
    }

    if (config.parameter_lists.size() > 1) {
        error = "Only one --parameter-list is supported";
        return false;
    }

    return true;
}

// Parse command-line arguments
inline ParseResult parse_args(int argc, char* argv[]) {
    ParseResult result;
    result.config = Config();  // Default values

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        // Check for help
        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
            return result;
        }

        // Check for version
        if (arg == "--version" || arg == "-v") {
            result.show_version = true;
            return result;
        }

        if (arg == "--no-color") {
            result.config.no_color = true;
            continue;
        }

        if (arg == "--quiet" || arg == "-q") {
            result.config.quiet = true;
            continue;
        }

        // Positional COMMAND
        if (arg.empty() || arg[0] != '-') {
            result.config.commands.push_back(arg);
            continue;
        }

        try {
            // --parameter-list
            if (extract_arg_value(argv[i], "--parameter-list", value)) {
                parse_parameter_list(value);  // Reject malformed lists early
                result.config.parameter_lists.push_back(value);
            }
            // --result
            else if (extract_arg_value(argv[i], "--result", value)) {
                result.config.results.push_back(parse_result_arg(value));
            }
            // --style
            else if (extract_arg_value(argv[i], "--style", value)) {
                result.config.style = string_to_style(value);
            }
            else {
                result.success = false;
                result.error_message = "Unknown argument: " + arg;
                return result;
            }
        } catch (const std::exception& e) {
            result.success = false;
            result.error_message = "Error parsing argument '" + arg + "': " + e.what();
            return result;
        }
    }

    // Validate the config
    std::string validation_error;
    if (!validate_config(result.config, validation_error)) {
        result.success = false;
        result.error_message = validation_error;
    }

    return result;
}

// Whether the comparison summary should use ANSI colors
inline bool config_uses_colors(const Config& config, bool is_terminal) {
    return !config.no_color && style_uses_colors(config.style) && is_terminal;
}
