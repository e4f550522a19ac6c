#pragma once
// cmdbench - Core types and enums

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <stdexcept>

// Output style enum, drives the progress indicator and colored summary
enum class OutputStyleOption {
    Basic,      // Plain output, no progress bar
    Full,       // Spinner progress bar and colors
    NoColor,    // Spinner progress bar, no colors
    Color,      // Colors, no progress bar
    None        // Spinner progress bar, no styling at all
};

// Swept parameter (name, value) attached to a command
using ParameterValue = std::pair<std::string, std::string>;

// Benchmark result structure
// All times in seconds. Produced once by the measurement collector, then read-only.
struct BenchmarkResult {
    std::string command;
    double mean = 0.0;
    double stddev = 0.0;            // 0 for a single-sample run
    double median = 0.0;
    double user = 0.0;
    double system = 0.0;
    double min = 0.0;
    double max = 0.0;
    std::optional<std::vector<double>> times;
    std::optional<ParameterValue> parameter;
};

// A concrete command to benchmark, after parameter substitution
struct BenchmarkCommand {
    std::string expression;
    std::optional<ParameterValue> parameter;
};

// Configuration structure
struct Config {
    std::vector<std::string> commands;
    std::vector<std::string> parameter_lists;   // raw NAME=V1,V2 values
    std::vector<BenchmarkResult> results;       // results measured elsewhere
    OutputStyleOption style = OutputStyleOption::Full;
    bool no_color = false;
    bool quiet = false;
};

// Error codes
enum class ErrorCode {
    Success = 0,
    InvalidArguments = 1,
    UnknownError = 99
};

// Helper functions for enum conversion
inline std::string style_to_string(OutputStyleOption style) {
    switch (style) {
        case OutputStyleOption::Basic: return "basic";
        case OutputStyleOption::Full: return "full";
        case OutputStyleOption::NoColor: return "nocolor";
        case OutputStyleOption::Color: return "color";
        case OutputStyleOption::None: return "none";
    }
    return "unknown";
}

inline OutputStyleOption string_to_style(const std::string& s) {
    if (s == "basic") return OutputStyleOption::Basic;
    if (s == "full") return OutputStyleOption::Full;
    if (s == "nocolor") return OutputStyleOption::NoColor;
    if (s == "color") return OutputStyleOption::Color;
    if (s == "none") return OutputStyleOption::None;
    throw std::invalid_argument("Invalid style: " + s + ". Valid values: basic, full, nocolor, color, none");
}

// Whether a style allows ANSI colors in the summary
inline bool style_uses_colors(OutputStyleOption style) {
    return style == OutputStyleOption::Full || style == OutputStyleOption::Color;
}
