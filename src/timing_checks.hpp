#pragma once
// cmdbench - Timing quality checks

#include "types.hpp"
#include <string>

// Threshold for warning about fast execution time (seconds)
constexpr double MIN_EXECUTION_TIME = 5e-3;

inline bool is_below_min_execution_time(const BenchmarkResult& result) {
    return result.mean < MIN_EXECUTION_TIME;
}

inline std::string execution_time_warning(const BenchmarkResult& result) {
    return "Command '" + result.command + "' took less than " +
           std::to_string(static_cast<int>(MIN_EXECUTION_TIME * 1000.0)) +
           " ms to complete. Results might be inaccurate.";
}
