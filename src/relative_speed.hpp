#pragma once
// cmdbench - Relative speed calculation

#include "types.hpp"
#include <vector>

// Benchmark result annotated with its speed relative to the fastest result.
// Holds a non-owning pointer into the sequence passed to compute_relative_speed.
struct BenchmarkResultWithRelativeSpeed {
    const BenchmarkResult* result = nullptr;
    double relative_speed = 1.0;          // mean / fastest mean, >= 1
    double relative_speed_stddev = 0.0;   // propagated uncertainty of the ratio
    double percent_change = 0.0;          // 100 * (mean - fastest) / mean
    bool is_fastest = false;
};

// Three-way comparison of mean times.
// Returns -1, 0 or 1; incomparable values (NaN) compare as equal.
int compare_mean_time(const BenchmarkResult& l, const BenchmarkResult& r);

// Strict-weak-ordering adaptor for std::stable_sort and friends
inline bool mean_time_less(const BenchmarkResult& l, const BenchmarkResult& r) {
    return compare_mean_time(l, r) < 0;
}

// Annotate every result with its speed relative to the fastest one.
// Output is index-aligned with the input. Throws std::invalid_argument if
// results is empty. Exactly one element (the first minimum) is flagged fastest,
// and that element reports a relative speed of 1 with zero uncertainty.
std::vector<BenchmarkResultWithRelativeSpeed> compute_relative_speed(
    const std::vector<BenchmarkResult>& results);

// Maximum / minimum of a non-empty sample set, NaN-safe
// Throws std::invalid_argument if values is empty
double max_value(const std::vector<double>& values);
double min_value(const std::vector<double>& values);
