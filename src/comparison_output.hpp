#pragma once
// cmdbench - Benchmark comparison summary output


#include "types.hpp"
#include "relative_speed.hpp"
#include <vector>
#include <string>
#include <ostream>

// Terminal color support detection
bool terminal_supports_colors();

// Write the relative-speed summary for a set of results.
// Results are ranked by mean time; the fastest is the baseline and every
// other entry is reported as "X ± Y times faster than 'cmd', -P%".
// Writes nothing when fewer than two results are given.
void write_comparison(const std::vector<BenchmarkResult>& results,
                      std::ostream& out,
                      bool use_colors);

// Same as write_comparison, returned as a string
std::string format_comparison(const std::vector<BenchmarkResult>& results,
                              bool use_colors);

// Annotated results ordered by ascending mean; ties keep input order
std::vector<BenchmarkResultWithRelativeSpeed> rank_by_mean_time(
    const std::vector<BenchmarkResult>& results);
