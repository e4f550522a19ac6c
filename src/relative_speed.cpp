// cmdbench - Relative speed calculation implementation

#include "relative_speed.hpp"
#include <cmath>
#include <stdexcept>

namespace {

// Total order on doubles: NaN and other incomparable pairs are ties
int compare_values(double l, double r) {
    if (l < r) return -1;
    if (l > r) return 1;
    return 0;
}

} // namespace

int compare_mean_time(const BenchmarkResult& l, const BenchmarkResult& r) {
    return compare_values(l.mean, r.mean);
}

std::vector<BenchmarkResultWithRelativeSpeed> compute_relative_speed(
    const std::vector<BenchmarkResult>& results) {
    if (results.empty()) {
        throw std::invalid_argument("compute_relative_speed requires at least one benchmark result");
    }

    size_t fastest_idx = 0;
    for (size_t i = 1; i < results.size(); ++i) {
        if (compare_mean_time(results[i], results[fastest_idx]) < 0) {
            fastest_idx = i;
        }
    }
    const BenchmarkResult& fastest = results[fastest_idx];

    std::vector<BenchmarkResultWithRelativeSpeed> annotated;
    annotated.reserve(results.size());

    for (size_t i = 0; i < results.size(); ++i) {
        const BenchmarkResult& result = results[i];

        double ratio = result.mean / fastest.mean;
        double percent_change = 100.0 * (result.mean - fastest.mean) / result.mean;

        // Propagation of uncertainty for a quotient, covariance assumed 0.
        // The fastest result divided by itself is exactly 1 with no spread.
        double ratio_stddev = 0.0;
        if (i != fastest_idx) {
            double rel_result = result.stddev / result.mean;
            double rel_fastest = fastest.stddev / fastest.mean;
            ratio_stddev = ratio * std::sqrt(rel_result * rel_result + rel_fastest * rel_fastest);
        }

        BenchmarkResultWithRelativeSpeed entry;
        entry.result = &result;
        entry.relative_speed = ratio;
        entry.relative_speed_stddev = ratio_stddev;
        entry.percent_change = percent_change;
        entry.is_fastest = (i == fastest_idx);
        annotated.push_back(entry);
    }

    return annotated;
}

double max_value(const std::vector<double>& values) {
    if (values.empty()) {
        throw std::invalid_argument("max_value requires at least one value");
    }
    double best = values[0];
    for (size_t i = 1; i < values.size(); ++i) {
        if (compare_values(values[i], best) > 0) {
            best = values[i];
        }
    }
    return best;
}

double min_value(const std::vector<double>& values) {
    if (values.empty()) {
        throw std::invalid_argument("min_value requires at least one value");
    }
    double best = values[0];
    for (size_t i = 1; i < values.size(); ++i) {
        if (compare_values(values[i], best) < 0) {
            best = values[i];
        }
    }
    return best;
}
