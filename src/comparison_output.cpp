// cmdbench - Benchmark comparison summary output implementation


#include "comparison_output.hpp"
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#else
#include <unistd.h>
#endif

namespace {

// ANSI styling helpers
const char* const ANSI_BOLD = "\033[1m";
const char* const ANSI_GREEN = "\033[32m";
const char* const ANSI_MAGENTA = "\033[35m";
const char* const ANSI_CYAN = "\033[36m";
const char* const ANSI_RESET = "\033[0m";

std::string styled(const std::string& s, const char* color, bool bold, bool enabled) {
    if (!enabled) return s;
    std::string out;
    if (bold) out += ANSI_BOLD;
    if (color) out += color;
    out += s;
    out += ANSI_RESET;
    return out;
}

std::string format_fixed(double value, int precision, int width = 0) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision);
    if (width > 0) {
        oss << std::setw(width);
    }
    oss << value;
    return oss.str();
}

} // namespace

bool terminal_supports_colors() {
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE) {
        return false;
    }

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode)) {
        return false;
    }

    // Try to enable virtual terminal processing for ANSI colors
    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    if (SetConsoleMode(hOut, dwMode)) {
        return true;
    }

    const char* wt_session = std::getenv("WT_SESSION");  // Windows Terminal
    return wt_session != nullptr;
#else
    if (!isatty(STDOUT_FILENO)) {
        return false;
    }

    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }

    const char* term = std::getenv("TERM");
    if (term == nullptr || std::string(term) == "dumb") {
        return false;
    }

    return true;
#endif
}

std::vector<BenchmarkResultWithRelativeSpeed> rank_by_mean_time(
    const std::vector<BenchmarkResult>& results) {
    std::vector<BenchmarkResultWithRelativeSpeed> annotated = compute_relative_speed(results);
    std::stable_sort(annotated.begin(), annotated.end(),
        [](const BenchmarkResultWithRelativeSpeed& l, const BenchmarkResultWithRelativeSpeed& r) {
            return mean_time_less(*l.result, *r.result);
        });
    return annotated;
}

void write_comparison(const std::vector<BenchmarkResult>& results,
                      std::ostream& out,
                      bool use_colors) {
    if (results.size() < 2) {
        return;
    }

    std::vector<BenchmarkResultWithRelativeSpeed> ranked = rank_by_mean_time(results);
    const BenchmarkResultWithRelativeSpeed& fastest = ranked.front();

    out << styled("Summary", nullptr, true, use_colors) << "\n";
    out << "  '" << styled(fastest.result->command, ANSI_CYAN, false, use_colors) << "' ran\n";

    for (size_t i = 1; i < ranked.size(); ++i) {
        const auto& item = ranked[i];
        out << styled(format_fixed(item.relative_speed, 2, 8), ANSI_GREEN, true, use_colors)
            << " \xC2\xB1 "
            << styled(format_fixed(item.relative_speed_stddev, 2), ANSI_GREEN, false, use_colors)
            << " times faster than '"
            << styled(item.result->command, ANSI_MAGENTA, false, use_colors)
            << "', -"
            << styled(format_fixed(item.percent_change, 1), ANSI_GREEN, true, use_colors)
            << "%\n";
    }
}

std::string format_comparison(const std::vector<BenchmarkResult>& results,
                              bool use_colors) {
    std::ostringstream oss;
    write_comparison(results, oss, use_colors);
    return oss.str();
}
