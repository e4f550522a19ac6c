#include "comparison_output.hpp"
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

static BenchmarkResult create_result(const std::string& name, double mean, double stddev) {
    BenchmarkResult r;
    r.command = name;
    r.mean = mean;
    r.stddev = stddev;
    r.median = mean;
    r.min = mean;
    r.max = mean;
    return r;
}

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(line);
    }
    return lines;
}

int main() {
    // Fewer than two results produce nothing
    {
        TEST(format_comparison({}, false).empty(), "no results, no output");
        TEST(format_comparison({create_result("solo", 1.0, 0.1)}, false).empty(), "single result, no output");

        std::ostringstream oss;
        write_comparison({create_result("solo", 1.0, 0.1)}, oss, true);
        TEST(oss.str().empty(), "single result writes nothing to the stream");
    }

    // Plain text layout
    {
        std::vector<BenchmarkResult> results = {
            create_result("cmd1", 3.0, 1.0),
            create_result("cmd2", 2.0, 1.0),
            create_result("cmd3", 5.0, 1.0)
        };
        std::string text = format_comparison(results, false);
        auto lines = split_lines(text);

        TEST(lines.size() == 4, "header, baseline and two comparison lines");
        TEST(lines[0] == "Summary", "summary header");
        TEST(lines[1] == "  'cmd2' ran", "fastest command is the baseline");
        TEST(lines[2] == "    1.50 \xC2\xB1 0.90 times faster than 'cmd1', -33.3%", "second fastest line");
        TEST(lines[3] == "    2.50 \xC2\xB1 1.35 times faster than 'cmd3', -60.0%", "slowest line");
        TEST(text.find("\033[") == std::string::npos, "no ANSI escapes without colors");
    }

    // Colored output keeps the same text
    {
        std::vector<BenchmarkResult> results = {
            create_result("slow", 2.0, 0.0),
            create_result("fast", 1.0, 0.0)
        };
        std::string text = format_comparison(results, true);
        TEST(text.find("\033[1mSummary\033[0m") != std::string::npos, "bold summary header");
        TEST(text.find("\033[36mfast\033[0m") != std::string::npos, "fastest command in cyan");
        TEST(text.find("\033[35mslow\033[0m") != std::string::npos, "other command in magenta");
        TEST(text.find("\033[1m\033[32m    2.00\033[0m") != std::string::npos, "speed in bold green");
    }

    // Ranking is stable for equal means
    {
        std::vector<BenchmarkResult> results = {
            create_result("c", 3.0, 0.1),
            create_result("a", 1.0, 0.1),
            create_result("b", 1.0, 0.1)
        };
        auto ranked = rank_by_mean_time(results);
        TEST(ranked[0].result->command == "a", "first of the tied fastest leads");
        TEST(ranked[1].result->command == "b", "tie keeps input order");
        TEST(ranked[2].result->command == "c", "slowest last");
        TEST(ranked[0].is_fastest && !ranked[1].is_fastest, "only the leader is flagged fastest");

        bool all_at_least_one = true;
        for (const auto& r : ranked) {
            if (r.relative_speed < 1.0) all_at_least_one = false;
        }
        TEST(all_at_least_one, "every reported speed is at least 1.0");
    }

    // Baseline follows the minimum mean regardless of input order
    {
        std::vector<BenchmarkResult> results = {
            create_result("z", 0.9, 0.01),
            create_result("y", 0.8, 0.01),
            create_result("x", 0.1, 0.01),
            create_result("w", 0.5, 0.01)
        };
        auto lines = split_lines(format_comparison(results, false));
        TEST(lines.size() == 5, "four results give three comparison lines");
        TEST(lines[1] == "  'x' ran", "minimum mean is the baseline");
        TEST(lines[2].find("'w'") != std::string::npos, "next fastest follows");
        TEST(lines[4].find("'z'") != std::string::npos, "slowest reported last");
    }

    std::cout << "\nAll comparison output tests passed.\n";
    return 0;
}
