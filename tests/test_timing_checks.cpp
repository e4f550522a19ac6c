#include "timing_checks.hpp"
#include <iostream>
#include <string>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

int main() {
    BenchmarkResult fast;
    fast.command = "true";
    fast.mean = 0.001;

    BenchmarkResult slow;
    slow.command = "sleep 1";
    slow.mean = 1.0;

    BenchmarkResult edge;
    edge.command = "edge";
    edge.mean = MIN_EXECUTION_TIME;

    TEST(MIN_EXECUTION_TIME == 5e-3, "threshold is 5 ms");
    TEST(is_below_min_execution_time(fast), "1 ms run is flagged");
    TEST(!is_below_min_execution_time(slow), "1 s run is not flagged");
    TEST(!is_below_min_execution_time(edge), "threshold itself is not flagged");

    std::string warning = execution_time_warning(fast);
    TEST(warning == "Command 'true' took less than 5 ms to complete. Results might be inaccurate.",
         "warning text names the command");

    std::cout << "\nAll timing check tests passed.\n";
    return 0;
}
