// cmdbench - Main entry point

#include "types.hpp"
#include "cli.hpp"
#include "logging.hpp"
#include "parameter_sweep.hpp"
#include "progress_reporter.hpp"
#include "comparison_output.hpp"
#include "timing_checks.hpp"
#include "version.hpp"

#include <iostream>
#include <string>
#include <exception>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif

namespace {

void signal_handler(int sig) {
    std::cerr << "[fatal] signal " << sig << "\n";
    std::cerr.flush();
    std::abort();
}

void terminate_handler() {
    std::cerr << "[fatal] std::terminate called\n";
    std::cerr.flush();
    std::abort();
}

#ifdef _WIN32
LONG WINAPI unhandled_exception_filter(EXCEPTION_POINTERS* info) {
    if (info && info->ExceptionRecord) {
        std::cerr << "[fatal] unhandled exception 0x"
                  << std::hex << info->ExceptionRecord->ExceptionCode
                  << std::dec << "\n";
    } else {
        std::cerr << "[fatal] unhandled exception (unknown)\n";
    }
    std::cerr.flush();
    return EXCEPTION_EXECUTE_HANDLER;
}
#endif

void install_crash_handlers() {
    std::set_terminate(terminate_handler);
    std::signal(SIGSEGV, signal_handler);
    std::signal(SIGILL, signal_handler);
    std::signal(SIGFPE, signal_handler);
#ifdef _WIN32
    SetUnhandledExceptionFilter(unhandled_exception_filter);
#endif
}

// Print the expanded command plan, one line per command
void print_command_plan(const std::vector<BenchmarkCommand>& plan, OutputStyleOption style) {
    std::unique_ptr<ProgressBar> progress = get_progress_bar(plan.size(), "Preparing commands", style);

    std::ostringstream listing;
    listing << "Command plan (" << plan.size() << " command" << (plan.size() == 1 ? "" : "s") << "):\n";
    for (size_t i = 0; i < plan.size(); ++i) {
        const BenchmarkCommand& cmd = plan[i];
        listing << "  #" << (i + 1) << ": " << cmd.expression;
        if (cmd.parameter) {
            listing << "  [" << cmd.parameter->first << "=" << cmd.parameter->second << "]";
        }
        listing << "\n";
        progress->inc();
    }

    // Clear the bar before writing so stderr and stdout do not interleave
    progress->finish_and_clear();
    std::cout << listing.str();
}

} // namespace

int main(int argc, char* argv[]) {
    install_crash_handlers();
    try {
        ParseResult parse_result = parse_args(argc, argv);

        if (parse_result.show_version) {
            print_version();
            return static_cast<int>(ErrorCode::Success);
        }

        if (parse_result.show_help) {
            print_usage(argv[0]);
            return static_cast<int>(ErrorCode::Success);
        }

        if (!parse_result.success) {
            std::cerr << "Error: " << parse_result.error_message << std::endl;
            std::cerr << std::endl;
            print_usage(argv[0]);
            return static_cast<int>(ErrorCode::InvalidArguments);
        }

        const Config& config = parse_result.config;
        debug_log("style=" + style_to_string(config.style) +
                  " commands=" + std::to_string(config.commands.size()) +
                  " results=" + std::to_string(config.results.size()));

        if (!config.commands.empty()) {
            std::unique_ptr<ParameterList> list;
            if (!config.parameter_lists.empty()) {
                list = std::make_unique<ParameterList>(parse_parameter_list(config.parameter_lists.front()));
                debug_log("sweeping '" + list->name + "' over " +
                          std::to_string(list->values.size()) + " values");
            }

            std::vector<BenchmarkCommand> plan = expand_commands(config.commands, list.get());
            if (!config.quiet) {
                print_command_plan(plan, config.style);
            }
        }

        if (!config.results.empty()) {
            for (const auto& result : config.results) {
                if (is_below_min_execution_time(result)) {
                    warn(execution_time_warning(result));
                }
            }

            bool use_colors = config_uses_colors(config, terminal_supports_colors());
            if (!config.quiet && !config.commands.empty()) {
                std::cout << "\n";
            }
            write_comparison(config.results, std::cout, use_colors);
            if (config.results.size() < 2) {
                debug_log("fewer than two results, no comparison written");
            }
        }

        return static_cast<int>(ErrorCode::Success);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return static_cast<int>(ErrorCode::UnknownError);
    }
}
