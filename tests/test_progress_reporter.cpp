#include "progress_reporter.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#define TEST(condition, name) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << name << "\n"; \
        return 1; \
    } else { \
        std::cout << "PASS: " << name << "\n"; \
    }

int main() {
    // Style selection
    {
        std::ostringstream sink;
        TEST(get_progress_bar(10, "m", OutputStyleOption::Basic, sink)->is_hidden(), "basic style is hidden");
        TEST(get_progress_bar(10, "m", OutputStyleOption::Color, sink)->is_hidden(), "color style is hidden");
        TEST(get_progress_bar(10, "m", OutputStyleOption::Full, sink)->mode() == ProgressMode::Spinner,
             "full style spins");
        TEST(get_progress_bar(10, "m", OutputStyleOption::NoColor, sink)->mode() == ProgressMode::Spinner,
             "nocolor style spins");
        TEST(get_progress_bar(10, "m", OutputStyleOption::None, sink)->mode() == ProgressMode::Spinner,
             "none style spins");
    }

    // Hidden bar tracks position but writes nothing
    {
        std::ostringstream out;
        auto bar = get_progress_bar(3, "Measuring", OutputStyleOption::Basic, out);
        bar->inc();
        bar->inc();
        TEST(bar->position() == 2, "hidden bar tracks position");
        bar->finish();
        TEST(bar->position() == 3, "finish moves to the end");
        TEST(out.str().empty(), "hidden bar produces no output");
    }

    // Plain bar rendering
    {
        std::ostringstream out;
        ProgressBar bar(ProgressMode::Bar, 4, out);
        bar.set_message("Runs");
        bar.set_position(2);
        TEST(bar.format_line() == "Runs: [===============>              ] 50%", "half-way bar");
        bar.inc(10);
        TEST(bar.position() == 4, "position clamps to length");
        TEST(bar.format_line() == "Runs: [==============================] 100%", "complete bar");
        bar.finish();
        TEST(bar.is_finished(), "bar reports finished");
        TEST(!out.str().empty() && out.str().back() == '\n', "finish ends the line");
    }

    // Spinner rendering
    {
        std::ostringstream out;
        ProgressBar bar(ProgressMode::Spinner, 10, out);
        bar.set_message("Benchmark 1");
        std::string line = bar.format_line();
        TEST(line.rfind(" " + ProgressBar::spinner_frames()[0] + " Benchmark 1", 0) == 0, "spinner frame then message");
        TEST(line.find(" ETA 00:00:00") != std::string::npos, "ETA placeholder before progress");
        TEST(line.find("[>") != std::string::npos, "empty bar at start");
        bar.finish_and_clear();
        TEST(out.str().back() == '\r', "clear returns to line start");
    }

    // Steady tick advances the spinner and stops on finish
    {
        std::ostringstream out;
        ProgressBar bar(ProgressMode::Spinner, 5, out);
        bar.set_message("tick");
        bar.enable_steady_tick(std::chrono::milliseconds(5));
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        bar.finish();
        TEST(out.str().find(ProgressBar::spinner_frames()[1]) != std::string::npos,
             "tick thread advanced the spinner");
        std::string after_finish = out.str();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        TEST(out.str() == after_finish, "no redraw after finish");
    }

    // ETA formatting
    {
        TEST(ProgressBar::format_eta(0) == "00:00:00", "zero ETA");
        TEST(ProgressBar::format_eta(75) == "00:01:15", "minutes and seconds");
        TEST(ProgressBar::format_eta(3725) == "01:02:05", "hours");
        TEST(ProgressBar::format_eta(-1) == "--:--:--", "negative ETA");
    }

    std::cout << "\nAll progress reporter tests passed.\n";
    return 0;
}
