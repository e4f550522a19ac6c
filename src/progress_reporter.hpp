#pragma once
// cmdbench - Progress Reporter


#include "types.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <ostream>

// Progress rendering capability
enum class ProgressMode {
    Hidden,     // No output, position still tracked
    Spinner,    // " ⠋ message                        [=====>    ] ETA 00:00:12"
    Bar         // "message: [=====>    ] 50%"
};

// Progress bar for long-running measurement loops.
// Thread-safe; a steady tick redraws the spinner from a background thread.
class ProgressBar {
public:
    ProgressBar(ProgressMode mode, size_t length, std::ostream& out);
    ~ProgressBar();

    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;

    // Set the message shown beside the bar
    void set_message(const std::string& message);

    // Advance position by delta (clamped to length)
    void inc(size_t delta = 1);

    // Set absolute position (clamped to length)
    void set_position(size_t position);

    // Redraw periodically on a background thread until finished.
    // Calling again replaces the previous interval. No-op for hidden bars.
    void enable_steady_tick(std::chrono::milliseconds interval);

    // Move to the end, draw the final frame and end the line
    void finish();

    // Stop and erase the bar from the terminal
    void finish_and_clear();

    bool is_hidden() const;
    bool is_finished() const;
    ProgressMode mode() const;
    size_t position() const;
    size_t length() const;
    std::string message() const;

    // Text of the current frame, without carriage return
    std::string format_line() const;

    // Format ETA as HH:MM:SS
    static std::string format_eta(double seconds);

    // Spinner frames, in display order
    static const std::vector<std::string>& spinner_frames();

    static constexpr int BAR_WIDTH = 30;
    static constexpr int MESSAGE_WIDTH = 30;

private:
    std::string format_line_locked() const;
    double eta_seconds_locked() const;
    void render_locked();
    void stop_tick();
    void tick_loop(std::chrono::milliseconds interval);

    const ProgressMode mode_;
    const size_t length_;
    std::ostream& out_;

    std::string message_;
    size_t position_;
    size_t frame_;
    bool finished_;
    size_t last_line_width_;
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex mutex_;
    std::condition_variable tick_cv_;
    bool tick_stop_;
    std::thread tick_thread_;
};

// Return a pre-configured progress bar for the given output style.
// Basic and Color styles get a hidden bar; all others get a spinner
// with an 80 ms steady tick.
std::unique_ptr<ProgressBar> get_progress_bar(size_t length,
                                              const std::string& msg,
                                              OutputStyleOption option,
                                              std::ostream& out);

std::unique_ptr<ProgressBar> get_progress_bar(size_t length,
                                              const std::string& msg,
                                              OutputStyleOption option);
