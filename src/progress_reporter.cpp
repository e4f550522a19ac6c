// cmdbench - Progress Reporter Implementation


#include "progress_reporter.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cmath>

// Constructor
ProgressBar::ProgressBar(ProgressMode mode, size_t length, std::ostream& out)
    : mode_(mode)
    , length_(length)
    , out_(out)
    , message_()
    , position_(0)
    , frame_(0)
    , finished_(false)
    , last_line_width_(0)
    , start_time_(std::chrono::steady_clock::now())
    , tick_stop_(false)
{
}

// Destructor
ProgressBar::~ProgressBar() {
    stop_tick();
}

void ProgressBar::set_message(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    message_ = message;
    render_locked();
}

void ProgressBar::inc(size_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    position_ = (std::min)(length_, position_ + delta);
    render_locked();
}

void ProgressBar::set_position(size_t position) {
    std::lock_guard<std::mutex> lock(mutex_);
    position_ = (std::min)(length_, position);
    render_locked();
}

void ProgressBar::enable_steady_tick(std::chrono::milliseconds interval) {
    if (mode_ == ProgressMode::Hidden) {
        return;
    }
    stop_tick();

    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
        return;
    }
    tick_stop_ = false;
    tick_thread_ = std::thread(&ProgressBar::tick_loop, this, interval);
}

void ProgressBar::finish() {
    stop_tick();

    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
        return;
    }
    position_ = length_;
    render_locked();
    finished_ = true;
    if (mode_ != ProgressMode::Hidden) {
        out_ << "\n";
        out_.flush();
    }
}

void ProgressBar::finish_and_clear() {
    stop_tick();

    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_) {
        return;
    }
    finished_ = true;
    if (mode_ != ProgressMode::Hidden) {
        out_ << "\r" << std::string(last_line_width_, ' ') << "\r";
        out_.flush();
    }
}

bool ProgressBar::is_hidden() const {
    return mode_ == ProgressMode::Hidden;
}

bool ProgressBar::is_finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

ProgressMode ProgressBar::mode() const {
    return mode_;
}

size_t ProgressBar::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return position_;
}

size_t ProgressBar::length() const {
    return length_;
}

std::string ProgressBar::message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return message_;
}

std::string ProgressBar::format_line() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return format_line_locked();
}

const std::vector<std::string>& ProgressBar::spinner_frames() {
    static const std::vector<std::string> frames = {
        "⠋", "⠙", "⠹", "⠸", "⠼",
        "⠴", "⠦", "⠧", "⠇", "⠏"
    };
    return frames;
}

std::string ProgressBar::format_eta(double seconds) {
    if (seconds < 0 || !std::isfinite(seconds)) {
        return "--:--:--";
    }

    long long total_seconds = static_cast<long long>(std::round(seconds));
    long long hours = total_seconds / 3600;
    long long minutes = (total_seconds % 3600) / 60;
    long long secs = total_seconds % 60;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours << ":"
        << std::setfill('0') << std::setw(2) << minutes << ":"
        << std::setfill('0') << std::setw(2) << secs;
    return oss.str();
}

double ProgressBar::eta_seconds_locked() const {
    if (position_ == 0 || position_ >= length_) {
        return 0.0;
    }
    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - start_time_).count();
    double rate = static_cast<double>(position_) / elapsed;
    size_t remaining = length_ - position_;
    return static_cast<double>(remaining) / rate;
}

std::string ProgressBar::format_line_locked() const {
    // Note: mutex is already held by caller
    double percentage = (length_ > 0)
        ? (static_cast<double>(position_) / static_cast<double>(length_)) * 100.0
        : 100.0;

    int filled = static_cast<int>((percentage / 100.0) * BAR_WIDTH);
    std::string bar = "[";
    for (int i = 0; i < BAR_WIDTH; ++i) {
        if (i < filled) {
            bar += "=";
        } else if (i == filled) {
            bar += ">";
        } else {
            bar += " ";
        }
    }
    bar += "]";

    std::ostringstream oss;
    switch (mode_) {
        case ProgressMode::Hidden:
            break;

        case ProgressMode::Spinner: {
            const auto& frames = spinner_frames();
            oss << " " << frames[frame_ % frames.size()] << " "
                << std::left << std::setw(MESSAGE_WIDTH) << message_
                << " " << bar
                << " ETA " << format_eta(eta_seconds_locked());
            break;
        }

        case ProgressMode::Bar:
            oss << message_ << ": " << bar << " "
                << std::fixed << std::setprecision(0) << percentage << "%";
            break;
    }
    return oss.str();
}

// Render progress to the output stream
void ProgressBar::render_locked() {
    // Note: mutex is already held by caller
    if (mode_ == ProgressMode::Hidden || finished_) {
        return;
    }

    std::string line = format_line_locked();
    out_ << "\r" << line;
    // Pad with spaces to clear any previous longer output
    if (line.size() < last_line_width_) {
        out_ << std::string(last_line_width_ - line.size(), ' ');
    }
    last_line_width_ = (std::max)(last_line_width_, line.size());
    out_.flush();
}

void ProgressBar::stop_tick() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tick_stop_ = true;
    }
    tick_cv_.notify_all();
    if (tick_thread_.joinable()) {
        tick_thread_.join();
    }
}

void ProgressBar::tick_loop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!tick_stop_) {
        if (tick_cv_.wait_for(lock, interval, [this] { return tick_stop_; })) {
            break;
        }
        ++frame_;
        render_locked();
    }
}

std::unique_ptr<ProgressBar> get_progress_bar(size_t length,
                                              const std::string& msg,
                                              OutputStyleOption option,
                                              std::ostream& out) {
    ProgressMode mode = ProgressMode::Spinner;
    switch (option) {
        case OutputStyleOption::Basic:
        case OutputStyleOption::Color:
            mode = ProgressMode::Hidden;
            break;
        case OutputStyleOption::Full:
        case OutputStyleOption::NoColor:
        case OutputStyleOption::None:
            mode = ProgressMode::Spinner;
            break;
    }

    auto progress_bar = std::make_unique<ProgressBar>(mode, length, out);
    progress_bar->set_message(msg);
    progress_bar->enable_steady_tick(std::chrono::milliseconds(80));
    return progress_bar;
}

std::unique_ptr<ProgressBar> get_progress_bar(size_t length,
                                              const std::string& msg,
                                              OutputStyleOption option) {
    return get_progress_bar(length, msg, option, std::cerr);
}
