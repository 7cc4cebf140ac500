/**
 * @file console_progress_sink.cpp
 * @brief Implementation of the terminal progress bars
 */

#include <kcenon/file_move/cli/console_progress_sink.h>

#include <kcenon/file_move/core/logging.h>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace kcenon::file_move::cli {

namespace {

constexpr std::string_view erase_line_up = "\x1b[1A\x1b[2K";

auto stream_is_terminal(const std::ostream& out) -> bool {
    if (&out == &std::cerr || &out == &std::clog) {
        return ::isatty(STDERR_FILENO) == 1;
    }
    if (&out == &std::cout) {
        return ::isatty(STDOUT_FILENO) == 1;
    }
    return false;
}

}  // namespace

/**
 * @brief Handle returned by console_progress_sink::add
 */
class console_progress_handle final : public progress_handle {
public:
    console_progress_handle(console_progress_sink& sink, uint64_t total, std::string_view message)
        : sink_(sink) {
        state_.meter.start(total);
        state_.message = std::string(message);
    }

    ~console_progress_handle() override {
        if (!finished_) {
            sink_.remove(&state_);
        }
    }

    void set_position(uint64_t position) override {
        if (!finished_) {
            sink_.update(&state_, position);
        }
    }

    void set_message(std::string_view message) override {
        if (!finished_) {
            sink_.relabel(&state_, message);
        }
    }

    void finish_and_clear() override {
        if (!finished_) {
            finished_ = true;
            sink_.remove(&state_);
        }
    }

    [[nodiscard]] auto state() -> console_progress_sink::bar_state* { return &state_; }

private:
    console_progress_sink& sink_;
    console_progress_sink::bar_state state_;
    bool finished_ = false;
};

console_progress_sink::console_progress_sink() : console_progress_sink(std::cerr, options{}) {}

console_progress_sink::console_progress_sink(std::ostream& out, options opts)
    : out_(out), options_(opts), drawing_(opts.force_draw || stream_is_terminal(out)) {}

console_progress_sink::~console_progress_sink() {
    if (logger_attached_) {
        get_logger().set_line_writer({});
    }
}

auto console_progress_sink::add(uint64_t total, std::string_view initial_message)
    -> std::unique_ptr<progress_handle> {
    auto handle = std::make_unique<console_progress_handle>(*this, total, initial_message);

    std::lock_guard<std::mutex> lock(mutex_);
    bars_.push_back(handle->state());
    if (drawing_) {
        erase_block();
        draw_block();
    }
    return handle;
}

void console_progress_sink::attach_logger() {
    get_logger().set_line_writer([this](const std::string& line) { println(line); });
    logger_attached_ = true;
}

void console_progress_sink::println(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!drawing_) {
        out_ << line << "\n";
        out_.flush();
        return;
    }

    erase_block();
    out_ << line << "\n";
    draw_block();
}

auto console_progress_sink::live_bars() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return bars_.size();
}

void console_progress_sink::update(bar_state* bar, uint64_t position) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    bar->meter.record_position(position, now);

    if (!drawing_) {
        return;
    }

    bool complete = bar->meter.get_position() >= bar->meter.get_total();
    if (!complete && now - bar->last_draw < options_.refresh_interval) {
        return;
    }
    bar->last_draw = now;

    erase_block();
    draw_block();
}

void console_progress_sink::relabel(bar_state* bar, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    bar->message = std::string(message);
}

void console_progress_sink::remove(bar_state* bar) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(bars_.begin(), bars_.end(), bar);
    if (it == bars_.end()) {
        return;
    }

    if (drawing_) {
        erase_block();
    }
    bars_.erase(it);
    if (drawing_) {
        draw_block();
    }
}

void console_progress_sink::erase_block() {
    for (std::size_t i = 0; i < lines_drawn_; ++i) {
        out_ << erase_line_up;
    }
    lines_drawn_ = 0;
}

void console_progress_sink::draw_block() {
    auto now = std::chrono::steady_clock::now();
    for (const auto* bar : bars_) {
        out_ << render_line(bar->meter.get_snapshot(now), bar->message, options_.bar_width)
             << "\n";
    }
    lines_drawn_ = bars_.size();
    out_.flush();
}

auto console_progress_sink::render_line(const throughput_meter::snapshot& figures,
                                        std::string_view label,
                                        std::size_t width) -> std::string {
    std::size_t filled = width;
    if (figures.total > 0 && figures.position < figures.total) {
        filled = static_cast<std::size_t>(static_cast<double>(figures.position) /
                                          static_cast<double>(figures.total) *
                                          static_cast<double>(width));
    }

    std::string cells(filled, '=');
    if (filled < width) {
        cells += '>';
        cells.append(width - filled - 1, '-');
    }

    double rate = figures.current_rate > 0.0 ? figures.current_rate : figures.average_rate;

    std::ostringstream oss;
    oss << "[" << cells << "] " << format_size(static_cast<double>(figures.position)) << "/"
        << format_size(static_cast<double>(figures.total)) << " [" << format_size(rate)
        << "/s] (ETA: " << format_eta(figures.estimated_remaining) << ")";
    if (!label.empty()) {
        oss << " " << label;
    }
    return oss.str();
}

auto console_progress_sink::format_eta(std::chrono::milliseconds eta) -> std::string {
    auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(eta).count();
    if (total_seconds < 0) {
        total_seconds = 0;
    }

    auto hours = total_seconds / 3600;
    auto minutes = (total_seconds % 3600) / 60;
    auto seconds = total_seconds % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h " << minutes << "m";
    } else if (minutes > 0) {
        oss << minutes << "m " << seconds << "s";
    } else {
        oss << seconds << "s";
    }
    return oss.str();
}

auto console_progress_sink::format_size(double bytes) -> std::string {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;

    while (bytes >= 1024.0 && unit_index < 4) {
        bytes /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << static_cast<uint64_t>(bytes) << " " << units[unit_index];
    } else {
        oss << std::fixed << std::setprecision(1) << bytes << " " << units[unit_index];
    }
    return oss.str();
}

}  // namespace kcenon::file_move::cli
