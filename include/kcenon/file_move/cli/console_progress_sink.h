/**
 * @file console_progress_sink.h
 * @brief Terminal progress bars for the command-line tools
 */

#ifndef KCENON_FILE_MOVE_CLI_CONSOLE_PROGRESS_SINK_H
#define KCENON_FILE_MOVE_CLI_CONSOLE_PROGRESS_SINK_H

#include <kcenon/file_move/core/progress.h>
#include <kcenon/file_move/core/throughput_meter.h>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::file_move::cli {

/**
 * @brief Progress sink drawing one line per live bar
 *
 * Live bars are kept as a block at the bottom of the stream. Each redraw
 * erases the block and prints it again, so lines written through println()
 * (and, once attached, every log line) appear above the bars instead of
 * through them. Redraws of a bar are throttled to the refresh interval;
 * reaching the total always redraws.
 *
 * Nothing is drawn when the stream is not a terminal, unless drawing is
 * forced.
 *
 * Line format:
 * @code
 * [=====>----] 12.0 MB/40.0 MB [8.5 MB/s] (ETA: 3s) label
 * @endcode
 */
class console_progress_sink final : public progress_sink {
public:
    /**
     * @brief Rendering options
     */
    struct options {
        std::size_t bar_width = 40;
        std::chrono::milliseconds refresh_interval{100};
        bool force_draw = false;  ///< Draw even when the stream is not a tty
    };

    /**
     * @brief Draw to stderr
     */
    console_progress_sink();

    /**
     * @brief Draw to a custom stream
     * @param out Stream to draw on; must outlive the sink
     * @param opts Rendering options
     */
    console_progress_sink(std::ostream& out, options opts);

    ~console_progress_sink() override;

    console_progress_sink(const console_progress_sink&) = delete;
    auto operator=(const console_progress_sink&) -> console_progress_sink& = delete;

    [[nodiscard]] auto add(uint64_t total, std::string_view initial_message)
        -> std::unique_ptr<progress_handle> override;

    /**
     * @brief Route the global logger's lines through println()
     *
     * Detached again when the sink is destroyed.
     */
    void attach_logger();

    /**
     * @brief Print a line above the bars
     */
    void println(const std::string& line);

    /**
     * @brief Whether bars are drawn at all
     */
    [[nodiscard]] auto is_drawing() const noexcept -> bool { return drawing_; }

    /**
     * @brief Number of bars not yet finished
     */
    [[nodiscard]] auto live_bars() const -> std::size_t;

    /**
     * @brief Render one bar line
     * @param figures Position, total, rate and ETA of the bar
     * @param label Message shown after the figures
     * @param width Number of cells between the brackets
     */
    [[nodiscard]] static auto render_line(const throughput_meter::snapshot& figures,
                                          std::string_view label,
                                          std::size_t width) -> std::string;

    /**
     * @brief Render an ETA as "3s", "2m 5s" or "1h 2m"
     */
    [[nodiscard]] static auto format_eta(std::chrono::milliseconds eta) -> std::string;

    /**
     * @brief Render a byte count with one decimal ("12.0 MB")
     */
    [[nodiscard]] static auto format_size(double bytes) -> std::string;

private:
    struct bar_state {
        throughput_meter meter;
        std::string message;
        std::chrono::steady_clock::time_point last_draw{};
    };

    friend class console_progress_handle;

    void update(bar_state* bar, uint64_t position);
    void relabel(bar_state* bar, std::string_view message);
    void remove(bar_state* bar);

    // Callers hold mutex_
    void erase_block();
    void draw_block();

    std::ostream& out_;
    options options_;
    bool drawing_;
    bool logger_attached_ = false;

    mutable std::mutex mutex_;
    std::vector<bar_state*> bars_;
    std::size_t lines_drawn_ = 0;
};

}  // namespace kcenon::file_move::cli

#endif  // KCENON_FILE_MOVE_CLI_CONSOLE_PROGRESS_SINK_H
