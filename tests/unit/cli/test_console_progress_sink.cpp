/**
 * @file test_console_progress_sink.cpp
 * @brief Unit tests for the terminal progress renderer
 */

#include <gtest/gtest.h>

#include <kcenon/file_move/cli/console_progress_sink.h>
#include <kcenon/file_move/core/logging.h>

#include <sstream>

namespace kcenon::file_move::test {

using cli::console_progress_sink;

namespace {

auto figures(uint64_t position, uint64_t total) -> throughput_meter::snapshot {
    throughput_meter::snapshot s;
    s.position = position;
    s.total = total;
    return s;
}

auto drawing_options() -> console_progress_sink::options {
    console_progress_sink::options opts;
    opts.bar_width = 10;
    opts.refresh_interval = std::chrono::milliseconds(0);
    opts.force_draw = true;
    return opts;
}

}  // namespace

// =============================================================================
// Formatting
// =============================================================================

TEST(ConsoleFormatTest, FormatEta) {
    using std::chrono::milliseconds;

    EXPECT_EQ(console_progress_sink::format_eta(milliseconds(0)), "0s");
    EXPECT_EQ(console_progress_sink::format_eta(milliseconds(3400)), "3s");
    EXPECT_EQ(console_progress_sink::format_eta(milliseconds(125000)), "2m 5s");
    EXPECT_EQ(console_progress_sink::format_eta(milliseconds(3720000)), "1h 2m");
    EXPECT_EQ(console_progress_sink::format_eta(milliseconds(-5)), "0s");
}

TEST(ConsoleFormatTest, FormatSize) {
    EXPECT_EQ(console_progress_sink::format_size(0), "0 B");
    EXPECT_EQ(console_progress_sink::format_size(512), "512 B");
    EXPECT_EQ(console_progress_sink::format_size(1536), "1.5 KB");
    EXPECT_EQ(console_progress_sink::format_size(12.0 * 1024 * 1024), "12.0 MB");
}

TEST(ConsoleFormatTest, RenderEmptyBar) {
    auto line = console_progress_sink::render_line(figures(0, 100), "file.bin", 10);

    EXPECT_EQ(line, "[>---------] 0 B/100 B [0 B/s] (ETA: 0s) file.bin");
}

TEST(ConsoleFormatTest, RenderHalfBar) {
    auto s = figures(50, 100);
    s.current_rate = 25.0;
    s.estimated_remaining = std::chrono::milliseconds(2000);

    auto line = console_progress_sink::render_line(s, "", 10);

    EXPECT_EQ(line, "[=====>----] 50 B/100 B [25 B/s] (ETA: 2s)");
}

TEST(ConsoleFormatTest, RenderFallsBackToAverageRate) {
    auto s = figures(50, 100);
    s.average_rate = 2048.0;

    auto line = console_progress_sink::render_line(s, "x", 10);

    EXPECT_NE(line.find("[2.0 KB/s]"), std::string::npos);
}

TEST(ConsoleFormatTest, RenderCompleteBar) {
    auto line = console_progress_sink::render_line(figures(100, 100), "done", 10);

    EXPECT_EQ(line.rfind("[==========] 100 B/100 B", 0), 0u);
}

TEST(ConsoleFormatTest, RenderEmptyTotalIsComplete) {
    auto line = console_progress_sink::render_line(figures(0, 0), "", 4);

    EXPECT_EQ(line.rfind("[====]", 0), 0u);
}

// =============================================================================
// Sink behaviour
// =============================================================================

TEST(ConsoleProgressSinkTest, NonTerminalStreamDrawsNothing) {
    std::ostringstream out;
    console_progress_sink sink(out, console_progress_sink::options{});

    EXPECT_FALSE(sink.is_drawing());

    auto bar = sink.add(100, "file.bin");
    bar->set_position(50);
    bar->finish_and_clear();

    EXPECT_TRUE(out.str().empty());
}

TEST(ConsoleProgressSinkTest, NonTerminalPrintlnIsPlain) {
    std::ostringstream out;
    console_progress_sink sink(out, console_progress_sink::options{});

    sink.println("hello");

    EXPECT_EQ(out.str(), "hello\n");
}

TEST(ConsoleProgressSinkTest, LiveBarsTracksHandles) {
    std::ostringstream out;
    console_progress_sink sink(out, console_progress_sink::options{});

    auto first = sink.add(10, "a");
    {
        auto second = sink.add(10, "b");
        EXPECT_EQ(sink.live_bars(), 2u);
    }
    EXPECT_EQ(sink.live_bars(), 1u);

    first->finish_and_clear();
    EXPECT_EQ(sink.live_bars(), 0u);

    // Calls after finishing are ignored
    first->set_position(5);
    first->finish_and_clear();
    EXPECT_EQ(sink.live_bars(), 0u);
}

TEST(ConsoleProgressSinkTest, DrawsAndClears) {
    std::ostringstream out;
    console_progress_sink sink(out, drawing_options());

    auto bar = sink.add(100, "file.bin");
    EXPECT_NE(out.str().find("file.bin"), std::string::npos);

    bar->set_message("other.bin");
    bar->set_position(100);
    EXPECT_NE(out.str().find("[==========] 100 B/100 B"), std::string::npos);
    EXPECT_NE(out.str().find("other.bin"), std::string::npos);

    bar->finish_and_clear();
    auto text = out.str();
    EXPECT_NE(text.rfind("\x1b[1A\x1b[2K"), std::string::npos);
    EXPECT_EQ(sink.live_bars(), 0u);
}

TEST(ConsoleProgressSinkTest, PrintlnGoesAboveBars) {
    std::ostringstream out;
    console_progress_sink sink(out, drawing_options());

    auto bar = sink.add(100, "file.bin");
    sink.println("log line");

    auto text = out.str();
    auto log_pos = text.find("log line\n");
    ASSERT_NE(log_pos, std::string::npos);
    // The bar is redrawn after the line
    EXPECT_NE(text.find("file.bin", log_pos), std::string::npos);
}

TEST(ConsoleProgressSinkTest, AttachLoggerRoutesLines) {
    std::ostringstream out;
    get_logger().set_level(log_level::info);
    {
        console_progress_sink sink(out, console_progress_sink::options{});
        sink.attach_logger();

        FM_LOG_INFO(log_category::cli, "through the sink");
    }

    EXPECT_NE(out.str().find("through the sink"), std::string::npos);
}

}  // namespace kcenon::file_move::test
