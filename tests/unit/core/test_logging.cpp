/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging
 */

#include <gtest/gtest.h>

#include <kcenon/file_move/core/logging.h>

#include <regex>
#include <string>
#include <tuple>
#include <vector>

namespace kcenon::file_move::test {

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContextToJson) {
    transfer_log_context ctx;

    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, BasicFieldsToJson) {
    transfer_log_context ctx;
    ctx.source = "/data/a.iso";
    ctx.destination = "/mnt/b/a.iso";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"source\":\"/data/a.iso\""), std::string::npos);
    EXPECT_NE(json.find("\"destination\":\"/mnt/b/a.iso\""), std::string::npos);
}

TEST_F(TransferLogContextTest, AllFieldsToJson) {
    transfer_log_context ctx;
    ctx.source = "src";
    ctx.destination = "dst";
    ctx.strategy = "copied";
    ctx.file_size = 2048;
    ctx.bytes_transferred = 1024;
    ctx.files_transferred = 3;
    ctx.rate_mbps = 12.5;
    ctx.duration_ms = 80;
    ctx.error_message = "boom";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"strategy\":\"copied\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":2048"), std::string::npos);
    EXPECT_NE(json.find("\"bytes_transferred\":1024"), std::string::npos);
    EXPECT_NE(json.find("\"files_transferred\":3"), std::string::npos);
    EXPECT_NE(json.find("\"rate_mbps\":12.50"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":80"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"boom\""), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonEscaping) {
    transfer_log_context ctx;
    ctx.source = "dir/with \"quotes\"\n";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("with \\\"quotes\\\"\\n"), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BasicBuilder) {
    auto entry = log_entry_builder()
        .with_level(log_level::warn)
        .with_category(log_category::engine)
        .with_message("Falling back")
        .build();

    EXPECT_EQ(entry.level, log_level::warn);
    EXPECT_EQ(entry.category, log_category::engine);
    EXPECT_EQ(entry.message, "Falling back");
    EXPECT_FALSE(entry.context.has_value());
}

TEST_F(LogEntryBuilderTest, BuilderWithContextFields) {
    auto json = log_entry_builder()
        .with_level(log_level::debug)
        .with_category(log_category::merger)
        .with_message("Merged")
        .with_source("a")
        .with_destination("b")
        .with_strategy("merged")
        .with_bytes_transferred(10)
        .build_json();

    EXPECT_NE(json.find("\"level\":\"DEBUG\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"file_move.merger\""), std::string::npos);
    EXPECT_NE(json.find("\"strategy\":\"merged\""), std::string::npos);
    EXPECT_NE(json.find("\"bytes_transferred\":10"), std::string::npos);
}

TEST_F(LogEntryBuilderTest, BuilderWithSourceLocation) {
    auto json = log_entry_builder()
        .with_message("x")
        .with_source_location("engine.cpp", 42, "run")
        .build_json();

    EXPECT_NE(json.find("\"source_location\":{\"file\":\"engine.cpp\",\"line\":42,"
                        "\"function\":\"run\"}"),
              std::string::npos);
}

TEST_F(LogEntryBuilderTest, TimestampFormat) {
    auto entry = log_entry_builder().build();

    std::regex iso8601(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    EXPECT_TRUE(std::regex_match(entry.timestamp, iso8601));
}

// =============================================================================
// Log Level Tests
// =============================================================================

class LogLevelTest : public ::testing::Test {};

TEST_F(LogLevelTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::error), "ERROR");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
    EXPECT_EQ(log_level_to_string(log_level::off), "OFF");
}

// =============================================================================
// Logger Tests
// =============================================================================

class FileMoveLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().enable_json_output(false);
        get_logger().set_line_writer([this](const std::string& line) {
            lines_.push_back(line);
        });
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_line_writer(nullptr);
        get_logger().enable_json_output(false);
        get_logger().set_level(log_level::info);
    }

    std::vector<std::string> lines_;
};

TEST_F(FileMoveLoggerTest, EnableJsonOutput) {
    get_logger().enable_json_output(true);
    EXPECT_TRUE(get_logger().is_json_output_enabled());

    get_logger().enable_json_output(false);
    EXPECT_FALSE(get_logger().is_json_output_enabled());
}

TEST_F(FileMoveLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const transfer_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    FM_LOG_INFO(log_category::batch, "Test message");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::batch);
    EXPECT_EQ(std::get<2>(captured[0]), "Test message");
}

TEST_F(FileMoveLoggerTest, TextLineGoesToWriter) {
    FM_LOG_WARN(log_category::engine, "Cannot preserve permissions");

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_NE(lines_[0].find("[WARN] [file_move.engine] Cannot preserve permissions"),
              std::string::npos);
}

TEST_F(FileMoveLoggerTest, JsonLineCarriesContext) {
    get_logger().enable_json_output(true);

    transfer_log_context ctx;
    ctx.source = "a.bin";
    ctx.bytes_transferred = 7;
    FM_LOG_DEBUG_CTX(log_category::engine, "Copied", ctx);

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_NE(lines_[0].find("\"message\":\"Copied\""), std::string::npos);
    EXPECT_NE(lines_[0].find("\"source\":\"a.bin\""), std::string::npos);
    EXPECT_NE(lines_[0].find("\"bytes_transferred\":7"), std::string::npos);
    EXPECT_NE(lines_[0].find("\"source_location\""), std::string::npos);
}

TEST_F(FileMoveLoggerTest, LogLevelFiltering) {
    get_logger().set_level(log_level::warn);

    FM_LOG_DEBUG(log_category::batch, "Debug message");
    FM_LOG_INFO(log_category::batch, "Info message");
    FM_LOG_WARN(log_category::batch, "Warn message");
    FM_LOG_ERROR(log_category::batch, "Error message");

    ASSERT_EQ(lines_.size(), 2u);
    EXPECT_NE(lines_[0].find("Warn message"), std::string::npos);
    EXPECT_NE(lines_[1].find("Error message"), std::string::npos);
}

TEST_F(FileMoveLoggerTest, OffSilencesEverything) {
    get_logger().set_level(log_level::off);

    FM_LOG_FATAL(log_category::cli, "nothing");

    EXPECT_TRUE(lines_.empty());
    EXPECT_FALSE(get_logger().is_enabled(log_level::off));
}

}  // namespace kcenon::file_move::test
