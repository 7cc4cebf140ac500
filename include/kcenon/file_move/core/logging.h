/**
 * @file logging.h
 * @brief Process-wide logger with text and JSON records
 *
 * Records go to stderr by default. A line writer hook lets the console
 * progress renderer print records above its bars, and builds with
 * logger_system forward records to a kcenon logger instead.
 */

#ifndef KCENON_FILE_MOVE_CORE_LOGGING_H
#define KCENON_FILE_MOVE_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::file_move {

/**
 * @brief Log categories, one per component
 */
struct log_category {
    static constexpr std::string_view resolver = "file_move.resolver";
    static constexpr std::string_view engine = "file_move.engine";
    static constexpr std::string_view merger = "file_move.merger";
    static constexpr std::string_view batch = "file_move.batch";
    static constexpr std::string_view cli = "file_move.cli";
};

/**
 * @brief Severity of a record
 *
 * off is a threshold only; nothing is logged at it.
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

[[nodiscard]] auto log_level_to_string(log_level level) -> std::string_view;

/**
 * @brief Optional fields attached to a record about one transfer
 *
 * Only populated fields are serialized.
 */
struct transfer_log_context {
    std::string source;
    std::string destination;
    std::optional<std::string> strategy;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> files_transferred;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string;
};

/**
 * @brief One fully described record
 */
struct structured_log_entry {
    std::string timestamp;  ///< ISO 8601, UTC, millisecond precision
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    /**
     * @brief Single-line JSON object; context fields are flattened in
     */
    [[nodiscard]] auto to_json() const -> std::string;
};

/**
 * @brief Fluent construction of structured_log_entry
 *
 * @code
 * auto json = log_entry_builder()
 *     .with_level(log_level::debug)
 *     .with_category(log_category::engine)
 *     .with_message("Copied")
 *     .with_source("/data/a.iso")
 *     .with_strategy("copied")
 *     .with_bytes_transferred(1048576)
 *     .build_json();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder();

    auto with_level(log_level level) -> log_entry_builder&;
    auto with_category(std::string_view category) -> log_entry_builder&;
    auto with_message(std::string_view message) -> log_entry_builder&;

    auto with_source(std::string_view source) -> log_entry_builder&;
    auto with_destination(std::string_view destination) -> log_entry_builder&;
    auto with_strategy(std::string_view strategy) -> log_entry_builder&;
    auto with_file_size(uint64_t size) -> log_entry_builder&;
    auto with_bytes_transferred(uint64_t bytes) -> log_entry_builder&;
    auto with_rate_mbps(double rate) -> log_entry_builder&;
    auto with_duration_ms(uint64_t duration) -> log_entry_builder&;
    auto with_error_message(std::string_view error) -> log_entry_builder&;
    auto with_context(const transfer_log_context& ctx) -> log_entry_builder&;

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder&;

    [[nodiscard]] auto build() const -> structured_log_entry { return entry_; }
    [[nodiscard]] auto build_json() const -> std::string { return entry_.to_json(); }

private:
    auto context() -> transfer_log_context&;

    structured_log_entry entry_;
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the file move system
 *
 * Thread-safe. Obtain it through get_logger().
 */
class file_move_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using line_writer = std::function<void(const std::string&)>;

    file_move_logger();
    ~file_move_logger();

    file_move_logger(const file_move_logger&) = delete;
    auto operator=(const file_move_logger&) -> file_move_logger& = delete;

    /**
     * @brief Attach the logger_system backend when built with it
     *
     * Repeated calls are no-ops until shutdown().
     */
    void initialize();
    void shutdown();
    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) { format_.store(format); }
    [[nodiscard]] auto get_output_format() const -> log_output_format { return format_.load(); }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }
    [[nodiscard]] auto is_json_output_enabled() const -> bool {
        return get_output_format() == log_output_format::json;
    }

    /**
     * @brief Observe every enabled record before it is formatted
     */
    void set_callback(log_callback callback);

    /**
     * @brief Redirect formatted lines; an empty function restores stderr
     */
    void set_line_writer(line_writer writer);

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr);

    void flush();

private:
    struct backend;

    void emit(log_level level, const std::string& line);

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<log_output_format> format_{log_output_format::text};
    std::atomic<bool> initialized_{false};

    std::mutex hooks_mutex_;
    log_callback callback_;
    line_writer writer_;

    std::unique_ptr<backend> backend_;
};

/**
 * @brief Global logger instance
 */
auto get_logger() -> file_move_logger&;

}  // namespace kcenon::file_move

#define FM_LOG(level, category, message) \
    kcenon::file_move::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FM_LOG_CTX(level, category, message, context) \
    kcenon::file_move::get_logger().log( \
        level, category, message, &(context), __FILE__, __LINE__, __FUNCTION__)

#define FM_LOG_TRACE(category, message) \
    FM_LOG(kcenon::file_move::log_level::trace, category, message)
#define FM_LOG_DEBUG(category, message) \
    FM_LOG(kcenon::file_move::log_level::debug, category, message)
#define FM_LOG_INFO(category, message) \
    FM_LOG(kcenon::file_move::log_level::info, category, message)
#define FM_LOG_WARN(category, message) \
    FM_LOG(kcenon::file_move::log_level::warn, category, message)
#define FM_LOG_ERROR(category, message) \
    FM_LOG(kcenon::file_move::log_level::error, category, message)
#define FM_LOG_FATAL(category, message) \
    FM_LOG(kcenon::file_move::log_level::fatal, category, message)

#define FM_LOG_DEBUG_CTX(category, message, ctx) \
    FM_LOG_CTX(kcenon::file_move::log_level::debug, category, message, ctx)
#define FM_LOG_INFO_CTX(category, message, ctx) \
    FM_LOG_CTX(kcenon::file_move::log_level::info, category, message, ctx)

#endif  // KCENON_FILE_MOVE_CORE_LOGGING_H
