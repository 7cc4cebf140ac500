/**
 * @file logging.cpp
 * @brief Record formatting and sinks for the process-wide logger
 */

#include <kcenon/file_move/core/logging.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define FILE_MOVE_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::file_move {

namespace {

auto escape_json(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

/**
 * @brief Appends "key":value members separated by commas
 */
class json_members {
public:
    explicit json_members(std::ostringstream& out) : out_(out) {}

    void add(std::string_view key, std::string_view value) {
        separate(key);
        out_ << '"' << escape_json(value) << '"';
    }

    void add(std::string_view key, uint64_t value) {
        separate(key);
        out_ << value;
    }

    void add(std::string_view key, double value) {
        separate(key);
        out_ << std::fixed << std::setprecision(2) << value;
    }

    /// Splices the members of an already serialized object
    void splice(const std::string& object) {
        if (object.size() <= 2) return;
        if (!empty_) out_ << ',';
        out_ << object.substr(1, object.size() - 2);
        empty_ = false;
    }

private:
    void separate(std::string_view key) {
        if (!empty_) out_ << ',';
        out_ << '"' << key << "\":";
        empty_ = false;
    }

    std::ostringstream& out_;
    bool empty_ = true;
};

auto format_time(bool utc) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    if (utc) {
        gmtime_r(&seconds, &tm_buf);
    } else {
        localtime_r(&seconds, &tm_buf);
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (utc) oss << 'Z';
    return oss.str();
}

auto format_text(log_level level,
                 std::string_view category,
                 std::string_view message,
                 const transfer_log_context* context) -> std::string {
    std::ostringstream oss;
    oss << '[' << log_level_to_string(level) << "] [" << category << "] " << message;
    if (context) {
        oss << ' ' << context->to_json();
    }
    return oss.str();
}

}  // namespace

auto log_level_to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        case log_level::off: return "OFF";
    }
    return "UNKNOWN";
}

// ============================================================================
// Records
// ============================================================================

auto transfer_log_context::to_json() const -> std::string {
    std::ostringstream oss;
    oss << '{';
    json_members members(oss);
    if (!source.empty()) members.add("source", source);
    if (!destination.empty()) members.add("destination", destination);
    if (strategy) members.add("strategy", *strategy);
    if (file_size) members.add("size", *file_size);
    if (bytes_transferred) members.add("bytes_transferred", *bytes_transferred);
    if (files_transferred) members.add("files_transferred", *files_transferred);
    if (rate_mbps) members.add("rate_mbps", *rate_mbps);
    if (duration_ms) members.add("duration_ms", *duration_ms);
    if (error_message) members.add("error_message", *error_message);
    oss << '}';
    return oss.str();
}

auto structured_log_entry::to_json() const -> std::string {
    std::ostringstream oss;
    oss << '{';
    json_members members(oss);
    members.add("timestamp", timestamp);
    members.add("level", log_level_to_string(level));
    members.add("category", category);
    members.add("message", message);
    if (context) {
        members.splice(context->to_json());
    }
    if (source_file) {
        std::ostringstream location;
        location << '{';
        json_members fields(location);
        fields.add("file", *source_file);
        if (source_line) fields.add("line", static_cast<uint64_t>(*source_line));
        if (function_name) fields.add("function", *function_name);
        location << '}';
        oss << ",\"source_location\":" << location.str();
    }
    oss << '}';
    return oss.str();
}

log_entry_builder::log_entry_builder() {
    entry_.timestamp = format_time(true);
}

auto log_entry_builder::with_level(log_level level) -> log_entry_builder& {
    entry_.level = level;
    return *this;
}

auto log_entry_builder::with_category(std::string_view category) -> log_entry_builder& {
    entry_.category = std::string(category);
    return *this;
}

auto log_entry_builder::with_message(std::string_view message) -> log_entry_builder& {
    entry_.message = std::string(message);
    return *this;
}

auto log_entry_builder::with_source(std::string_view source) -> log_entry_builder& {
    context().source = std::string(source);
    return *this;
}

auto log_entry_builder::with_destination(std::string_view destination)
    -> log_entry_builder& {
    context().destination = std::string(destination);
    return *this;
}

auto log_entry_builder::with_strategy(std::string_view strategy) -> log_entry_builder& {
    context().strategy = std::string(strategy);
    return *this;
}

auto log_entry_builder::with_file_size(uint64_t size) -> log_entry_builder& {
    context().file_size = size;
    return *this;
}

auto log_entry_builder::with_bytes_transferred(uint64_t bytes) -> log_entry_builder& {
    context().bytes_transferred = bytes;
    return *this;
}

auto log_entry_builder::with_rate_mbps(double rate) -> log_entry_builder& {
    context().rate_mbps = rate;
    return *this;
}

auto log_entry_builder::with_duration_ms(uint64_t duration) -> log_entry_builder& {
    context().duration_ms = duration;
    return *this;
}

auto log_entry_builder::with_error_message(std::string_view error) -> log_entry_builder& {
    context().error_message = std::string(error);
    return *this;
}

auto log_entry_builder::with_context(const transfer_log_context& ctx) -> log_entry_builder& {
    entry_.context = ctx;
    return *this;
}

auto log_entry_builder::with_source_location(const char* file, int line, const char* function)
    -> log_entry_builder& {
    if (file) entry_.source_file = file;
    if (line > 0) entry_.source_line = line;
    if (function) entry_.function_name = function;
    return *this;
}

auto log_entry_builder::context() -> transfer_log_context& {
    if (!entry_.context) {
        entry_.context.emplace();
    }
    return *entry_.context;
}

// ============================================================================
// Logger
// ============================================================================

#ifdef FILE_MOVE_USE_LOGGER_SYSTEM
namespace {

auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warning;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal:
        case log_level::off: return kcenon::logger::log_level::critical;
    }
    return kcenon::logger::log_level::info;
}

}  // namespace

struct file_move_logger::backend {
    std::unique_ptr<kcenon::logger::logger> logger;
};
#else
struct file_move_logger::backend {};
#endif

file_move_logger::file_move_logger() = default;

file_move_logger::~file_move_logger() = default;

void file_move_logger::initialize() {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true)) {
        return;
    }

#ifdef FILE_MOVE_USE_LOGGER_SYSTEM
    auto built = kcenon::logger::logger_builder()
                     .with_async(false)
                     .with_min_level(to_logger_level(min_level_.load()))
                     .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
                     .build();
    if (built) {
        backend_ = std::make_unique<backend>();
        backend_->logger = std::move(built.value());
    }
#endif
}

void file_move_logger::shutdown() {
#ifdef FILE_MOVE_USE_LOGGER_SYSTEM
    if (backend_ && backend_->logger) {
        backend_->logger->flush();
        backend_->logger->stop();
    }
#endif
    backend_.reset();
    initialized_ = false;
}

void file_move_logger::set_level(log_level level) {
    min_level_.store(level);
#ifdef FILE_MOVE_USE_LOGGER_SYSTEM
    if (backend_ && backend_->logger) {
        backend_->logger->set_min_level(to_logger_level(level));
    }
#endif
}

void file_move_logger::set_callback(log_callback callback) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    callback_ = std::move(callback);
}

void file_move_logger::set_line_writer(line_writer writer) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    writer_ = std::move(writer);
}

void file_move_logger::log(log_level level,
                           std::string_view category,
                           std::string_view message,
                           const transfer_log_context* context,
                           const char* file,
                           int line,
                           const char* function) {
    if (!is_enabled(level)) return;

    log_callback callback;
    [[maybe_unused]] bool redirected = false;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        callback = callback_;
        redirected = static_cast<bool>(writer_);
    }
    if (callback) {
        callback(level, category, message, context);
    }

    if (is_json_output_enabled()) {
        log_entry_builder builder;
        builder.with_level(level).with_category(category).with_message(message);
        if (context) builder.with_context(*context);
        if (file || line > 0 || function) builder.with_source_location(file, line, function);
        emit(level, builder.build_json());
        return;
    }

#ifdef FILE_MOVE_USE_LOGGER_SYSTEM
    // logger_system stamps its own time and level
    if (backend_ && backend_->logger && !redirected) {
        auto text = "[" + std::string(category) + "] " + std::string(message);
        if (context) text += " " + context->to_json();
        backend_->logger->log(to_logger_level(level), text);
        return;
    }
#endif
    emit(level, format_time(false) + " " + format_text(level, category, message, context));
}

void file_move_logger::emit([[maybe_unused]] log_level level, const std::string& line) {
    line_writer writer;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        writer = writer_;
    }
    if (writer) {
        writer(line);
        return;
    }

#ifdef FILE_MOVE_USE_LOGGER_SYSTEM
    if (backend_ && backend_->logger) {
        backend_->logger->log(to_logger_level(level), line);
        return;
    }
#endif

    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << line << '\n';
}

void file_move_logger::flush() {
#ifdef FILE_MOVE_USE_LOGGER_SYSTEM
    if (backend_ && backend_->logger) {
        backend_->logger->flush();
    }
#endif
    std::cerr.flush();
}

auto get_logger() -> file_move_logger& {
    static file_move_logger instance;
    return instance;
}

}  // namespace kcenon::file_move
