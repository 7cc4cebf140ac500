/**
 * @file types.h
 * @brief Core type definitions for file_move_system
 */

#ifndef KCENON_FILE_MOVE_CORE_TYPES_H
#define KCENON_FILE_MOVE_CORE_TYPES_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace kcenon::file_move {

/**
 * @brief Error codes for move and copy operations
 *
 * Error code ranges:
 * - -100 to -119: Path resolution errors
 * - -120 to -139: Batch validation errors
 * - -140 to -159: Configuration errors
 * - -160 to -179: Fatal I/O errors
 */
enum class error_code : int32_t {
    success = 0,

    // Path resolution errors (-100 to -119)
    source_not_found = -100,
    source_wrong_type = -101,
    cannot_derive_name = -102,
    destination_kind_mismatch = -103,
    destination_exists = -104,
    same_file = -105,
    destination_inside_source = -106,

    // Batch validation errors (-120 to -139)
    invalid_source = -120,
    multiple_sources_require_dir_dest = -121,
    mixed_source_kinds = -122,

    // Configuration errors (-140 to -159)
    invalid_configuration = -140,

    // Fatal I/O errors (-160 to -179)
    io_error = -160,
    permission_denied = -161,
    disk_full = -162,
    not_a_directory = -163,
    name_too_long = -164,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::source_not_found:
            return "source does not exist";
        case error_code::source_wrong_type:
            return "source has the wrong type";
        case error_code::cannot_derive_name:
            return "cannot derive file name from source";
        case error_code::destination_kind_mismatch:
            return "destination exists with a different kind";
        case error_code::destination_exists:
            return "destination already exists";
        case error_code::same_file:
            return "source and destination are the same file";
        case error_code::destination_inside_source:
            return "cannot transfer a directory into itself";
        case error_code::invalid_source:
            return "source is neither a file nor a directory";
        case error_code::multiple_sources_require_dir_dest:
            return "multiple sources require a directory destination";
        case error_code::mixed_source_kinds:
            return "cannot mix files and directories in one batch";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::io_error:
            return "I/O error";
        case error_code::permission_denied:
            return "permission denied";
        case error_code::disk_full:
            return "no space left on device";
        case error_code::not_a_directory:
            return "not a directory";
        case error_code::name_too_long:
            return "file name too long";
        default:
            return "unknown error";
    }
}

[[nodiscard]] constexpr auto is_resolution_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -100 && v >= -119;
}

[[nodiscard]] constexpr auto is_validation_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -120 && v >= -139;
}

[[nodiscard]] constexpr auto is_io_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -160 && v >= -179;
}

/**
 * @brief Check whether the error is a policy rejection rather than a failure
 *
 * A destination that already exists without force is the only policy
 * rejection; retrying with force turns it into a success.
 */
[[nodiscard]] constexpr auto is_policy_rejection(error_code code) noexcept -> bool {
    return code == error_code::destination_exists;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    struct error err;

    explicit unexpected(struct error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Map an OS error onto the closest fatal I/O code
 */
[[nodiscard]] auto io_error_code_from(const std::error_code& ec) noexcept -> error_code;

/**
 * @brief Build a fatal I/O error naming the operation and offending path
 *
 * Message format: "<operation> '<path>': <system message>"
 */
[[nodiscard]] auto make_io_error(std::string_view operation,
                                 const std::filesystem::path& path,
                                 const std::error_code& ec) -> error;

/**
 * @brief Quote a path for messages as '<path>'
 */
[[nodiscard]] auto quoted(const std::filesystem::path& path) -> std::string;

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_TYPES_H
