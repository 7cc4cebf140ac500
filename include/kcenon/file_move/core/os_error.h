/**
 * @file os_error.h
 * @brief Classification of OS errors raised by the fast transfer primitives
 *
 * The fast primitives (rename, copy-on-write clone) fail in two expected ways
 * that must fall back to a buffered copy: the paths live on different
 * filesystems, or the filesystem does not implement the primitive. Every
 * other OS error is fatal. This header is the only place callers learn which
 * is which; platform errno values stay inside os_error.cpp.
 */

#ifndef KCENON_FILE_MOVE_CORE_OS_ERROR_H
#define KCENON_FILE_MOVE_CORE_OS_ERROR_H

#include <string_view>
#include <system_error>

namespace kcenon::file_move {

/**
 * @brief Fast primitive that produced the error
 */
enum class fast_primitive {
    rename,
    clone,
};

[[nodiscard]] constexpr auto to_string(fast_primitive primitive) noexcept
    -> std::string_view {
    switch (primitive) {
        case fast_primitive::rename:
            return "rename";
        case fast_primitive::clone:
            return "reflink";
        default:
            return "unknown";
    }
}

/**
 * @brief Reason a recoverable error falls back to buffered copy
 */
enum class fallback_reason {
    cross_device,
    unsupported,
};

[[nodiscard]] constexpr auto to_string(fallback_reason reason) noexcept
    -> std::string_view {
    switch (reason) {
        case fallback_reason::cross_device:
            return "source and destination are on different devices";
        case fallback_reason::unsupported:
            return "operation not supported by the filesystem";
        default:
            return "unknown";
    }
}

/**
 * @brief Outcome of classifying an OS error
 */
class os_error_class {
public:
    [[nodiscard]] static auto recoverable(fallback_reason reason) noexcept -> os_error_class {
        return os_error_class(true, reason);
    }

    [[nodiscard]] static auto fatal() noexcept -> os_error_class {
        return os_error_class(false, fallback_reason::unsupported);
    }

    [[nodiscard]] auto is_recoverable() const noexcept -> bool { return recoverable_; }
    [[nodiscard]] auto is_fatal() const noexcept -> bool { return !recoverable_; }

    /**
     * @brief Reason for the fallback; meaningful only when recoverable
     */
    [[nodiscard]] auto reason() const noexcept -> fallback_reason { return reason_; }

private:
    os_error_class(bool recoverable, fallback_reason reason) noexcept
        : recoverable_(recoverable), reason_(reason) {}

    bool recoverable_;
    fallback_reason reason_;
};

/**
 * @brief Classify an OS error raised by a fast primitive
 * @param ec Error returned by the primitive (must be non-zero)
 * @param primitive Primitive that failed
 * @return recoverable(reason) or fatal
 */
[[nodiscard]] auto classify(const std::error_code& ec, fast_primitive primitive) noexcept
    -> os_error_class;

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_OS_ERROR_H
