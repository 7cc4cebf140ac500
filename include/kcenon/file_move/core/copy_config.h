/**
 * @file copy_config.h
 * @brief Configuration for the buffered fallback copy
 */

#ifndef KCENON_FILE_MOVE_CORE_COPY_CONFIG_H
#define KCENON_FILE_MOVE_CORE_COPY_CONFIG_H

#include <kcenon/file_move/core/types.h>

#include <cstddef>
#include <string>

namespace kcenon::file_move {

/**
 * @brief Configuration for the buffered fallback copy
 */
struct copy_config {
    /// Default buffer size (1MB)
    static constexpr std::size_t default_buffer_size = 1024 * 1024;

    /// Minimum allowed buffer size (4KB)
    static constexpr std::size_t min_buffer_size = 4 * 1024;

    /// Maximum allowed buffer size (64MB)
    static constexpr std::size_t max_buffer_size = 64 * 1024 * 1024;

    /// Bytes read and written per step; one progress report per step
    std::size_t buffer_size = default_buffer_size;

    /// Apply the source permission bits to files created by the fallback copy
    bool preserve_permissions = true;

    copy_config() = default;

    explicit copy_config(std::size_t size) : buffer_size(size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (buffer_size < min_buffer_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "copy buffer too small (minimum: " + std::to_string(min_buffer_size) + ")"});
        }
        if (buffer_size > max_buffer_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "copy buffer too large (maximum: " + std::to_string(max_buffer_size) + ")"});
        }
        return {};
    }
};

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_COPY_CONFIG_H
