/**
 * @file file_primitives.h
 * @brief Interface for the O(1) transfer primitives tried before copying
 */

#ifndef KCENON_FILE_MOVE_CORE_FILE_PRIMITIVES_H
#define KCENON_FILE_MOVE_CORE_FILE_PRIMITIVES_H

#include <filesystem>
#include <memory>
#include <system_error>

namespace kcenon::file_move {

/**
 * @brief Abstract interface for metadata-only transfer primitives
 *
 * Implementations report failures as OS error codes so the caller can
 * classify them with classify(). A successful call has finished the whole
 * transfer; there is no partial state to clean up.
 */
class file_primitives {
public:
    virtual ~file_primitives() = default;

    /**
     * @brief Atomically rename a file, replacing an existing destination
     */
    [[nodiscard]] virtual auto rename(const std::filesystem::path& source,
                                      const std::filesystem::path& destination)
        -> std::error_code = 0;

    /**
     * @brief Create destination as a copy-on-write clone of source
     *
     * The destination must not exist. On failure no destination file is left
     * behind.
     */
    [[nodiscard]] virtual auto clone(const std::filesystem::path& source,
                                     const std::filesystem::path& destination)
        -> std::error_code = 0;
};

/**
 * @brief Linux implementation using rename(2) and ioctl(FICLONE)
 */
class posix_file_primitives final : public file_primitives {
public:
    [[nodiscard]] auto rename(const std::filesystem::path& source,
                              const std::filesystem::path& destination)
        -> std::error_code override;

    [[nodiscard]] auto clone(const std::filesystem::path& source,
                             const std::filesystem::path& destination)
        -> std::error_code override;
};

/**
 * @brief Create the default primitives for this platform
 */
[[nodiscard]] auto make_default_primitives() -> std::unique_ptr<file_primitives>;

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_FILE_PRIMITIVES_H
