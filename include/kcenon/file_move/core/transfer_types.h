/**
 * @file transfer_types.h
 * @brief Transfer-related data structures for file_move_system
 *
 * This file defines the transfer mode, the strategies of the transfer ladder
 * and the outcome reported for each completed file or directory.
 */

#ifndef KCENON_FILE_MOVE_CORE_TRANSFER_TYPES_H
#define KCENON_FILE_MOVE_CORE_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace kcenon::file_move {

/**
 * @brief Whether the source survives the transfer
 */
enum class transfer_mode {
    move,
    copy,
};

[[nodiscard]] constexpr auto to_string(transfer_mode mode) noexcept -> std::string_view {
    switch (mode) {
        case transfer_mode::move:
            return "move";
        case transfer_mode::copy:
            return "copy";
        default:
            return "unknown";
    }
}

/**
 * @brief Past-tense verb for a finished file transfer ("Moved", "Copied")
 */
[[nodiscard]] constexpr auto file_verb(transfer_mode mode) noexcept -> std::string_view {
    return mode == transfer_mode::move ? "Moved" : "Copied";
}

/**
 * @brief Past-tense verb for a finished directory transfer ("Merged", "Copied")
 */
[[nodiscard]] constexpr auto directory_verb(transfer_mode mode) noexcept
    -> std::string_view {
    return mode == transfer_mode::move ? "Merged" : "Copied";
}

/**
 * @brief Lower-case verb used in intentions and tallies ("moved", "copied")
 */
[[nodiscard]] constexpr auto participle(transfer_mode mode) noexcept -> std::string_view {
    return mode == transfer_mode::move ? "moved" : "copied";
}

/**
 * @brief Strategy that completed a file transfer
 */
enum class transfer_strategy {
    renamed,    // Same-filesystem atomic rename
    reflinked,  // Copy-on-write clone
    copied,     // Buffered fallback copy
    merged,     // Directory merge (aggregate of the above)
};

[[nodiscard]] constexpr auto to_string(transfer_strategy strategy) noexcept
    -> std::string_view {
    switch (strategy) {
        case transfer_strategy::renamed:
            return "renamed";
        case transfer_strategy::reflinked:
            return "reflinked";
        case transfer_strategy::copied:
            return "copied";
        case transfer_strategy::merged:
            return "merged";
        default:
            return "unknown";
    }
}

/**
 * @brief Kind of a filesystem entry, following symlinks
 */
enum class entry_kind {
    missing,
    file,
    directory,
    other,
};

[[nodiscard]] constexpr auto to_string(entry_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case entry_kind::missing:
            return "missing";
        case entry_kind::file:
            return "file";
        case entry_kind::directory:
            return "directory";
        case entry_kind::other:
            return "other";
        default:
            return "unknown";
    }
}

/**
 * @brief Classify a path as file, directory, other or missing
 */
[[nodiscard]] auto kind_of(const std::filesystem::path& path) -> entry_kind;

using duration = std::chrono::milliseconds;

/**
 * @brief Result of one completed transfer
 */
struct transfer_outcome {
    std::filesystem::path source;
    std::filesystem::path destination;
    transfer_strategy strategy;
    uint64_t bytes_transferred;   // Bytes moved (all files, for a merge)
    uint64_t files_transferred;   // 1 for a file, file count for a merge
    duration elapsed_time;
    std::string summary;          // Rendered one-line summary

    transfer_outcome()
        : strategy(transfer_strategy::copied)
        , bytes_transferred(0)
        , files_transferred(0)
        , elapsed_time(0) {}
};

/**
 * @brief Render a summary line: "<Verb> in <duration>: '<src>' => '<dest>'"
 */
[[nodiscard]] auto render_summary(std::string_view verb,
                                  duration elapsed,
                                  const std::filesystem::path& source,
                                  const std::filesystem::path& destination) -> std::string;

/**
 * @brief Format a duration for humans (e.g. "12 seconds", "3 minutes")
 */
[[nodiscard]] auto format_duration(duration elapsed) -> std::string;

/**
 * @brief Format bytes into human-readable string (e.g. "1.50 MB")
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_TRANSFER_TYPES_H
