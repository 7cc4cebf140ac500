/**
 * @file path_resolver.h
 * @brief Turns a (source, destination) pair into a concrete destination path
 */

#ifndef KCENON_FILE_MOVE_CORE_PATH_RESOLVER_H
#define KCENON_FILE_MOVE_CORE_PATH_RESOLVER_H

#include <kcenon/file_move/core/transfer_types.h>
#include <kcenon/file_move/core/types.h>

#include <filesystem>

namespace kcenon::file_move {

/**
 * @brief Destination naming and conflict checks
 *
 * Naming rule for files: when the destination is an existing directory, or
 * does not exist but is spelled with a trailing separator ("newdir/"), the
 * source's file name is appended. Otherwise the destination is taken
 * verbatim. A directory source is always merged into the destination as
 * given, so "photos" onto an existing "backup" fills "backup" itself.
 *
 * The resolver never touches the filesystem beyond stat calls.
 */
class path_resolver {
public:
    /**
     * @brief Resolved destination of one source
     */
    struct resolved_destination {
        std::filesystem::path path;
        entry_kind source_kind;
        entry_kind existing_kind;  // missing when nothing is there yet
    };

    /**
     * @brief Resolve and check a destination
     * @param source Existing file or directory
     * @param destination Destination as given by the user
     * @param force Whether an existing destination file may be overwritten
     * @return Resolved destination or one of source_not_found,
     *         cannot_derive_name, destination_kind_mismatch,
     *         destination_exists, same_file, destination_inside_source
     */
    [[nodiscard]] static auto resolve(const std::filesystem::path& source,
                                      const std::filesystem::path& destination,
                                      bool force) -> result<resolved_destination>;

    /**
     * @brief Apply the naming rule only, without conflict checks
     *
     * Used for dry runs, which report intentions without failing on the
     * destination's current state.
     */
    [[nodiscard]] static auto target_path(const std::filesystem::path& source,
                                          const std::filesystem::path& destination)
        -> result<std::filesystem::path>;

    /**
     * @brief Check whether a path is spelled with a trailing separator
     */
    [[nodiscard]] static auto has_trailing_separator(const std::filesystem::path& path)
        -> bool;
};

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_PATH_RESOLVER_H
