/**
 * @file directory_merger.h
 * @brief Reconciles a source directory tree into a destination tree
 */

#ifndef KCENON_FILE_MOVE_CORE_DIRECTORY_MERGER_H
#define KCENON_FILE_MOVE_CORE_DIRECTORY_MERGER_H

#include <kcenon/file_move/core/transfer_context.h>
#include <kcenon/file_move/core/transfer_engine.h>
#include <kcenon/file_move/core/transfer_types.h>
#include <kcenon/file_move/core/types.h>

#include <filesystem>

namespace kcenon::file_move {

/**
 * @brief Directory merge on top of a transfer_engine
 *
 * Walks the source tree depth-first with an explicit work stack. At every
 * level entries are processed in sorted path order, so two runs over the same
 * tree issue the same operations in the same order. Files are handed to the
 * engine; directories are created in the destination as they are entered and,
 * in move mode, removed from the source once everything beneath them has been
 * transferred. Destination entries with no counterpart in the source are never
 * touched.
 *
 * A conflicting destination file fails the merge unless force is set. Files
 * transferred before the failure stay where they are.
 *
 * The cancellation token is polled before each top-level entry; when it is set
 * the process exits with cancelled_exit_code.
 */
class directory_merger {
public:
    /**
     * @brief Construct on top of an engine that outlives the merger
     */
    explicit directory_merger(transfer_engine& engine);

    directory_merger(const directory_merger&) = delete;
    auto operator=(const directory_merger&) -> directory_merger& = delete;

    /**
     * @brief Merge src_dir into dest_dir
     * @param src_dir Existing source directory
     * @param dest_dir Destination directory; created when missing
     * @param ctx Transfer settings
     * @return Aggregate outcome or the first error encountered
     */
    [[nodiscard]] auto merge(const std::filesystem::path& src_dir,
                             const std::filesystem::path& dest_dir,
                             const transfer_context& ctx) -> result<transfer_outcome>;

    /**
     * @brief Totals gathered by the up-front walk
     */
    struct tree_size {
        uint64_t total_bytes = 0;
        uint64_t file_count = 0;
        uint64_t directory_count = 0;
    };

    /**
     * @brief Walk a tree and sum the size of its regular files
     *
     * Fails with invalid_source on the first entry that is neither a regular
     * file nor a directory.
     */
    [[nodiscard]] static auto measure(const std::filesystem::path& dir) -> result<tree_size>;

private:
    transfer_engine& engine_;
};

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_DIRECTORY_MERGER_H
