/**
 * @file transfer_engine.h
 * @brief Moves or copies one regular file using the cheapest working strategy
 */

#ifndef KCENON_FILE_MOVE_CORE_TRANSFER_ENGINE_H
#define KCENON_FILE_MOVE_CORE_TRANSFER_ENGINE_H

#include <kcenon/file_move/core/copy_config.h>
#include <kcenon/file_move/core/file_primitives.h>
#include <kcenon/file_move/core/progress.h>
#include <kcenon/file_move/core/transfer_context.h>
#include <kcenon/file_move/core/transfer_types.h>
#include <kcenon/file_move/core/types.h>

#include <filesystem>
#include <memory>

namespace kcenon::file_move {

/**
 * @brief Single-file transfer with a strategy ladder
 *
 * Strategies, cheapest first:
 * 1. rename (move) or copy-on-write clone (copy) on the resolved paths
 * 2. buffered copy with progress, followed by removal of the source on move
 *
 * The ladder only descends when the fast primitive fails with a
 * cross-device or unsupported error; any other error is returned as is.
 * The caller has already resolved the destination and checked the
 * overwrite policy: an existing destination file is always replaced.
 *
 * @code
 * transfer_engine engine;
 * auto outcome = engine.transfer(transfer_request(src, dest, ctx));
 * if (!outcome) {
 *     std::cerr << outcome.error().message << "\n";
 * }
 * @endcode
 */
class transfer_engine {
public:
    /**
     * @brief Construct with the platform's default primitives
     */
    transfer_engine();

    /**
     * @brief Construct with custom primitives
     * @param primitives Fast primitives to try before the buffered copy
     */
    explicit transfer_engine(std::unique_ptr<file_primitives> primitives);

    ~transfer_engine();

    transfer_engine(transfer_engine&&) noexcept;
    auto operator=(transfer_engine&&) noexcept -> transfer_engine&;

    transfer_engine(const transfer_engine&) = delete;
    auto operator=(const transfer_engine&) -> transfer_engine& = delete;

    /**
     * @brief Transfer one file, drawing a byte bar if the fallback is taken
     * @param request Resolved source and destination
     * @return Outcome or error
     */
    [[nodiscard]] auto transfer(const transfer_request& request) -> result<transfer_outcome>;

    /**
     * @brief Transfer one file, reporting fallback progress to a callback
     * @param request Resolved source and destination
     * @param on_progress Receives cumulative bytes copied after every buffer
     * @return Outcome or error
     */
    [[nodiscard]] auto transfer(const transfer_request& request,
                                const progress_callback& on_progress)
        -> result<transfer_outcome>;

    /**
     * @brief Stream a file into a newly created destination
     *
     * Progress positions never decrease and the last one equals the file
     * size. A partially written destination is removed on failure.
     *
     * @return Bytes copied or error
     */
    [[nodiscard]] static auto buffered_copy(const std::filesystem::path& source,
                                            const std::filesystem::path& destination,
                                            const copy_config& config,
                                            const progress_callback& on_progress)
        -> result<uint64_t>;

private:
    [[nodiscard]] auto run(const transfer_request& request,
                           const progress_callback* on_progress)
        -> result<transfer_outcome>;

    std::unique_ptr<file_primitives> primitives_;
};

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_TRANSFER_ENGINE_H
