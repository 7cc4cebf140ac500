/**
 * @file batch_orchestrator.h
 * @brief Validates and sequences transfers of many sources into one destination
 */

#ifndef KCENON_FILE_MOVE_CORE_BATCH_ORCHESTRATOR_H
#define KCENON_FILE_MOVE_CORE_BATCH_ORCHESTRATOR_H

#include <kcenon/file_move/core/directory_merger.h>
#include <kcenon/file_move/core/file_primitives.h>
#include <kcenon/file_move/core/transfer_context.h>
#include <kcenon/file_move/core/transfer_engine.h>
#include <kcenon/file_move/core/types.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::file_move {

/**
 * @brief Entry point for one move or copy invocation
 *
 * Every source is classified before anything is touched. A batch of more
 * than one source requires uniform source kinds and an existing destination
 * directory. In dry-run mode the intended actions are logged and the
 * filesystem is left alone; otherwise sources are transferred in the order
 * given, each completed source's summary is logged as soon as it finishes,
 * and the cancellation token is polled before each one.
 *
 * @code
 * null_progress_sink sink;
 * cancellation_token token;
 * transfer_context ctx(transfer_mode::copy, sink, token);
 *
 * batch_orchestrator batch;
 * auto tally = batch.run_batch({"a.txt", "b.txt"}, "backup/", ctx);
 * @endcode
 */
class batch_orchestrator {
public:
    batch_orchestrator();

    /**
     * @brief Construct with custom primitives for the file engine
     */
    explicit batch_orchestrator(std::unique_ptr<file_primitives> primitives);

    batch_orchestrator(const batch_orchestrator&) = delete;
    auto operator=(const batch_orchestrator&) -> batch_orchestrator& = delete;
    batch_orchestrator(batch_orchestrator&&) = delete;
    auto operator=(batch_orchestrator&&) -> batch_orchestrator& = delete;

    /**
     * @brief Transfer every source into dest
     * @param sources Files or directories, processed in the given order
     * @param dest Destination path
     * @param ctx Transfer settings
     * @return Final tally ("2 sources moved"), empty for an empty batch,
     *         or the first error
     */
    [[nodiscard]] auto run_batch(const std::vector<std::filesystem::path>& sources,
                                 const std::filesystem::path& dest,
                                 const transfer_context& ctx) -> result<std::string>;

private:
    [[nodiscard]] auto validate(const std::vector<std::filesystem::path>& sources,
                                const std::filesystem::path& dest) const
        -> result<std::vector<entry_kind>>;

    [[nodiscard]] auto dry_run(const std::vector<std::filesystem::path>& sources,
                               const std::filesystem::path& dest,
                               const transfer_context& ctx) const -> result<std::string>;

    transfer_engine engine_;
    directory_merger merger_;
};

/**
 * @brief Run a batch with the platform's default primitives
 */
[[nodiscard]] auto run_batch(const std::vector<std::filesystem::path>& sources,
                             const std::filesystem::path& dest,
                             const transfer_context& ctx) -> result<std::string>;

/**
 * @brief Render a tally such as "1 source moved" or "3 sources copied"
 */
[[nodiscard]] auto render_tally(std::size_t count, transfer_mode mode) -> std::string;

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_BATCH_ORCHESTRATOR_H
