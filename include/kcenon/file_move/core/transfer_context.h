/**
 * @file transfer_context.h
 * @brief Configuration bundle threaded through every transfer layer
 */

#ifndef KCENON_FILE_MOVE_CORE_TRANSFER_CONTEXT_H
#define KCENON_FILE_MOVE_CORE_TRANSFER_CONTEXT_H

#include <kcenon/file_move/core/cancellation.h>
#include <kcenon/file_move/core/copy_config.h>
#include <kcenon/file_move/core/progress.h>
#include <kcenon/file_move/core/transfer_types.h>

#include <filesystem>
#include <utility>

namespace kcenon::file_move {

/**
 * @brief Per-invocation transfer settings and collaborators
 *
 * Built once by the caller for a whole batch and passed by reference to every
 * layer beneath it. Not copyable: there is exactly one per invocation.
 */
struct transfer_context {
    transfer_mode mode;
    bool force;    // Overwrite existing destination files
    bool dry_run;  // Report intended actions without touching the filesystem
    copy_config copy;
    progress_sink& progress;
    const cancellation_token& cancellation;

    transfer_context(transfer_mode m,
                     progress_sink& sink,
                     const cancellation_token& token)
        : mode(m)
        , force(false)
        , dry_run(false)
        , progress(sink)
        , cancellation(token) {}

    transfer_context(const transfer_context&) = delete;
    auto operator=(const transfer_context&) -> transfer_context& = delete;
};

/**
 * @brief One resolved file transfer
 */
struct transfer_request {
    std::filesystem::path source;
    std::filesystem::path destination;
    const transfer_context& context;

    transfer_request(std::filesystem::path src,
                     std::filesystem::path dest,
                     const transfer_context& ctx)
        : source(std::move(src))
        , destination(std::move(dest))
        , context(ctx) {}
};

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_TRANSFER_CONTEXT_H
