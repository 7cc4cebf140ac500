/**
 * @file file_move.h
 * @brief Main header for file_move_system library
 * @version 0.3.0
 *
 * This is the primary include file for the file_move_system library.
 * Include this header to access all move and copy functionality.
 *
 * @code
 * #include <kcenon/file_move/file_move.h>
 *
 * using namespace kcenon::file_move;
 *
 * null_progress_sink sink;
 * cancellation_token token;
 * transfer_context ctx(transfer_mode::move, sink, token);
 * ctx.force = true;
 *
 * auto tally = run_batch({"photos/"}, "/mnt/backup/", ctx);
 * @endcode
 */

#ifndef KCENON_FILE_MOVE_FILE_MOVE_H
#define KCENON_FILE_MOVE_FILE_MOVE_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/file_move/core/types.h"
#include "kcenon/file_move/core/transfer_types.h"
#include "kcenon/file_move/core/transfer_context.h"

// Components
#include "kcenon/file_move/core/path_resolver.h"
#include "kcenon/file_move/core/transfer_engine.h"
#include "kcenon/file_move/core/directory_merger.h"
#include "kcenon/file_move/core/batch_orchestrator.h"

// Ambient
#include "kcenon/file_move/core/cancellation.h"
#include "kcenon/file_move/core/logging.h"
#include "kcenon/file_move/core/progress.h"
#include "kcenon/file_move/core/throughput_meter.h"

namespace kcenon::file_move {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 3;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_FILE_MOVE_H
