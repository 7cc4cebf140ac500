/**
 * @file command_line.h
 * @brief Shared front end of the mvx and cpx tools
 */

#ifndef KCENON_FILE_MOVE_CLI_COMMAND_LINE_H
#define KCENON_FILE_MOVE_CLI_COMMAND_LINE_H

#include <kcenon/file_move/core/logging.h>
#include <kcenon/file_move/core/transfer_types.h>
#include <kcenon/file_move/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::file_move::cli {

/// Exit status for a successful run
inline constexpr int exit_success = 0;

/// Exit status for a failed transfer
inline constexpr int exit_failure = 1;

/// Exit status for invalid command-line usage
inline constexpr int exit_usage = 2;

/// Environment variable that turns on dry-run mode
inline constexpr std::string_view dry_run_env = "MODE_DRY_RUN";

/**
 * @brief Parsed command line
 */
struct cli_options {
    transfer_mode mode = transfer_mode::move;
    bool force = false;
    bool dry_run = false;
    int verbose = 0;  ///< Number of -v flags
    int quiet = 0;    ///< Number of -q flags
    bool log_json = false;
    bool show_help = false;
    bool show_version = false;
    std::vector<std::filesystem::path> sources;
    std::filesystem::path destination;

    /**
     * @brief Log threshold: info by default, -v lowers it, -q raises it up to off
     */
    [[nodiscard]] auto level() const -> log_level;

    /**
     * @brief Bars are drawn at info level or more verbose
     */
    [[nodiscard]] auto show_progress() const -> bool;
};

/**
 * @brief Interpret an environment flag value
 * @return false for unset, empty, "0", "false", "no" and "off" (any case)
 */
[[nodiscard]] auto env_flag_enabled(const char* value) -> bool;

/**
 * @brief Parse arguments
 *
 * dry_run starts from the MODE_DRY_RUN environment variable; -n turns it on.
 * Help and version requests skip the positional argument checks.
 *
 * @return Options or an invalid_configuration error describing the misuse
 */
[[nodiscard]] auto parse_command_line(transfer_mode mode, int argc, char* argv[])
    -> result<cli_options>;

/**
 * @brief Usage text for a tool
 */
[[nodiscard]] auto usage(std::string_view program, transfer_mode mode) -> std::string;

/**
 * @brief Run a tool end to end and return its exit status
 *
 * Exit codes: 0 success, 1 transfer error (printed as "✗ <message>"),
 * 2 usage error. Cancellation exits the process with 130 from inside the
 * batch and never returns here.
 */
[[nodiscard]] auto run_cli(transfer_mode mode, int argc, char* argv[]) -> int;

}  // namespace kcenon::file_move::cli

#endif  // KCENON_FILE_MOVE_CLI_COMMAND_LINE_H
