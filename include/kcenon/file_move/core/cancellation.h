/**
 * @file cancellation.h
 * @brief Cooperative cancellation for move and copy batches
 *
 * A cancellation_token is set once from outside the core (normally by the
 * interrupt handler) and polled between discrete units of work: before each
 * batch source and before each top-level entry of a directory merge. On
 * detection the core terminates the process with cancelled_exit_code instead
 * of returning an error, so a half-finished batch is never reported as a
 * plain failure or success.
 *
 * @code
 * cancellation_token token;
 * install_interrupt_handler(token);
 *
 * if (token.is_set()) {
 *     terminate_on_cancellation("'big.iso'");
 * }
 * @endcode
 */

#ifndef KCENON_FILE_MOVE_CORE_CANCELLATION_H
#define KCENON_FILE_MOVE_CORE_CANCELLATION_H

#include <atomic>
#include <string_view>

namespace kcenon::file_move {

/// Exit status used when a batch is interrupted (128 + SIGINT)
inline constexpr int cancelled_exit_code = 130;

/**
 * @brief Shared flag that, once set, stays set
 */
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    /**
     * @brief Set the flag
     * @return true if this call set it, false if it was already set
     */
    auto request() noexcept -> bool {
        return !flag_.exchange(true);
    }

    [[nodiscard]] auto is_set() const noexcept -> bool {
        return flag_.load();
    }

private:
    std::atomic<bool> flag_{false};
};

static_assert(std::atomic<bool>::is_always_lock_free,
              "cancellation_token is written from a signal handler");

/**
 * @brief Install SIGINT and SIGTERM handlers bound to a token
 *
 * The first signal sets the token. A second signal while the first is being
 * honoured terminates the process immediately with cancelled_exit_code,
 * skipping any cleanup. Only one token can be bound per process; a later call
 * rebinds the handlers.
 *
 * @param token Token to set; must outlive the process' use of the handler
 * @return true if the handlers were installed
 */
auto install_interrupt_handler(cancellation_token& token) -> bool;

/**
 * @brief Log a cancellation notice and exit with cancelled_exit_code
 * @param in_flight Description of the item being processed when the flag was seen
 */
[[noreturn]] void terminate_on_cancellation(std::string_view in_flight);

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_CANCELLATION_H
