/**
 * @file cancellation.cpp
 * @brief Interrupt handler installation and cancellation exit
 */

#include <kcenon/file_move/core/cancellation.h>
#include <kcenon/file_move/core/logging.h>

#include <csignal>
#include <cstdlib>
#include <string>

#include <unistd.h>

namespace kcenon::file_move {

namespace {

std::atomic<cancellation_token*> bound_token{nullptr};

void handle_interrupt(int /*signo*/) {
    auto* token = bound_token.load();
    if (token == nullptr || !token->request()) {
        _exit(cancelled_exit_code);
    }
}

}  // namespace

auto install_interrupt_handler(cancellation_token& token) -> bool {
    bound_token.store(&token);

    struct sigaction action {};
    action.sa_handler = handle_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    bool installed = sigaction(SIGINT, &action, nullptr) == 0;
    installed = sigaction(SIGTERM, &action, nullptr) == 0 && installed;

    if (!installed) {
        FM_LOG_WARN(log_category::cli, "Failed to install interrupt handler");
    }
    return installed;
}

void terminate_on_cancellation(std::string_view in_flight) {
    FM_LOG_WARN(log_category::batch,
                "Cancelled by user while processing " + std::string(in_flight));
    get_logger().flush();
    std::exit(cancelled_exit_code);
}

}  // namespace kcenon::file_move
