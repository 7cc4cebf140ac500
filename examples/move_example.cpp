/**
 * @file move_example.cpp
 * @brief Library usage example: move or copy one path with live progress
 *
 * This example demonstrates:
 * - Building a transfer_context with a console progress sink
 * - Running a batch through batch_orchestrator
 * - Transferring a single file with a custom progress callback
 * - Reporting errors from result<T>
 */

#include <kcenon/file_move/cli/console_progress_sink.h>
#include <kcenon/file_move/file_move.h>

#include <filesystem>
#include <iostream>
#include <string>

using namespace kcenon::file_move;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--copy] [--force] <source> <destination>\n"
              << "\n"
              << "Options:\n"
              << "  --copy    Copy instead of move\n"
              << "  --force   Overwrite existing destination files\n"
              << "  --help    Show this help message\n";
}

/**
 * @brief Transfer one regular file and print every progress step
 */
auto transfer_single_file(const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          const transfer_context& ctx) -> int {
    auto resolved = path_resolver::resolve(source, destination, ctx.force);
    if (!resolved) {
        std::cerr << "Error: " << resolved.error().message << std::endl;
        return 1;
    }

    transfer_engine engine;
    auto outcome = engine.transfer(
        transfer_request(source, resolved.value().path, ctx), [](uint64_t bytes) {
            std::cout << "  ... " << format_bytes(bytes) << std::endl;
        });
    if (!outcome) {
        std::cerr << "Error: " << outcome.error().message << std::endl;
        return 1;
    }

    std::cout << outcome.value().summary << " (" << to_string(outcome.value().strategy)
              << ", " << format_bytes(outcome.value().bytes_transferred) << ")" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    transfer_mode mode = transfer_mode::move;
    bool force = false;
    std::filesystem::path source;
    std::filesystem::path destination;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--copy") {
            mode = transfer_mode::copy;
        } else if (arg == "--force") {
            force = true;
        } else if (source.empty()) {
            source = arg;
        } else if (destination.empty()) {
            destination = arg;
        } else {
            std::cerr << "Error: unexpected argument '" << arg << "'" << std::endl;
            return 1;
        }
    }

    if (source.empty() || destination.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    get_logger().set_level(log_level::debug);
    get_logger().initialize();

    cancellation_token token;
    install_interrupt_handler(token);

    cli::console_progress_sink console;
    console.attach_logger();

    transfer_context ctx(mode, console, token);
    ctx.force = force;

    std::cout << "file_move_system " << version::to_string() << ": "
              << to_string(mode) << " " << quoted(source) << " => " << quoted(destination)
              << std::endl;

    if (kind_of(source) == entry_kind::file) {
        return transfer_single_file(source, destination, ctx);
    }

    batch_orchestrator batch;
    auto tally = batch.run_batch({source}, destination, ctx);
    if (!tally) {
        std::cerr << "Error: " << tally.error().message << std::endl;
        return 1;
    }

    std::cout << tally.value() << std::endl;
    return 0;
}
