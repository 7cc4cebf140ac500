/**
 * @file command_line.cpp
 * @brief Argument parsing and the run loop shared by mvx and cpx
 */

#include <kcenon/file_move/cli/command_line.h>

#include <kcenon/file_move/cli/console_progress_sink.h>
#include <kcenon/file_move/file_move.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>

#include <getopt.h>

namespace kcenon::file_move::cli {

namespace {

constexpr int opt_log_json = 256;

auto default_program(transfer_mode mode) -> std::string_view {
    return mode == transfer_mode::move ? "mvx" : "cpx";
}

auto program_name(int argc, char* argv[], transfer_mode mode) -> std::string {
    if (argc > 0 && argv[0] != nullptr && argv[0][0] != '\0') {
        return std::filesystem::path(argv[0]).filename().string();
    }
    return std::string(default_program(mode));
}

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto usage_error(std::string message) -> unexpected {
    return unexpected(error{error_code::invalid_configuration, std::move(message)});
}

}  // namespace

auto cli_options::level() const -> log_level {
    int index = static_cast<int>(log_level::info) - verbose + quiet;
    if (index <= static_cast<int>(log_level::trace)) {
        return log_level::trace;
    }
    if (index > static_cast<int>(log_level::error)) {
        return log_level::off;
    }
    return static_cast<log_level>(index);
}

auto cli_options::show_progress() const -> bool {
    return static_cast<int>(level()) <= static_cast<int>(log_level::info);
}

auto env_flag_enabled(const char* value) -> bool {
    if (value == nullptr) {
        return false;
    }

    auto text = lower(value);
    return !(text.empty() || text == "0" || text == "false" || text == "no" || text == "off");
}

auto usage(std::string_view program, transfer_mode mode) -> std::string {
    auto verb = mode == transfer_mode::move ? "Move" : "Copy";
    auto target = mode == transfer_mode::move ? "move or merge" : "copy";

    std::ostringstream oss;
    oss << "Usage: " << program << " [OPTIONS] <SRC>... <DEST>\n"
        << "\n"
        << verb << " files and directories, falling back to a copy with progress\n"
        << "when the fast path is not available.\n"
        << "\n"
        << "Arguments:\n"
        << "  <SRC>...          Paths to " << target << " from\n"
        << "  <DEST>            Path to " << target << " to\n"
        << "\n"
        << "Options:\n"
        << "  -f, --force       Overwrite existing files\n"
        << "  -n, --dry-run     Show what would be done without doing it [env: "
        << dry_run_env << "]\n"
        << "  -v, --verbose     Increase logging verbosity (repeatable)\n"
        << "  -q, --quiet       Decrease logging verbosity (repeatable)\n"
        << "      --log-json    Write log records as JSON\n"
        << "  -h, --help        Print help\n"
        << "  -V, --version     Print version\n";
    return oss.str();
}

auto parse_command_line(transfer_mode mode, int argc, char* argv[]) -> result<cli_options> {
    static const struct option long_opts[] = {{"force", no_argument, nullptr, 'f'},
                                              {"dry-run", no_argument, nullptr, 'n'},
                                              {"verbose", no_argument, nullptr, 'v'},
                                              {"quiet", no_argument, nullptr, 'q'},
                                              {"log-json", no_argument, nullptr, opt_log_json},
                                              {"help", no_argument, nullptr, 'h'},
                                              {"version", no_argument, nullptr, 'V'},
                                              {nullptr, 0, nullptr, 0}};

    cli_options opts;
    opts.mode = mode;
    opts.dry_run = env_flag_enabled(std::getenv(std::string(dry_run_env).c_str()));

    // Restart the scan; parse_command_line may run more than once per process
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "fnvqhV", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'f':
                opts.force = true;
                break;
            case 'n':
                opts.dry_run = true;
                break;
            case 'v':
                ++opts.verbose;
                break;
            case 'q':
                ++opts.quiet;
                break;
            case opt_log_json:
                opts.log_json = true;
                break;
            case 'h':
                opts.show_help = true;
                break;
            case 'V':
                opts.show_version = true;
                break;
            default: {
                std::string offending = optopt != 0
                                            ? "-" + std::string(1, static_cast<char>(optopt))
                                            : std::string(argv[optind - 1]);
                return usage_error("unexpected argument '" + offending + "'");
            }
        }
    }

    if (opts.show_help || opts.show_version) {
        return opts;
    }

    int remaining = argc - optind;
    if (remaining < 2) {
        return usage_error("expected at least one <SRC> and a <DEST>");
    }

    for (int i = optind; i < argc - 1; ++i) {
        opts.sources.emplace_back(argv[i]);
    }
    opts.destination = argv[argc - 1];
    return opts;
}

auto run_cli(transfer_mode mode, int argc, char* argv[]) -> int {
    auto program = program_name(argc, argv, mode);

    auto parsed = parse_command_line(mode, argc, argv);
    if (!parsed) {
        std::cerr << "✗ " << parsed.error().message << "\n\n" << usage(program, mode);
        return exit_usage;
    }

    const auto& opts = parsed.value();
    if (opts.show_help) {
        std::cout << usage(program, mode);
        return exit_success;
    }
    if (opts.show_version) {
        std::cout << program << " " << version::to_string() << "\n";
        return exit_success;
    }

    auto& logger = get_logger();
    logger.set_level(opts.level());
    logger.enable_json_output(opts.log_json);
    logger.initialize();

    // Bound to the interrupt handler for the rest of the process
    static cancellation_token token;
    install_interrupt_handler(token);

    console_progress_sink console;
    null_progress_sink hidden;
    progress_sink* sink = &hidden;
    if (opts.show_progress()) {
        console.attach_logger();
        sink = &console;
    }

    transfer_context ctx(mode, *sink, token);
    ctx.force = opts.force;
    ctx.dry_run = opts.dry_run;

    FM_LOG_TRACE(log_category::cli,
                 program + ": " + std::to_string(opts.sources.size()) + " source(s) => " +
                     quoted(opts.destination));

    auto tally = run_batch(opts.sources, opts.destination, ctx);
    if (!tally) {
        logger.flush();
        std::cerr << "✗ " << tally.error().message << "\n";
        return exit_failure;
    }

    if (!tally.value().empty()) {
        FM_LOG_INFO(log_category::cli, tally.value());
    }
    logger.flush();
    return exit_success;
}

}  // namespace kcenon::file_move::cli
