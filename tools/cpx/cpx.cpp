/**
 * @file cpx.cpp
 * @brief Copy files and directories with progress and cross-device fallback
 */

#include <kcenon/file_move/cli/command_line.h>

int main(int argc, char* argv[]) {
    return kcenon::file_move::cli::run_cli(kcenon::file_move::transfer_mode::copy, argc, argv);
}
