/**
 * @file types.cpp
 * @brief Error construction helpers
 */

#include <kcenon/file_move/core/types.h>

#include <cerrno>

namespace kcenon::file_move {

auto io_error_code_from(const std::error_code& ec) noexcept -> error_code {
    if (ec.category() != std::system_category() &&
        ec.category() != std::generic_category()) {
        return error_code::io_error;
    }

    switch (ec.value()) {
        case EACCES:
        case EPERM:
        case EROFS:
            return error_code::permission_denied;
        case ENOSPC:
        case EDQUOT:
            return error_code::disk_full;
        case ENOTDIR:
            return error_code::not_a_directory;
        case ENAMETOOLONG:
            return error_code::name_too_long;
        default:
            return error_code::io_error;
    }
}

auto make_io_error(std::string_view operation,
                   const std::filesystem::path& path,
                   const std::error_code& ec) -> error {
    return error{io_error_code_from(ec),
                 std::string(operation) + " " + quoted(path) + ": " + ec.message()};
}

auto quoted(const std::filesystem::path& path) -> std::string {
    return "'" + path.string() + "'";
}

}  // namespace kcenon::file_move
