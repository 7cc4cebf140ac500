/**
 * @file os_error.cpp
 * @brief Linux errno classification for rename and FICLONE failures
 */

#include <kcenon/file_move/core/os_error.h>

#include <cerrno>

namespace kcenon::file_move {

auto classify(const std::error_code& ec, fast_primitive primitive) noexcept
    -> os_error_class {
    if (ec.category() != std::system_category() &&
        ec.category() != std::generic_category()) {
        return os_error_class::fatal();
    }

    switch (ec.value()) {
        case EXDEV:
            return os_error_class::recoverable(fallback_reason::cross_device);

        case EOPNOTSUPP:
#if defined(ENOTSUP) && ENOTSUP != EOPNOTSUPP
        case ENOTSUP:
#endif
        case ENOTTY:
        case ENOSYS:
            return os_error_class::recoverable(fallback_reason::unsupported);

        // Some filesystems reject FICLONE with EINVAL instead of EOPNOTSUPP
        case EINVAL:
            if (primitive == fast_primitive::clone) {
                return os_error_class::recoverable(fallback_reason::unsupported);
            }
            return os_error_class::fatal();

        default:
            return os_error_class::fatal();
    }
}

}  // namespace kcenon::file_move
