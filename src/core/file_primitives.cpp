/**
 * @file file_primitives.cpp
 * @brief rename(2) and FICLONE based primitives
 */

#include <kcenon/file_move/core/file_primitives.h>

#include <cerrno>
#include <cstdio>

#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kcenon::file_move {

namespace {

/**
 * @brief Owning file descriptor
 */
class unique_fd {
public:
    explicit unique_fd(int fd) noexcept : fd_(fd) {}
    ~unique_fd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    unique_fd(const unique_fd&) = delete;
    auto operator=(const unique_fd&) -> unique_fd& = delete;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

private:
    int fd_;
};

auto last_error() -> std::error_code {
    return {errno, std::system_category()};
}

}  // namespace

auto posix_file_primitives::rename(const std::filesystem::path& source,
                                   const std::filesystem::path& destination)
    -> std::error_code {
    if (::rename(source.c_str(), destination.c_str()) != 0) {
        return last_error();
    }
    return {};
}

auto posix_file_primitives::clone(const std::filesystem::path& source,
                                  const std::filesystem::path& destination)
    -> std::error_code {
    unique_fd src(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
    if (!src.valid()) {
        return last_error();
    }

    struct stat st {};
    if (::fstat(src.get(), &st) != 0) {
        return last_error();
    }

    unique_fd dst(::open(destination.c_str(),
                         O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                         st.st_mode & 07777));
    if (!dst.valid()) {
        return last_error();
    }

    if (::ioctl(dst.get(), FICLONE, src.get()) != 0) {
        auto ec = last_error();
        ::unlink(destination.c_str());
        return ec;
    }
    return {};
}

auto make_default_primitives() -> std::unique_ptr<file_primitives> {
    return std::make_unique<posix_file_primitives>();
}

}  // namespace kcenon::file_move
