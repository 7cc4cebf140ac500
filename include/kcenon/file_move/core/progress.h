/**
 * @file progress.h
 * @brief Progress reporting contract between the core and its renderer
 *
 * The core never draws bars. It asks a progress_sink for a handle sized to
 * the work ahead, reports absolute positions on it, and finishes it. Concrete
 * sinks (console rendering, test recorders, the null sink) live outside the
 * transfer logic.
 */

#ifndef KCENON_FILE_MOVE_CORE_PROGRESS_H
#define KCENON_FILE_MOVE_CORE_PROGRESS_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace kcenon::file_move {

/**
 * @brief One progress bar owned by the caller that requested it
 */
class progress_handle {
public:
    virtual ~progress_handle() = default;

    /**
     * @brief Report the absolute position; positions never decrease
     */
    virtual void set_position(uint64_t position) = 0;

    /**
     * @brief Replace the short label shown next to the bar
     */
    virtual void set_message(std::string_view message) = 0;

    /**
     * @brief Finish the bar and remove it from the display
     */
    virtual void finish_and_clear() = 0;
};

/**
 * @brief Factory for progress handles
 */
class progress_sink {
public:
    virtual ~progress_sink() = default;

    /**
     * @brief Add a bar
     * @param total Final position of the bar
     * @param initial_message Label shown until replaced
     */
    [[nodiscard]] virtual auto add(uint64_t total, std::string_view initial_message)
        -> std::unique_ptr<progress_handle> = 0;
};

/**
 * @brief Sink that discards everything (quiet mode, tests)
 */
class null_progress_sink final : public progress_sink {
public:
    [[nodiscard]] auto add(uint64_t total, std::string_view initial_message)
        -> std::unique_ptr<progress_handle> override;
};

/**
 * @brief Callback receiving cumulative bytes copied for one file
 */
using progress_callback = std::function<void(uint64_t bytes_copied)>;

/**
 * @brief Offsets per-file progress into an aggregate bar
 *
 * A directory merge owns one bar spanning every file in the tree. Each file
 * transfer reports bytes relative to its own start; the cursor adds the bytes
 * already processed in the merge before forwarding to the bar.
 */
class progress_cursor {
public:
    explicit progress_cursor(progress_handle* handle) : handle_(handle) {}

    /**
     * @brief Callback for the file starting at the current base
     */
    [[nodiscard]] auto for_current_file() const -> progress_callback {
        auto* handle = handle_;
        auto base = base_;
        return [handle, base](uint64_t bytes_copied) {
            if (handle != nullptr) {
                handle->set_position(base + bytes_copied);
            }
        };
    }

    /**
     * @brief Move the base past a completed file and report the new position
     */
    void advance(uint64_t file_size) {
        base_ += file_size;
        if (handle_ != nullptr) {
            handle_->set_position(base_);
        }
    }

    [[nodiscard]] auto base() const noexcept -> uint64_t { return base_; }

private:
    progress_handle* handle_;
    uint64_t base_ = 0;
};

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_PROGRESS_H
