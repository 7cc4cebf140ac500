/**
 * @file progress.cpp
 * @brief Null progress sink
 */

#include <kcenon/file_move/core/progress.h>

namespace kcenon::file_move {

namespace {

class null_progress_handle final : public progress_handle {
public:
    void set_position(uint64_t /*position*/) override {}
    void set_message(std::string_view /*message*/) override {}
    void finish_and_clear() override {}
};

}  // namespace

auto null_progress_sink::add(uint64_t /*total*/, std::string_view /*initial_message*/)
    -> std::unique_ptr<progress_handle> {
    return std::make_unique<null_progress_handle>();
}

}  // namespace kcenon::file_move
