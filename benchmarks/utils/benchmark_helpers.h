/**
 * @file benchmark_helpers.h
 * @brief Scratch directories and fixture data for the copy benchmarks
 */

#ifndef KCENON_FILE_MOVE_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_FILE_MOVE_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace kcenon::file_move::benchmark {

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 100 * MB;
}  // namespace sizes

/**
 * @brief Directory under the system temp path, removed on destruction
 *
 * Each instance gets its own directory so a benchmark can run its
 * iterations without leftovers from a previous run.
 */
class scratch_directory {
public:
    scratch_directory();
    ~scratch_directory();

    scratch_directory(const scratch_directory&) = delete;
    auto operator=(const scratch_directory&) -> scratch_directory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return root_; }

    /**
     * @brief Write @p size pseudo-random bytes to path() / @p name
     *
     * Content depends only on @p seed. Parent directories are created.
     */
    auto write_file(const std::string& name, std::size_t size, uint32_t seed = 1)
        -> std::filesystem::path;

    /**
     * @brief Write a two-level tree of equally sized files
     *
     * Layout is name/dir_<d>/file_<f>.bin.
     */
    auto write_tree(const std::string& name,
                    std::size_t directories,
                    std::size_t files_per_directory,
                    std::size_t file_size) -> std::filesystem::path;

    /**
     * @brief Remove everything under path() / @p name
     */
    void clear(const std::string& name);

private:
    std::filesystem::path root_;
};

}  // namespace kcenon::file_move::benchmark

#endif  // KCENON_FILE_MOVE_BENCHMARKS_BENCHMARK_HELPERS_H
