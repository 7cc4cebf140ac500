/**
 * @file benchmark_helpers.cpp
 * @brief Scratch directory implementation
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <fstream>
#include <random>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace kcenon::file_move::benchmark {

namespace {

std::atomic<unsigned> next_scratch_id{0};

}  // namespace

scratch_directory::scratch_directory()
    : root_(std::filesystem::temp_directory_path() /
            ("file_move_bench_" + std::to_string(::getpid()) + "_" +
             std::to_string(next_scratch_id++))) {
    std::filesystem::create_directories(root_);
}

scratch_directory::~scratch_directory() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

auto scratch_directory::write_file(const std::string& name, std::size_t size, uint32_t seed)
    -> std::filesystem::path {
    auto target = root_ / name;
    std::filesystem::create_directories(target.parent_path());

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot create " + target.string());
    }

    std::mt19937 gen(seed);
    std::array<char, 64 * 1024> block{};
    std::size_t remaining = size;
    while (remaining > 0) {
        for (auto& byte : block) {
            byte = static_cast<char>(gen() & 0xFF);
        }
        auto n = std::min(remaining, block.size());
        out.write(block.data(), static_cast<std::streamsize>(n));
        remaining -= n;
    }
    return target;
}

auto scratch_directory::write_tree(const std::string& name,
                                   std::size_t directories,
                                   std::size_t files_per_directory,
                                   std::size_t file_size) -> std::filesystem::path {
    std::filesystem::create_directories(root_ / name);

    uint32_t seed = 1;
    for (std::size_t d = 0; d < directories; ++d) {
        for (std::size_t f = 0; f < files_per_directory; ++f) {
            write_file(name + "/dir_" + std::to_string(d) + "/file_" + std::to_string(f) + ".bin",
                       file_size, seed++);
        }
    }
    return root_ / name;
}

void scratch_directory::clear(const std::string& name) {
    std::filesystem::remove_all(root_ / name);
}

}  // namespace kcenon::file_move::benchmark
