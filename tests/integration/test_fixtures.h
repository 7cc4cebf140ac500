/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_FILE_MOVE_TEST_FIXTURES_H
#define KCENON_FILE_MOVE_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/file_move/file_move.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <system_error>

namespace kcenon::file_move::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("file_move_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        source_dir_ = test_dir_ / "source";
        std::filesystem::create_directories(source_dir_);
        target_dir_ = test_dir_ / "target";
        std::filesystem::create_directories(target_dir_);

        get_logger().set_level(log_level::off);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        get_logger().set_level(log_level::info);
    }

    auto create_test_file(const std::filesystem::path& path, std::size_t size)
        -> std::filesystem::path {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    auto create_text_file(const std::filesystem::path& path, const std::string& content)
        -> std::filesystem::path {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    /**
     * @brief Map of relative path to content ("<dir>" for directories)
     */
    auto snapshot(const std::filesystem::path& root) const
        -> std::map<std::string, std::string> {
        std::map<std::string, std::string> entries;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
            auto relative = entry.path().lexically_relative(root).string();
            entries[relative] = entry.is_directory() ? "<dir>" : read_file(entry.path());
        }
        return entries;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_dir_;
    std::filesystem::path target_dir_;
};

/**
 * @brief Fixture that runs batches with a caller-owned context
 */
class BatchFixture : public TempDirectoryFixture {
protected:
    auto make_context(transfer_mode mode, bool force = false, bool dry_run = false)
        -> std::unique_ptr<transfer_context> {
        auto ctx = std::make_unique<transfer_context>(mode, sink_, token_);
        ctx->force = force;
        ctx->dry_run = dry_run;
        return ctx;
    }

    auto move(std::vector<std::filesystem::path> sources,
              const std::filesystem::path& dest,
              bool force = false) -> result<std::string> {
        auto ctx = make_context(transfer_mode::move, force);
        return run_batch(sources, dest, *ctx);
    }

    auto copy(std::vector<std::filesystem::path> sources,
              const std::filesystem::path& dest,
              bool force = false) -> result<std::string> {
        auto ctx = make_context(transfer_mode::copy, force);
        return run_batch(sources, dest, *ctx);
    }

    null_progress_sink sink_;
    cancellation_token token_;
};

/**
 * @brief Primitives that behave like a cross-device boundary
 */
class cross_device_primitives final : public file_primitives {
public:
    auto rename(const std::filesystem::path&, const std::filesystem::path&)
        -> std::error_code override {
        return std::make_error_code(std::errc::cross_device_link);
    }

    auto clone(const std::filesystem::path&, const std::filesystem::path&)
        -> std::error_code override {
        return std::make_error_code(std::errc::cross_device_link);
    }
};

}  // namespace kcenon::file_move::test

#endif  // KCENON_FILE_MOVE_TEST_FIXTURES_H
