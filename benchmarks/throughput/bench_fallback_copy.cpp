/**
 * @file bench_fallback_copy.cpp
 * @brief Benchmarks for the buffered fallback copy and directory merge
 *
 * The fallback copy is the slow path of every cross-device transfer, so its
 * throughput across buffer sizes bounds what users see on the progress bar.
 */

#include <benchmark/benchmark.h>

#include <kcenon/file_move/core/directory_merger.h>
#include <kcenon/file_move/core/logging.h>
#include <kcenon/file_move/core/transfer_engine.h>

#include "utils/benchmark_helpers.h"

#include <filesystem>
#include <memory>
#include <system_error>

namespace kcenon::file_move::benchmark {

namespace {

/**
 * @brief Primitives that always report a cross-device error
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

}  // namespace

/**
 * @brief Buffered copy throughput for a given buffer size
 *
 * Arguments: file size, buffer size
 */
static void BM_FallbackCopy_BufferSize(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto buffer_size = static_cast<std::size_t>(state.range(1));

    scratch_directory scratch;
    auto source = scratch.write_file("source.bin", file_size, 42);
    auto destination = scratch.path() / "destination.bin";

    copy_config config(buffer_size);
    uint64_t callbacks = 0;
    auto on_progress = [&callbacks](uint64_t) { ++callbacks; };

    for (auto _ : state) {
        auto result = transfer_engine::buffered_copy(source, destination, config, on_progress);
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["callbacks_per_copy"] =
        static_cast<double>(callbacks) / static_cast<double>(state.iterations());
    state.counters["throughput_MB_s"] =
        ::benchmark::Counter(static_cast<double>(file_size) / sizes::MB,
                             ::benchmark::Counter::kIsIterationInvariantRate);
}

/**
 * @brief Copy-mode merge of a tree through the fallback path
 *
 * Arguments: directories, files per directory, file size
 */
static void BM_Merge_CopyTree(::benchmark::State& state) {
    const auto directories = static_cast<std::size_t>(state.range(0));
    const auto files = static_cast<std::size_t>(state.range(1));
    const auto file_size = static_cast<std::size_t>(state.range(2));

    get_logger().set_level(log_level::off);

    scratch_directory scratch;
    auto source = scratch.write_tree("tree", directories, files, file_size);

    transfer_engine engine(std::make_unique<cross_device_primitives>());
    directory_merger merger(engine);
    null_progress_sink sink;
    cancellation_token token;
    transfer_context ctx(transfer_mode::copy, sink, token);
    ctx.force = true;

    uint64_t bytes = 0;
    for (auto _ : state) {
        auto result = merger.merge(source, scratch.path() / "copy", ctx);
        if (!result) {
            state.SkipWithError(result.error().message.c_str());
            return;
        }
        bytes = result.value().bytes_transferred;
    }

    state.SetBytesProcessed(static_cast<int64_t>(bytes) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>(directories * files) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(std::to_string(directories * files) + " files");
}

BENCHMARK(BM_FallbackCopy_BufferSize)
    ->Args({sizes::medium_file, 4 * sizes::KB})
    ->Args({sizes::medium_file, 64 * sizes::KB})
    ->Args({sizes::medium_file, 1 * sizes::MB})
    ->Args({sizes::medium_file, 8 * sizes::MB})
    ->Args({sizes::large_file, 1 * sizes::MB})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Merge_CopyTree)
    ->Args({4, 64, 16 * sizes::KB})
    ->Args({16, 16, sizes::small_file})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::file_move::benchmark
