/**
 * @file throughput_meter.h
 * @brief Rate and ETA estimation for a progress bar
 *
 * This file defines the throughput_meter class, which turns a stream of
 * absolute byte positions into a moving-window rate, an average rate and an
 * estimated time remaining.
 */

#ifndef KCENON_FILE_MOVE_CORE_THROUGHPUT_METER_H
#define KCENON_FILE_MOVE_CORE_THROUGHPUT_METER_H

#include <chrono>
#include <cstdint>
#include <memory>

namespace kcenon::file_move {

/**
 * @brief Throughput estimation for one bar
 *
 * Positions are sampled at most once per sample interval; the current rate is
 * computed over the last rate_window_size samples. Callers may pass explicit
 * time points, which keeps the arithmetic deterministic under test.
 *
 * @code
 * throughput_meter meter;
 * meter.start(total_bytes);
 *
 * meter.record_position(copied);
 *
 * auto rate = meter.get_current_rate();
 * auto eta = meter.get_eta();
 * @endcode
 */
class throughput_meter {
public:
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;
    using duration = std::chrono::milliseconds;

    /**
     * @brief Sampling configuration
     */
    struct config {
        std::size_t rate_window_size = 10;   ///< Number of samples for moving average
        duration rate_sample_interval{100};  ///< Interval between rate samples
    };

    /**
     * @brief Snapshot of current figures
     */
    struct snapshot {
        uint64_t position = 0;          ///< Last reported position
        uint64_t total = 0;             ///< Final position
        double current_rate = 0.0;      ///< Windowed rate (bytes/sec)
        double average_rate = 0.0;      ///< Rate since start (bytes/sec)
        duration elapsed{0};            ///< Time since start
        duration estimated_remaining{0};
    };

    throughput_meter();
    explicit throughput_meter(config cfg);

    // Non-copyable, movable
    throughput_meter(const throughput_meter&) = delete;
    auto operator=(const throughput_meter&) -> throughput_meter& = delete;
    throughput_meter(throughput_meter&&) noexcept;
    auto operator=(throughput_meter&&) noexcept -> throughput_meter&;

    ~throughput_meter();

    /**
     * @brief Start measuring
     * @param total Final position of the bar
     * @param now Start time
     */
    void start(uint64_t total, time_point now = clock::now());

    /**
     * @brief Record an absolute position
     *
     * Positions lower than the previous one are ignored.
     */
    void record_position(uint64_t position, time_point now = clock::now());

    [[nodiscard]] auto get_position() const noexcept -> uint64_t;
    [[nodiscard]] auto get_total() const noexcept -> uint64_t;

    /**
     * @brief Rate over the sample window in bytes per second
     */
    [[nodiscard]] auto get_current_rate() const -> double;

    /**
     * @brief Rate since start in bytes per second
     */
    [[nodiscard]] auto get_average_rate(time_point now = clock::now()) const -> double;

    /**
     * @brief Estimated time until the total is reached
     *
     * Uses the windowed rate when available, the average rate otherwise.
     */
    [[nodiscard]] auto get_eta(time_point now = clock::now()) const -> duration;

    /**
     * @brief Completion percentage (0.0 - 100.0)
     */
    [[nodiscard]] auto get_completion_percentage() const -> double;

    [[nodiscard]] auto get_snapshot(time_point now = clock::now()) const -> snapshot;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_move

#endif  // KCENON_FILE_MOVE_CORE_THROUGHPUT_METER_H
