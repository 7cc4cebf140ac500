/**
 * @file throughput_meter.cpp
 * @brief Implementation of rate and ETA estimation
 */

#include "kcenon/file_move/core/throughput_meter.h"

#include <deque>

namespace kcenon::file_move {

/**
 * @brief Position sample for moving average calculation
 */
struct position_sample {
    throughput_meter::time_point timestamp;
    uint64_t position;
};

/**
 * @brief Implementation details for throughput_meter
 */
struct throughput_meter::impl {
    config cfg;

    time_point start_time;
    time_point last_sample_time;
    uint64_t position{0};
    uint64_t total{0};

    std::deque<position_sample> samples;

    impl() : cfg{} {}
    explicit impl(config c) : cfg(std::move(c)) {}

    void update_samples(time_point now) {
        if (now - last_sample_time < cfg.rate_sample_interval) {
            return;
        }

        samples.push_back({now, position});
        while (samples.size() > cfg.rate_window_size) {
            samples.pop_front();
        }
        last_sample_time = now;
    }

    [[nodiscard]] auto calculate_current_rate() const -> double {
        if (samples.size() < 2) {
            return 0.0;
        }

        const auto& oldest = samples.front();
        const auto& newest = samples.back();

        auto time_diff =
            std::chrono::duration_cast<duration>(newest.timestamp - oldest.timestamp);
        if (time_diff.count() == 0) {
            return 0.0;
        }

        auto bytes_diff = newest.position - oldest.position;
        return static_cast<double>(bytes_diff) * 1000.0 /
               static_cast<double>(time_diff.count());
    }

    [[nodiscard]] auto calculate_average_rate(time_point now) const -> double {
        auto elapsed = std::chrono::duration_cast<duration>(now - start_time);
        if (elapsed.count() <= 0) {
            return 0.0;
        }

        return static_cast<double>(position) * 1000.0 / static_cast<double>(elapsed.count());
    }

    [[nodiscard]] auto calculate_eta(time_point now) const -> duration {
        if (position >= total || total == 0) {
            return duration{0};
        }

        double rate = calculate_current_rate();
        if (rate <= 0.0) {
            rate = calculate_average_rate(now);
        }
        if (rate <= 0.0) {
            return duration{0};
        }

        uint64_t remaining = total - position;
        auto eta_ms =
            static_cast<int64_t>(static_cast<double>(remaining) * 1000.0 / rate);
        return duration{eta_ms};
    }
};

throughput_meter::throughput_meter() : impl_(std::make_unique<impl>()) {}

throughput_meter::throughput_meter(config cfg) : impl_(std::make_unique<impl>(std::move(cfg))) {}

throughput_meter::throughput_meter(throughput_meter&&) noexcept = default;
auto throughput_meter::operator=(throughput_meter&&) noexcept -> throughput_meter& = default;
throughput_meter::~throughput_meter() = default;

void throughput_meter::start(uint64_t total, time_point now) {
    impl_->total = total;
    impl_->position = 0;
    impl_->start_time = now;
    impl_->last_sample_time = now;

    // Initialize with first sample
    impl_->samples.clear();
    impl_->samples.push_back({now, 0});
}

void throughput_meter::record_position(uint64_t position, time_point now) {
    if (position < impl_->position) {
        return;
    }
    impl_->position = position;
    impl_->update_samples(now);
}

auto throughput_meter::get_position() const noexcept -> uint64_t {
    return impl_->position;
}

auto throughput_meter::get_total() const noexcept -> uint64_t {
    return impl_->total;
}

auto throughput_meter::get_current_rate() const -> double {
    return impl_->calculate_current_rate();
}

auto throughput_meter::get_average_rate(time_point now) const -> double {
    return impl_->calculate_average_rate(now);
}

auto throughput_meter::get_eta(time_point now) const -> duration {
    return impl_->calculate_eta(now);
}

auto throughput_meter::get_completion_percentage() const -> double {
    if (impl_->total == 0) {
        return 0.0;
    }

    return static_cast<double>(impl_->position) / static_cast<double>(impl_->total) * 100.0;
}

auto throughput_meter::get_snapshot(time_point now) const -> snapshot {
    snapshot s;
    s.position = impl_->position;
    s.total = impl_->total;
    s.current_rate = get_current_rate();
    s.average_rate = get_average_rate(now);
    s.elapsed = std::chrono::duration_cast<duration>(now - impl_->start_time);
    s.estimated_remaining = get_eta(now);
    return s;
}

}  // namespace kcenon::file_move
