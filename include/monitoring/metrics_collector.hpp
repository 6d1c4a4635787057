#pragma once

#include "monitoring/latency_tracker.hpp"
#include <cstdint>
#include <cstdio>
#include <string>

namespace statarb {

/// Replay counters plus strategy-call latency.
class MetricsCollector {
public:
    MetricsCollector() = default;

    LatencyTracker& strategy_latency() { return strategy_latency_; }
    const LatencyTracker& strategy_latency() const { return strategy_latency_; }

    void record_tick() noexcept { ++tick_count_; }
    void record_skipped_tick() noexcept { ++skipped_tick_count_; }
    void record_order_received() noexcept { ++orders_received_; }
    void record_order_rejected() noexcept { ++orders_rejected_; }
    void record_fill() noexcept { ++fill_count_; }
    void record_limit_warning() noexcept { ++limit_warnings_; }

    uint64_t ticks() const noexcept { return tick_count_; }
    uint64_t skipped_ticks() const noexcept { return skipped_tick_count_; }
    uint64_t orders_received() const noexcept { return orders_received_; }
    uint64_t orders_rejected() const noexcept { return orders_rejected_; }
    uint64_t fills() const noexcept { return fill_count_; }
    uint64_t limit_warnings() const noexcept { return limit_warnings_; }

    void print_summary(double elapsed_seconds) const;

    /// Write the counters and latency percentiles as CSV. Returns false if
    /// the file cannot be opened.
    bool dump_csv(const std::string& path) const;

    void reset() noexcept;

private:
    LatencyTracker strategy_latency_;

    uint64_t tick_count_ = 0;
    uint64_t skipped_tick_count_ = 0;
    uint64_t orders_received_ = 0;
    uint64_t orders_rejected_ = 0;
    uint64_t fill_count_ = 0;
    uint64_t limit_warnings_ = 0;
};

} // namespace statarb
