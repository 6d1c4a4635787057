#pragma once

#include "common/types.hpp"
#include "containers/circular_buffer.hpp"
#include <cstdint>

namespace statarb {

/// Latency tracker: keeps the most recent samples in a circular buffer
/// and computes percentile statistics (p50, p90, p99, max).
class LatencyTracker {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1 << 20;

    explicit LatencyTracker(size_t capacity = DEFAULT_CAPACITY) : samples_(capacity) {}

    /// Record a latency sample (nanoseconds)
    void record(uint64_t latency_ns) noexcept { samples_.push_back(latency_ns); }

    struct Stats {
        uint64_t p50 = 0;
        uint64_t p90 = 0;
        uint64_t p99 = 0;
        uint64_t max = 0;
        uint64_t min = 0;
        double mean = 0.0;
        size_t count = 0;
    };

    Stats compute_stats() const;

    size_t count() const noexcept { return samples_.size(); }
    void clear() noexcept { samples_.clear(); }

private:
    CircularBuffer<uint64_t> samples_;
};

/// Records now_ns() - start into a tracker when it goes out of scope.
class ScopedLatency {
public:
    explicit ScopedLatency(LatencyTracker& tracker) noexcept
        : tracker_(tracker), start_(now_ns()) {}
    ~ScopedLatency() { tracker_.record(now_ns() - start_); }

    ScopedLatency(const ScopedLatency&) = delete;
    ScopedLatency& operator=(const ScopedLatency&) = delete;

private:
    LatencyTracker& tracker_;
    uint64_t start_;
};

} // namespace statarb
