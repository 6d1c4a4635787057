#include "monitoring/latency_tracker.hpp"
#include <algorithm>
#include <vector>

namespace statarb {

LatencyTracker::Stats LatencyTracker::compute_stats() const {
    Stats stats{};
    size_t n = samples_.size();
    if (n == 0) return stats;

    // Reporting only, never on the tick path
    std::vector<uint64_t> sorted(samples_.begin(), samples_.end());
    std::sort(sorted.begin(), sorted.end());

    stats.count = n;
    stats.min = sorted.front();
    stats.max = sorted.back();
    stats.p50 = sorted[n * 50 / 100];
    stats.p90 = sorted[n * 90 / 100];
    stats.p99 = sorted[std::min(n - 1, n * 99 / 100)];

    double sum = 0.0;
    for (uint64_t v : sorted) sum += static_cast<double>(v);
    stats.mean = sum / static_cast<double>(n);

    return stats;
}

} // namespace statarb
