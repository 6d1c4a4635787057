#include "stats/rolling_stats.hpp"
#include <algorithm>
#include <cmath>

namespace statarb {

WindowStats compute_window_stats(const CircularBuffer<double>& samples, size_t n) noexcept {
    WindowStats stats;
    size_t count = std::min(n, samples.size());
    if (count == 0) return stats;

    size_t first = samples.size() - count;
    double sum = 0.0;
    for (size_t i = first; i < samples.size(); ++i) {
        sum += samples[i];
    }
    stats.mean = sum / static_cast<double>(count);

    // Two-pass variance
    double sq_sum = 0.0;
    for (size_t i = first; i < samples.size(); ++i) {
        double d = samples[i] - stats.mean;
        sq_sum += d * d;
    }
    stats.stddev = std::sqrt(sq_sum / static_cast<double>(count));
    stats.count = count;
    return stats;
}

double pearson_correlation(const CircularBuffer<double>& x,
                           const CircularBuffer<double>& y,
                           size_t n) noexcept {
    size_t count = std::min({n, x.size(), y.size()});
    if (count < 2) return 0.0;

    size_t x0 = x.size() - count;
    size_t y0 = y.size() - count;

    double mean_x = 0.0, mean_y = 0.0;
    for (size_t i = 0; i < count; ++i) {
        mean_x += x[x0 + i];
        mean_y += y[y0 + i];
    }
    mean_x /= static_cast<double>(count);
    mean_y /= static_cast<double>(count);

    double cov = 0.0, var_x = 0.0, var_y = 0.0;
    for (size_t i = 0; i < count; ++i) {
        double dx = x[x0 + i] - mean_x;
        double dy = y[y0 + i] - mean_y;
        cov += dx * dy;
        var_x += dx * dx;
        var_y += dy * dy;
    }

    if (var_x <= 0.0 || var_y <= 0.0) return 0.0;
    double r = cov / std::sqrt(var_x * var_y);
    return std::clamp(r, -1.0, 1.0);
}

} // namespace statarb
