#pragma once

#include "containers/circular_buffer.hpp"
#include <cstddef>

namespace statarb {

struct WindowStats {
    double mean = 0.0;
    double stddev = 0.0;   // population (divide by n)
    size_t count = 0;
};

/// Mean and population standard deviation of the newest `n` samples
/// (or all samples when fewer are available).
WindowStats compute_window_stats(const CircularBuffer<double>& samples, size_t n) noexcept;

/// Pearson correlation over the common tail of two series (at most `n` points).
/// Returns 0 with fewer than two points or when either side has no variance.
double pearson_correlation(const CircularBuffer<double>& x,
                           const CircularBuffer<double>& y,
                           size_t n) noexcept;

} // namespace statarb
