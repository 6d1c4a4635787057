#pragma once

namespace statarb {

/// Error function via the 5-term rational approximation of Abramowitz and
/// Stegun (7.1.26). Max absolute error about 1.5e-7; odd-symmetric.
double erf_approx(double x) noexcept;

/// CDF of Normal(mean, stddev) at x. stddev <= 0 degenerates to a step at mean.
double normal_cdf(double x, double mean, double stddev) noexcept;

/// Probability that a pocket of age `age` ends within the next `horizon`
/// ticks, with pocket lifetime modelled as Normal(mean_duration, std_duration):
///   cdf(age + horizon) - cdf(age)
double pocket_transition_risk(double age, double mean_duration,
                              double std_duration, double horizon) noexcept;

/// Order size multiplier: max(0, 1 - risk).
double transition_size_scale(double risk) noexcept;

} // namespace statarb
