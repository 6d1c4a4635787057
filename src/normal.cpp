#include "stats/normal.hpp"
#include <algorithm>
#include <cmath>

namespace statarb {

namespace {

constexpr double A1 = 0.254829592;
constexpr double A2 = -0.284496736;
constexpr double A3 = 1.421413741;
constexpr double A4 = -1.453152027;
constexpr double A5 = 1.061405429;
constexpr double P = 0.3275911;
constexpr double SQRT2 = 1.41421356237309504880;

} // anonymous namespace

double erf_approx(double x) noexcept {
    double sign = x >= 0.0 ? 1.0 : -1.0;
    double ax = std::fabs(x);

    double t = 1.0 / (1.0 + P * ax);
    double poly = ((((A5 * t + A4) * t + A3) * t + A2) * t + A1) * t;
    double y = 1.0 - poly * std::exp(-ax * ax);
    return sign * y;
}

double normal_cdf(double x, double mean, double stddev) noexcept {
    if (!(stddev > 0.0)) {
        return x < mean ? 0.0 : 1.0;
    }
    double z = (x - mean) / (stddev * SQRT2);
    return 0.5 * (1.0 + erf_approx(z));
}

double pocket_transition_risk(double age, double mean_duration,
                              double std_duration, double horizon) noexcept {
    double p_now = normal_cdf(age, mean_duration, std_duration);
    double p_future = normal_cdf(age + horizon, mean_duration, std_duration);
    return p_future - p_now;
}

double transition_size_scale(double risk) noexcept {
    return std::max(0.0, 1.0 - risk);
}

} // namespace statarb
