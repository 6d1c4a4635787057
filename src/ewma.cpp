#include "stats/ewma.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace statarb {

EwmaEstimator::EwmaEstimator(const Params& params) : params_(params) {
    validate(params_);
}

void EwmaEstimator::validate(const Params& params) {
    if (!(params.alpha > 0.0 && params.alpha < 1.0)) {
        throw std::invalid_argument("ewma.alpha must lie in (0, 1), got " +
                                    std::to_string(params.alpha));
    }
    if (!(params.dispersion_floor > 0.0)) {
        throw std::invalid_argument("ewma.dispersion_floor must be positive");
    }
    if (!(params.initial_variance >= 0.0)) {
        throw std::invalid_argument("ewma.initial_variance must be non-negative");
    }
}

void EwmaEstimator::update(EwmaState& state, double x) const noexcept {
    if (!std::isfinite(x)) return;

    if (state.samples == 0) {
        state.mean = x;
        state.variance = params_.initial_variance;
        state.samples = 1;
        return;
    }

    const double a = params_.alpha;
    const double prev_mean = state.mean;
    // mean + a*(x - mean) keeps a constant series exactly at x
    state.mean = prev_mean + a * (x - prev_mean);

    if (params_.mode == DispersionMode::SquaredDeviation) {
        double dev = x - state.mean;
        state.variance = a * dev * dev + (1.0 - a) * state.variance;
    } else {
        state.variance = a * std::fabs(x - prev_mean) + (1.0 - a) * state.variance;
    }
    ++state.samples;
}

double EwmaEstimator::dispersion(const EwmaState& state) const noexcept {
    if (params_.mode == DispersionMode::SquaredDeviation) {
        return std::sqrt(std::max(state.variance, 0.0));
    }
    return state.variance;
}

double EwmaEstimator::z_score(const EwmaState& state, double x) const noexcept {
    double denom = std::max(dispersion(state), params_.dispersion_floor);
    return (x - state.mean) / denom;
}

} // namespace statarb
