#include "stats/regime_detector.hpp"
#include "stats/normal.hpp"
#include "stats/rolling_stats.hpp"
#include <cmath>
#include <stdexcept>

namespace statarb {

RegimeDetector::RegimeDetector(const Params& params) : params_(params) {
    validate(params_);
}

void RegimeDetector::validate(const Params& params) {
    if (params.window == 0) {
        throw std::invalid_argument("regime.window must be >= 1");
    }
    if (params.history_capacity < params.window) {
        throw std::invalid_argument("regime.history_capacity must be >= regime.window");
    }
    if (!(params.std_duration >= 0.0) || !(params.mean_duration >= 0.0)) {
        throw std::invalid_argument("regime.mean_duration and regime.std_duration must be non-negative");
    }
    if (!(params.horizon >= 0.0)) {
        throw std::invalid_argument("regime.horizon must be non-negative");
    }
    if (!(params.min_activity_std >= 0.0)) {
        throw std::invalid_argument("regime.min_activity_std must be non-negative");
    }
}

bool RegimeDetector::is_stable_pocket(const CircularBuffer<double>& prices,
                                      size_t window, double min_activity_std) noexcept {
    if (window == 0 || prices.size() < window) return false;
    WindowStats stats = compute_window_stats(prices, window);
    return stats.stddev > min_activity_std &&
           std::fabs(prices.back() - stats.mean) < stats.stddev;
}

RegimeSignal RegimeDetector::update(PocketState& state, double mid) const {
    if (state.price_history.capacity() != params_.history_capacity) {
        state.price_history.set_capacity(params_.history_capacity);
    }
    state.price_history.push_back(mid);

    RegimeSignal signal;
    if (state.price_history.size() >= params_.window) {
        WindowStats stats = compute_window_stats(state.price_history, params_.window);
        signal.rolling_mean = stats.mean;
        signal.rolling_std = stats.stddev;
    } else {
        signal.rolling_mean = mid;
        signal.rolling_std = 1.0;
    }

    bool now_in_pocket = is_stable_pocket(state.price_history, params_.window,
                                          params_.min_activity_std);
    if (now_in_pocket) {
        ++state.pocket_age;
        signal.transition_risk = pocket_transition_risk(
            static_cast<double>(state.pocket_age), params_.mean_duration,
            params_.std_duration, params_.horizon);
        signal.size_scale = transition_size_scale(signal.transition_risk);
    } else {
        state.pocket_age = 0;
    }
    state.in_pocket = now_in_pocket;

    signal.in_pocket = now_in_pocket;
    signal.pocket_age = state.pocket_age;
    return signal;
}

} // namespace statarb
