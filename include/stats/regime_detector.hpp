#pragma once

#include "containers/circular_buffer.hpp"
#include <cstddef>
#include <cstdint>

namespace statarb {

/// Persisted per-instrument regime record.
struct PocketState {
    CircularBuffer<double> price_history;
    uint32_t pocket_age = 0;
    bool in_pocket = false;
};

struct RegimeSignal {
    bool in_pocket = false;
    uint32_t pocket_age = 0;
    double rolling_mean = 0.0;
    double rolling_std = 1.0;
    double transition_risk = 0.0;
    double size_scale = 0.0;     // 0 outside a pocket
};

/// Stable-pocket classifier with a duration-survival transition model.
/// A tick is "in pocket" when the trailing window is active enough
/// (rolling std above a floor) and the latest price sits within one rolling
/// std of the rolling mean.
class RegimeDetector {
public:
    struct Params {
        size_t window = 30;
        double min_activity_std = 1.0;
        double mean_duration = 100.0;   // expected pocket lifetime in ticks
        double std_duration = 30.0;
        double horizon = 10.0;          // look-ahead for transition risk
        size_t history_capacity = 200;
    };

    /// Throws std::invalid_argument on an empty window, a history shorter
    /// than the window, or negative duration parameters.
    explicit RegimeDetector(const Params& params);

    /// Append `mid` to the history and reclassify. Age increments while in
    /// pocket and resets to 0 on the tick the classifier flips out.
    RegimeSignal update(PocketState& state, double mid) const;

    /// Classification of the newest sample in `prices`.
    static bool is_stable_pocket(const CircularBuffer<double>& prices,
                                 size_t window, double min_activity_std) noexcept;

    const Params& params() const noexcept { return params_; }

    static void validate(const Params& params);

private:
    Params params_;
};

} // namespace statarb
