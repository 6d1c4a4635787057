#pragma once

#include <cstdint>

namespace statarb {

/// How the dispersion companion of an EWMA mean is smoothed.
enum class DispersionMode : uint8_t {
    SquaredDeviation = 0,   // var' = a*(x-mean')^2 + (1-a)*var, dispersion = sqrt(var)
    AbsoluteDeviation = 1   // mad' = a*|x-mean| + (1-a)*mad, dispersion = mad
};

/// Persisted estimator state. `variance` holds the MAD in AbsoluteDeviation mode.
struct EwmaState {
    double mean = 0.0;
    double variance = 0.0;
    uint64_t samples = 0;
};

/// Exponentially weighted mean/dispersion tracker. Stateless itself: the
/// state lives in strategy memory and is passed in on every call.
class EwmaEstimator {
public:
    struct Params {
        double alpha = 0.1;
        DispersionMode mode = DispersionMode::SquaredDeviation;
        double dispersion_floor = 1.0;   // z-score denominator never drops below this
        double initial_variance = 1.0;   // seeded on the first observation
    };

    /// Throws std::invalid_argument when alpha is outside (0,1), the floor is
    /// not positive, or the initial variance is negative.
    explicit EwmaEstimator(const Params& params);

    /// Fold one observation into `state`. The first observation seeds the mean.
    /// Non-finite observations are ignored.
    void update(EwmaState& state, double x) const noexcept;

    double dispersion(const EwmaState& state) const noexcept;

    /// (x - mean) / max(dispersion, floor)
    double z_score(const EwmaState& state, double x) const noexcept;

    const Params& params() const noexcept { return params_; }

    static void validate(const Params& params);

private:
    Params params_;
};

} // namespace statarb
