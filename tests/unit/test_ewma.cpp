#include <gtest/gtest.h>
#include "stats/ewma.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

using namespace statarb;

namespace {

EwmaEstimator make_estimator(double alpha, DispersionMode mode = DispersionMode::SquaredDeviation) {
    EwmaEstimator::Params p;
    p.alpha = alpha;
    p.mode = mode;
    return EwmaEstimator(p);
}

} // namespace

TEST(EwmaTest, FirstObservationSeedsState) {
    auto est = make_estimator(0.1);
    EwmaState state;
    est.update(state, 10000.0);
    EXPECT_DOUBLE_EQ(state.mean, 10000.0);
    EXPECT_DOUBLE_EQ(state.variance, 1.0);
    EXPECT_EQ(state.samples, 1u);
}

TEST(EwmaTest, SquaredDeviationUpdate) {
    auto est = make_estimator(0.1);
    EwmaState state;
    est.update(state, 100.0);
    est.update(state, 110.0);
    // mean = 100 + 0.1*10 = 101; var = 0.1*81 + 0.9*1 = 9
    EXPECT_NEAR(state.mean, 101.0, 1e-12);
    EXPECT_NEAR(state.variance, 9.0, 1e-12);
    EXPECT_NEAR(est.dispersion(state), 3.0, 1e-12);
}

TEST(EwmaTest, AbsoluteDeviationUsesPriorMean) {
    auto est = make_estimator(0.1, DispersionMode::AbsoluteDeviation);
    EwmaState state;
    est.update(state, 100.0);
    est.update(state, 110.0);
    // mad = 0.1*|110 - 100| + 0.9*1 = 1.9
    EXPECT_NEAR(state.mean, 101.0, 1e-12);
    EXPECT_NEAR(est.dispersion(state), 1.9, 1e-12);
}

TEST(EwmaTest, ConstantInputConverges) {
    for (double alpha : {0.05, 0.1, 0.3, 0.7}) {
        for (auto mode : {DispersionMode::SquaredDeviation, DispersionMode::AbsoluteDeviation}) {
            auto est = make_estimator(alpha, mode);
            EwmaState state;
            est.update(state, 120.0);
            for (int i = 0; i < 2000; ++i) {
                est.update(state, 50.0);
            }
            EXPECT_NEAR(state.mean, 50.0, 1e-6) << "alpha=" << alpha;
            EXPECT_NEAR(est.dispersion(state), 0.0, 1e-6) << "alpha=" << alpha;
        }
    }
}

TEST(EwmaTest, ZScoreOfConstantSeriesIsExactlyZero) {
    auto est = make_estimator(0.3);
    EwmaState state;
    for (int i = 0; i < 100; ++i) {
        est.update(state, 1973.5);
    }
    EXPECT_EQ(est.z_score(state, 1973.5), 0.0);
}

TEST(EwmaTest, FloorBoundsZScore) {
    auto est = make_estimator(0.5);
    EwmaState state;
    state.mean = 100.0;
    state.variance = 0.0;
    state.samples = 10;
    // dispersion 0 -> floor 1.0
    EXPECT_DOUBLE_EQ(est.z_score(state, 103.0), 3.0);
}

TEST(EwmaTest, NonFiniteObservationIgnored) {
    auto est = make_estimator(0.1);
    EwmaState state;
    est.update(state, 10.0);
    est.update(state, std::numeric_limits<double>::quiet_NaN());
    EXPECT_DOUBLE_EQ(state.mean, 10.0);
    EXPECT_EQ(state.samples, 1u);
}

TEST(EwmaTest, InvalidParamsThrow) {
    EwmaEstimator::Params p;
    p.alpha = 0.0;
    EXPECT_THROW(EwmaEstimator{p}, std::invalid_argument);
    p.alpha = 1.0;
    EXPECT_THROW(EwmaEstimator{p}, std::invalid_argument);
    p.alpha = 0.2;
    p.dispersion_floor = 0.0;
    EXPECT_THROW(EwmaEstimator{p}, std::invalid_argument);
    p.dispersion_floor = 1e-5;
    p.initial_variance = -1.0;
    EXPECT_THROW(EwmaEstimator{p}, std::invalid_argument);
}
