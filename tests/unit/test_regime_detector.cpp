#include <gtest/gtest.h>
#include "stats/regime_detector.hpp"
#include <stdexcept>
#include <vector>

using namespace statarb;

class RegimeDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_.window = 5;
        params_.min_activity_std = 1.0;
        params_.history_capacity = 20;
    }

    RegimeDetector::Params params_;
    PocketState state_;
};

TEST_F(RegimeDetectorTest, QuietSeriesNeverInPocket) {
    RegimeDetector detector(params_);
    for (int i = 0; i < 500; ++i) {
        double mid = 100.0 + ((i % 2 == 0) ? 0.4 : -0.4);
        auto signal = detector.update(state_, mid);
        ASSERT_FALSE(signal.in_pocket) << "tick " << i;
        ASSERT_EQ(signal.pocket_age, 0u);
        ASSERT_EQ(signal.size_scale, 0.0);
    }
}

TEST_F(RegimeDetectorTest, AgeCountsUpAndResetsOnExit) {
    RegimeDetector detector(params_);
    std::vector<double> mids = {90, 110, 100, 100, 100, 100, 100};
    std::vector<uint32_t> expected_age = {0, 0, 0, 0, 1, 2, 0};
    std::vector<bool> expected_in = {false, false, false, false, true, true, false};

    for (size_t i = 0; i < mids.size(); ++i) {
        auto signal = detector.update(state_, mids[i]);
        EXPECT_EQ(signal.in_pocket, expected_in[i]) << "tick " << i;
        EXPECT_EQ(signal.pocket_age, expected_age[i]) << "tick " << i;
        EXPECT_EQ(state_.pocket_age, expected_age[i]);
        EXPECT_EQ(state_.in_pocket, expected_in[i]);
    }
}

TEST_F(RegimeDetectorTest, FallbackStatsBeforeWindowFills) {
    RegimeDetector detector(params_);
    auto signal = detector.update(state_, 123.0);
    EXPECT_DOUBLE_EQ(signal.rolling_mean, 123.0);
    EXPECT_DOUBLE_EQ(signal.rolling_std, 1.0);
}

TEST_F(RegimeDetectorTest, PocketSignalCarriesRiskAndScale) {
    RegimeDetector detector(params_);
    RegimeSignal signal;
    for (double mid : {90.0, 110.0, 100.0, 100.0, 100.0}) {
        signal = detector.update(state_, mid);
    }
    ASSERT_TRUE(signal.in_pocket);
    EXPECT_GT(signal.transition_risk, 0.0);
    EXPECT_DOUBLE_EQ(signal.size_scale, 1.0 - signal.transition_risk);
    EXPECT_DOUBLE_EQ(signal.rolling_mean, 100.0);
}

TEST_F(RegimeDetectorTest, HistoryIsBounded) {
    RegimeDetector detector(params_);
    for (int i = 0; i < 500; ++i) {
        detector.update(state_, 100.0 + i);
    }
    EXPECT_EQ(state_.price_history.size(), 20u);
    EXPECT_DOUBLE_EQ(state_.price_history.back(), 599.0);
}

TEST_F(RegimeDetectorTest, InvalidParamsThrow) {
    params_.window = 0;
    EXPECT_THROW(RegimeDetector{params_}, std::invalid_argument);
    params_.window = 30;
    params_.history_capacity = 10;
    EXPECT_THROW(RegimeDetector{params_}, std::invalid_argument);
    params_.history_capacity = 200;
    params_.std_duration = -1.0;
    EXPECT_THROW(RegimeDetector{params_}, std::invalid_argument);
}
