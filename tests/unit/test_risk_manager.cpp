#include <gtest/gtest.h>
#include "risk/risk_manager.hpp"
#include <limits>

using namespace statarb;

class RiskManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        limits_.set_default(50);
        limits_.set("CROISSANTS", 250);
    }

    static Order make_order(const Symbol& symbol, Quantity qty, Price price = 100.0) {
        return Order{symbol, price, qty};
    }

    PositionLimits limits_;
};

TEST_F(RiskManagerTest, Approved) {
    RiskManager mgr(limits_);
    EXPECT_EQ(mgr.check_order(make_order("KELP", 10), 0), RiskCheckResult::Approved);
    EXPECT_EQ(mgr.check_order(make_order("KELP", -50), 0), RiskCheckResult::Approved);
    EXPECT_EQ(mgr.checks_performed(), 2u);
    EXPECT_EQ(mgr.checks_rejected(), 0u);
}

TEST_F(RiskManagerTest, ZeroQuantity) {
    RiskManager mgr(limits_);
    EXPECT_EQ(mgr.check_order(make_order("KELP", 0), 0), RiskCheckResult::ZeroQuantity);
}

TEST_F(RiskManagerTest, InvalidPrice) {
    RiskManager mgr(limits_);
    EXPECT_EQ(mgr.check_order(make_order("KELP", 1, 0.0), 0), RiskCheckResult::InvalidPrice);
    EXPECT_EQ(mgr.check_order(make_order("KELP", 1, -5.0), 0), RiskCheckResult::InvalidPrice);
    EXPECT_EQ(mgr.check_order(make_order("KELP", 1, std::numeric_limits<double>::quiet_NaN()), 0),
              RiskCheckResult::InvalidPrice);
    EXPECT_EQ(mgr.checks_rejected(), 3u);
}

TEST_F(RiskManagerTest, PositionLimitBreached) {
    RiskManager mgr(limits_);
    EXPECT_EQ(mgr.check_order(make_order("KELP", 11), 40), RiskCheckResult::PositionLimitBreached);
    EXPECT_EQ(mgr.check_order(make_order("KELP", -11), -40), RiskCheckResult::PositionLimitBreached);
    EXPECT_EQ(mgr.check_order(make_order("KELP", 10), 40), RiskCheckResult::Approved);
    EXPECT_EQ(mgr.limit_breaches(), 2u);
}

TEST_F(RiskManagerTest, PerSymbolLimit) {
    RiskManager mgr(limits_);
    EXPECT_EQ(mgr.check_order(make_order("CROISSANTS", 246), 0), RiskCheckResult::Approved);
    EXPECT_EQ(mgr.check_order(make_order("CROISSANTS", 251), 0), RiskCheckResult::PositionLimitBreached);
}

TEST_F(RiskManagerTest, ReducingBreachedPositionAllowed) {
    RiskManager mgr(limits_);
    EXPECT_EQ(mgr.check_order(make_order("KELP", -5), 60), RiskCheckResult::Approved);
    EXPECT_EQ(mgr.check_order(make_order("KELP", 1), 60), RiskCheckResult::PositionLimitBreached);
}

TEST_F(RiskManagerTest, CheckOrderIsCheapestFirst) {
    RiskManager mgr(limits_);
    // Zero quantity wins over a bad price
    EXPECT_EQ(mgr.check_order(make_order("KELP", 0, -1.0), 0), RiskCheckResult::ZeroQuantity);
}

TEST_F(RiskManagerTest, ResetCounters) {
    RiskManager mgr(limits_);
    mgr.check_order(make_order("KELP", 100), 0);
    mgr.reset_counters();
    EXPECT_EQ(mgr.checks_performed(), 0u);
    EXPECT_EQ(mgr.checks_rejected(), 0u);
    EXPECT_EQ(mgr.limit_breaches(), 0u);
}

TEST(RiskResultNameTest, Names) {
    EXPECT_STREQ(risk_result_name(RiskCheckResult::Approved), "APPROVED");
    EXPECT_STREQ(risk_result_name(RiskCheckResult::PositionLimitBreached), "POSITION_LIMIT");
}
