#include <gtest/gtest.h>
#include "strategy/position_sizing.hpp"
#include <random>

using namespace statarb;

TEST(PositionSizingTest, CapacityFormulas) {
    EXPECT_EQ(buy_capacity(0, 50), 50);
    EXPECT_EQ(buy_capacity(30, 50), 20);
    EXPECT_EQ(buy_capacity(60, 50), 0);
    EXPECT_EQ(sell_capacity(0, 50), 50);
    EXPECT_EQ(sell_capacity(-30, 50), 20);
    EXPECT_EQ(sell_capacity(-70, 50), 0);
}

TEST(PositionSizingTest, ClampNeverNegative) {
    EXPECT_EQ(clamp_order_size(10, 50, 5), 5);
    EXPECT_EQ(clamp_order_size(10, 3, 5), 3);
    EXPECT_EQ(clamp_order_size(-4, 50, 5), 0);
    EXPECT_EQ(clamp_order_size(10, 50, 0), 0);
    EXPECT_EQ(clamp_order_size(10, 50, -3), 0);
}

class OrderSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        limits_.set("RESIN", 50);
        positions_["RESIN"] = 40;
    }

    PositionLimits limits_;
    PositionMap positions_;
};

TEST_F(OrderSinkTest, BuyClampedByCapacityAndVolume) {
    OrderSink sink(positions_, limits_);
    EXPECT_EQ(sink.buy("RESIN", 9995, 100, 30), 10);
    EXPECT_EQ(sink.buy("RESIN", 9995, 100, 30), 0);   // capacity used up

    auto orders = sink.take();
    ASSERT_EQ(orders["RESIN"].size(), 1u);
    EXPECT_EQ(orders["RESIN"][0].quantity, 10);
    EXPECT_DOUBLE_EQ(orders["RESIN"][0].price, 9995);
}

TEST_F(OrderSinkTest, SellsEmitNegativeQuantity) {
    OrderSink sink(positions_, limits_);
    EXPECT_EQ(sink.sell("RESIN", 10005, 200), 90);
    auto orders = sink.take();
    EXPECT_EQ(orders["RESIN"][0].quantity, -90);
}

TEST_F(OrderSinkTest, BuysAndSellsTrackedSeparately) {
    OrderSink sink(positions_, limits_);
    sink.sell("RESIN", 10005, 20);
    // A pending sell does not free buy capacity
    EXPECT_EQ(sink.remaining_buy("RESIN"), 10);
    EXPECT_EQ(sink.remaining_sell("RESIN"), 70);
}

TEST_F(OrderSinkTest, ZeroVolumeSuppressedSilently) {
    OrderSink sink(positions_, limits_);
    EXPECT_EQ(sink.buy("RESIN", 9995, 5, 0), 0);
    EXPECT_EQ(sink.order_count(), 0u);
    EXPECT_TRUE(sink.take().empty());
}

TEST_F(OrderSinkTest, UnknownSymbolUsesDefaultLimit) {
    OrderSink sink(positions_, limits_);
    EXPECT_EQ(sink.limit("OTHER"), PositionLimits::DEFAULT_LIMIT);
    EXPECT_EQ(sink.position("OTHER"), 0);
    EXPECT_EQ(sink.buy("OTHER", 1.0, 1000), PositionLimits::DEFAULT_LIMIT);
}

TEST_F(OrderSinkTest, TakeResetsPending) {
    OrderSink sink(positions_, limits_);
    sink.buy("RESIN", 9995, 10);
    sink.take();
    EXPECT_EQ(sink.order_count(), 0u);
    EXPECT_EQ(sink.remaining_buy("RESIN"), 10);
}

TEST(OrderSinkPropertyTest, NoSubsetOfOrdersBreachesLimit) {
    std::mt19937 rng(20240419);
    std::uniform_int_distribution<Quantity> limit_dist(0, 400);
    std::uniform_int_distribution<int> op_dist(0, 1);
    std::uniform_int_distribution<Quantity> qty_dist(-20, 300);
    std::uniform_int_distribution<Volume> vol_dist(0, 200);

    for (int trial = 0; trial < 2000; ++trial) {
        Quantity limit = limit_dist(rng);
        std::uniform_int_distribution<Quantity> pos_dist(-limit, limit);
        PositionLimits limits(limit);
        PositionMap positions{{"X", pos_dist(rng)}};
        Quantity start = positions["X"];

        OrderSink sink(positions, limits);
        for (int i = 0; i < 6; ++i) {
            if (op_dist(rng) == 0) {
                sink.buy("X", 100.0, qty_dist(rng), vol_dist(rng));
            } else {
                sink.sell("X", 100.0, qty_dist(rng), vol_dist(rng));
            }
        }

        Quantity buys = 0;
        Quantity sells = 0;
        for (const auto& order : sink.take()["X"]) {
            ASSERT_NE(order.quantity, 0);
            ASSERT_LE(std::abs(start + order.quantity), limit);
            (order.quantity > 0 ? buys : sells) += order.quantity;
        }
        // Worst cases: every buy fills and no sell, or the reverse
        ASSERT_LE(start + buys, limit);
        ASSERT_GE(start + sells, -limit);
    }
}
