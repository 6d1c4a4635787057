#include <gtest/gtest.h>
#include "order_book/book_snapshot.hpp"
#include <cmath>
#include <limits>
#include <random>

using namespace statarb;

class BookSnapshotTest : public ::testing::Test {
protected:
    BookSnapshot book_;
};

TEST_F(BookSnapshotTest, EmptyBook) {
    EXPECT_TRUE(book_.empty());
    EXPECT_FALSE(book_.best_bid().has_value());
    EXPECT_FALSE(book_.best_ask().has_value());
    EXPECT_FALSE(book_.mid_price().has_value());
}

TEST_F(BookSnapshotTest, BestQuotesAreExtremes) {
    book_.add_bid(9998, 5);
    book_.add_bid(9996, 10);
    book_.add_ask(10002, 5);
    book_.add_ask(10005, 7);

    EXPECT_DOUBLE_EQ(*book_.best_bid(), 9998);
    EXPECT_DOUBLE_EQ(*book_.best_ask(), 10002);
    EXPECT_DOUBLE_EQ(*book_.mid_price(), 10000);
}

TEST_F(BookSnapshotTest, VolumesStoredAsMagnitudes) {
    book_.add_ask(10002, -5);
    EXPECT_EQ(book_.ask_volume(10002), 5);
    EXPECT_EQ(book_.ask_volume(10003), 0);
}

TEST_F(BookSnapshotTest, ZeroVolumeAndNonFinitePriceIgnored) {
    book_.add_bid(9998, 0);
    book_.add_ask(std::numeric_limits<double>::quiet_NaN(), 3);
    book_.add_ask(std::numeric_limits<double>::infinity(), 3);
    book_.add_bid(9998, std::numeric_limits<Volume>::min());
    EXPECT_TRUE(book_.empty());
}

TEST_F(BookSnapshotTest, RepeatedLevelAccumulates) {
    book_.add_bid(100, 2);
    book_.add_bid(100, 3);
    EXPECT_EQ(book_.bid_volume(100), 5);
    EXPECT_EQ(book_.bids().size(), 1u);
}

TEST_F(BookSnapshotTest, AskOnlyFallbackBelowAsk) {
    book_.add_ask(1000, 4);
    EXPECT_DOUBLE_EQ(*book_.mid_price(), 990.0);
    EXPECT_LT(*book_.mid_price(), *book_.best_ask());
}

TEST_F(BookSnapshotTest, BidOnlyFallbackAboveBid) {
    book_.add_bid(1000, 4);
    EXPECT_DOUBLE_EQ(*book_.mid_price(), 1010.0);
    EXPECT_GT(*book_.mid_price(), *book_.best_bid());
}

TEST(MidPriceTest, AlwaysWithinTouchAndIdempotent) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> base(1.0, 20000.0);
    std::uniform_real_distribution<double> width(0.0, 50.0);

    for (int i = 0; i < 1000; ++i) {
        BookSnapshot book;
        double bid = std::floor(base(rng));
        double ask = bid + std::floor(width(rng));
        book.add_bid(bid, 1);
        book.add_ask(ask, 1);

        auto first = book.mid_price();
        auto second = book.mid_price();
        ASSERT_TRUE(first.has_value());
        EXPECT_EQ(*first, *second);
        EXPECT_GE(*first, bid);
        EXPECT_LE(*first, ask);
    }
}

TEST(MidPriceTest, FreeFunctionMatchesRule) {
    EXPECT_FALSE(mid_price(std::nullopt, std::nullopt).has_value());
    EXPECT_DOUBLE_EQ(*mid_price(10.0, 12.0), 11.0);
    EXPECT_DOUBLE_EQ(*mid_price(std::nullopt, 100.0), 99.0);
    EXPECT_DOUBLE_EQ(*mid_price(100.0, std::nullopt), 101.0);
}
