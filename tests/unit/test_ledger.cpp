#include <gtest/gtest.h>
#include "risk/ledger.hpp"

using namespace statarb;

namespace {

TradeRecord fill(const Symbol& symbol, Quantity qty, Price price, Price market) {
    TradeRecord t;
    t.symbol = symbol;
    t.quantity = qty;
    t.price = price;
    t.market_price = market;
    t.cash_flow = -price * static_cast<double>(qty);
    t.realized_pnl = (market - price) * static_cast<double>(qty);
    return t;
}

} // namespace

TEST(LedgerTest, InitialState) {
    Ledger ledger;
    EXPECT_EQ(ledger.position("KELP"), 0);
    EXPECT_DOUBLE_EQ(ledger.cash(), 0.0);
    EXPECT_DOUBLE_EQ(ledger.portfolio_value(), 0.0);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), 0.0);
    EXPECT_FALSE(ledger.mark_price("KELP").has_value());
}

TEST(LedgerTest, FillMovesPositionAndCashTogether) {
    Ledger ledger;
    ledger.apply_fill(fill("KELP", 10, 2000, 2001));
    EXPECT_EQ(ledger.position("KELP"), 10);
    EXPECT_DOUBLE_EQ(ledger.cash(), -20000.0);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), 10.0);

    ledger.apply_fill(fill("KELP", -4, 2003, 2002));
    EXPECT_EQ(ledger.position("KELP"), 6);
    EXPECT_DOUBLE_EQ(ledger.cash(), -20000.0 + 8012.0);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), 10.0 + 4.0);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl("KELP"), 14.0);
}

TEST(LedgerTest, PortfolioValueUsesMarks) {
    Ledger ledger;
    ledger.apply_fill(fill("KELP", 10, 2000, 2000));
    ledger.apply_fill(fill("JAMS", -5, 6600, 6600));
    ledger.update_mark_price("KELP", 2010);
    ledger.update_mark_price("JAMS", 6590);

    EXPECT_DOUBLE_EQ(ledger.mark_to_market(), 10 * 2010.0 - 5 * 6590.0);
    EXPECT_DOUBLE_EQ(ledger.portfolio_value(), ledger.cash() + ledger.mark_to_market());
    // 10 * (2010 - 2000) + 5 * (6600 - 6590)
    EXPECT_DOUBLE_EQ(ledger.portfolio_value(), 150.0);
    EXPECT_DOUBLE_EQ(ledger.unrealized_pnl(), ledger.mark_to_market() - ledger.realized_pnl());
}

TEST(LedgerTest, UnrealizedExcludesCash) {
    Ledger ledger;
    ledger.apply_fill(fill("KELP", 1, 99, 100));
    ledger.update_mark_price("KELP", 100);

    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), 1.0);
    EXPECT_DOUBLE_EQ(ledger.cash(), -99.0);
    EXPECT_DOUBLE_EQ(ledger.portfolio_value(), 1.0);
    EXPECT_DOUBLE_EQ(ledger.unrealized_pnl(), 99.0);
}

TEST(LedgerTest, PositionWithoutMarkContributesNothing) {
    Ledger ledger;
    ledger.apply_fill(fill("KELP", 3, 100, 100));
    EXPECT_DOUBLE_EQ(ledger.mark_to_market(), 0.0);
}

TEST(LedgerTest, TrackAddsFlatSymbol) {
    Ledger ledger;
    ledger.track("SQUID_INK");
    ASSERT_EQ(ledger.positions().count("SQUID_INK"), 1u);
    EXPECT_EQ(ledger.positions().at("SQUID_INK"), 0);

    ledger.apply_fill(fill("SQUID_INK", -2, 1970, 1970));
    ledger.track("SQUID_INK");
    EXPECT_EQ(ledger.position("SQUID_INK"), -2);
}

TEST(LedgerTest, TotalAbsolutePosition) {
    Ledger ledger;
    ledger.apply_fill(fill("A", 10, 1, 1));
    ledger.apply_fill(fill("B", -7, 1, 1));
    EXPECT_EQ(ledger.total_absolute_position(), 17);
}

TEST(LedgerTest, Reset) {
    Ledger ledger;
    ledger.apply_fill(fill("A", 10, 5, 6));
    ledger.update_mark_price("A", 6);
    ledger.reset();
    EXPECT_EQ(ledger.position("A"), 0);
    EXPECT_DOUBLE_EQ(ledger.cash(), 0.0);
    EXPECT_DOUBLE_EQ(ledger.realized_pnl(), 0.0);
    EXPECT_TRUE(ledger.positions().empty());
    EXPECT_FALSE(ledger.mark_price("A").has_value());
}
