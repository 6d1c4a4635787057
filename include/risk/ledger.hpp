#pragma once

#include "common/types.hpp"
#include <cstdint>
#include <optional>

namespace statarb {

/// Account state for a replay: positions, cash and the latest mark per symbol.
/// A fill moves position and cash together; realized PnL is booked by the
/// caller per trade (see MatchingEngine), so the ledger only accumulates it.
class Ledger {
public:
    using MarkMap = std::map<Symbol, Price>;

    Ledger() = default;

    /// Apply an executed fill: position += quantity, cash += cash_flow.
    void apply_fill(const TradeRecord& trade);

    /// Update mark-to-market price
    void update_mark_price(const Symbol& symbol, Price price);
    std::optional<Price> mark_price(const Symbol& symbol) const noexcept;

    /// Start tracking a symbol at position 0 (so it appears in positions()).
    void track(const Symbol& symbol);

    Quantity position(const Symbol& symbol) const noexcept;
    const PositionMap& positions() const noexcept { return positions_; }
    const MarkMap& marks() const noexcept { return marks_; }
    int64_t total_absolute_position() const noexcept;

    double cash() const noexcept { return cash_; }

    /// Σ position · mark over symbols with a known mark.
    double mark_to_market() const noexcept;
    double portfolio_value() const noexcept { return cash_ + mark_to_market(); }

    double realized_pnl() const noexcept { return realized_pnl_; }
    double realized_pnl(const Symbol& symbol) const noexcept;
    /// Mark-to-market of open positions (cash excluded) less realized PnL.
    double unrealized_pnl() const noexcept { return mark_to_market() - realized_pnl_; }

    void reset() noexcept;

private:
    PositionMap positions_;
    MarkMap marks_;
    std::map<Symbol, double> symbol_pnl_;
    double cash_ = 0.0;
    double realized_pnl_ = 0.0;
};

} // namespace statarb
