#include "execution/matching_engine.hpp"
#include <cstdlib>

namespace statarb {

std::optional<TradeRecord> MatchingEngine::execute(const Order& order, Price reference_price,
                                                   Quantity position_before, Day day,
                                                   Timestamp timestamp) {
    ++orders_processed_;
    if (order.quantity == 0) return std::nullopt;

    TradeRecord trade;
    trade.day = day;
    trade.timestamp = timestamp;
    trade.symbol = order.symbol;
    trade.quantity = order.quantity;
    trade.price = order.price;
    trade.market_price = reference_price;
    trade.position_after = position_before + order.quantity;

    double qty = static_cast<double>(order.quantity);
    trade.cash_flow = -order.price * qty;
    trade.realized_pnl = (reference_price - order.price) * qty;

    ++fills_;
    volume_traded_ += std::llabs(order.quantity);
    return trade;
}

void MatchingEngine::reset_counters() noexcept {
    orders_processed_ = 0;
    fills_ = 0;
    volume_traded_ = 0;
}

} // namespace statarb
