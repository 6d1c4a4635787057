#include "strategy/position_sizing.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cmath>

namespace statarb {

Quantity buy_capacity(Quantity position, Quantity limit) noexcept {
    return std::max<Quantity>(0, limit - position);
}

Quantity sell_capacity(Quantity position, Quantity limit) noexcept {
    return std::max<Quantity>(0, limit + position);
}

Quantity clamp_order_size(Quantity requested, Quantity capacity, Volume counterparty) noexcept {
    return std::max<Quantity>(0, std::min({requested, capacity, counterparty}));
}

OrderSink::OrderSink(const PositionMap& positions, const PositionLimits& limits)
    : positions_(positions), limits_(limits) {}

Quantity OrderSink::position(const Symbol& symbol) const noexcept {
    auto it = positions_.find(symbol);
    return it != positions_.end() ? it->second : 0;
}

Quantity OrderSink::limit(const Symbol& symbol) const noexcept {
    return limits_.limit_for(symbol);
}

Quantity OrderSink::remaining_buy(const Symbol& symbol) const noexcept {
    auto it = pending_.find(symbol);
    Quantity pending = it != pending_.end() ? it->second.buys : 0;
    return buy_capacity(position(symbol) + pending, limit(symbol));
}

Quantity OrderSink::remaining_sell(const Symbol& symbol) const noexcept {
    auto it = pending_.find(symbol);
    Quantity pending = it != pending_.end() ? it->second.sells : 0;
    return sell_capacity(position(symbol) - pending, limit(symbol));
}

Quantity OrderSink::buy(const Symbol& symbol, Price price, Quantity requested, Volume available) {
    if (!std::isfinite(price)) return 0;
    Quantity qty = clamp_order_size(requested, remaining_buy(symbol), available);
    if (qty <= 0) return 0;

    pending_[symbol].buys += qty;
    orders_[symbol].push_back(Order{symbol, price, qty});
    ++order_count_;
    LOG_DEBUG("order BUY %s %lld @ %.2f", symbol.c_str(), static_cast<long long>(qty), price);
    return qty;
}

Quantity OrderSink::sell(const Symbol& symbol, Price price, Quantity requested, Volume available) {
    if (!std::isfinite(price)) return 0;
    Quantity qty = clamp_order_size(requested, remaining_sell(symbol), available);
    if (qty <= 0) return 0;

    pending_[symbol].sells += qty;
    orders_[symbol].push_back(Order{symbol, price, -qty});
    ++order_count_;
    LOG_DEBUG("order SELL %s %lld @ %.2f", symbol.c_str(), static_cast<long long>(qty), price);
    return qty;
}

OrderMap OrderSink::take() {
    OrderMap out;
    out.swap(orders_);
    pending_.clear();
    order_count_ = 0;
    return out;
}

} // namespace statarb
