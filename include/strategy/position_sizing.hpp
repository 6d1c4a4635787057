#pragma once

#include "common/types.hpp"
#include "risk/position_limits.hpp"
#include <map>

namespace statarb {

/// Room left to buy before hitting +limit: max(0, limit - position).
Quantity buy_capacity(Quantity position, Quantity limit) noexcept;

/// Room left to sell before hitting -limit: max(0, limit + position).
Quantity sell_capacity(Quantity position, Quantity limit) noexcept;

/// max(0, min(requested, capacity, counterparty_volume))
Quantity clamp_order_size(Quantity requested, Quantity capacity, Volume counterparty) noexcept;

/// OrderSink: collects one tick's orders and is the only path strategies
/// use to emit them. Pending buys and sells are tracked per symbol so that
/// every rule together still satisfies
///   position + pending_buys  <= limit
///   position - pending_sells >= -limit
/// whatever subset of the orders ends up filling. Sizes that clamp to zero
/// are dropped silently.
class OrderSink {
public:
    OrderSink(const PositionMap& positions, const PositionLimits& limits);

    /// Returns the quantity actually emitted (0 when suppressed).
    Quantity buy(const Symbol& symbol, Price price, Quantity requested,
                 Volume available = UNLIMITED_VOLUME);
    Quantity sell(const Symbol& symbol, Price price, Quantity requested,
                  Volume available = UNLIMITED_VOLUME);

    Quantity position(const Symbol& symbol) const noexcept;
    Quantity limit(const Symbol& symbol) const noexcept;
    Quantity remaining_buy(const Symbol& symbol) const noexcept;
    Quantity remaining_sell(const Symbol& symbol) const noexcept;

    size_t order_count() const noexcept { return order_count_; }

    /// Move the collected orders out. The sink is empty afterwards.
    OrderMap take();

private:
    struct Pending {
        Quantity buys = 0;
        Quantity sells = 0;
    };

    const PositionMap& positions_;
    const PositionLimits& limits_;
    std::map<Symbol, Pending> pending_;
    OrderMap orders_;
    size_t order_count_ = 0;
};

} // namespace statarb
