#pragma once

#include "order_book/book_snapshot.hpp"
#include "stats/ewma.hpp"
#include "strategy/position_sizing.hpp"
#include "strategy/strategy_memory.hpp"
#include <map>
#include <string>
#include <vector>

namespace statarb {

/// Two-instrument spread: spread = mid(leg_a) - hedge_ratio * mid(leg_b).
/// leg_a is the higher-beta leg: it is sold when the spread is rich.
struct SpreadPairConfig {
    std::string name;
    Symbol leg_a;
    Symbol leg_b;
    double hedge_ratio = 1.0;
    EwmaEstimator::Params ewma{0.05, DispersionMode::AbsoluteDeviation, 1e-5, 1.0};
    double entry_z = 1.0;
    bool trade_leg_a = true;
    bool trade_leg_b = true;
};

struct BasketComponent {
    Symbol symbol;
    Quantity weight = 1;
};

/// Composite instrument priced against a fixed integer-weighted sum of
/// component mids.
struct BasketConfig {
    std::string name;
    Symbol basket;
    std::vector<BasketComponent> components;
    double edge = 1.0;
};

/// Correlation-gated momentum: trade `follower` in the direction implied by
/// the sign of the correlation and the leader's latest move.
struct CorrelationConfig {
    std::string name;
    Symbol leader;
    Symbol follower;
    size_t window = 20;
    size_t short_window = 5;
    size_t min_samples = 5;
    double threshold = 0.3;
    double scale_factor = 0.75;
};

struct SpreadSignal {
    double spread = 0.0;
    double z_score = 0.0;
};

struct BasketSignal {
    double fair_value = 0.0;
    double premium = 0.0;
    Quantity quantity = 0;   // signed basket quantity emitted (+ buy basket)
};

struct CorrelationSignal {
    double correlation = 0.0;
    double recent_mean = 0.0;   // mean of the recent correlation history
    bool active = false;
};

/// PairArbitrageEngine: cross-instrument rules. Legs are independent orders;
/// nothing ties their fills together.
class PairArbitrageEngine {
public:
    using Mids = std::map<Symbol, double>;

    PairArbitrageEngine(OrderSink& sink, const OrderDepths& depths, const Mids& mids)
        : sink_(sink), depths_(depths), mids_(mids) {}

    /// Updates the spread statistics and trades both legs on a z-score
    /// breakout. No-op (no state update) when either leg has no mid.
    SpreadSignal trade_spread(const SpreadPairConfig& config, SpreadState& state);

    /// Basket quantity feasible in `direction` (Buy = buy basket, sell
    /// components) without any leg breaching its limit:
    ///   min(basket capacity, floor(component capacity / weight) ...)
    Quantity max_basket_quantity(const BasketConfig& config, Side direction) const noexcept;

    BasketSignal trade_basket(const BasketConfig& config);

    CorrelationSignal trade_correlation(const CorrelationConfig& config, CorrelationState& state);

private:
    const BookSnapshot* book(const Symbol& symbol) const noexcept;
    const double* mid(const Symbol& symbol) const noexcept;

    /// Touch price on the side an order of `side` would lift (ask for buys,
    /// bid for sells), falling back to mid.
    Price touch_or_mid(const Symbol& symbol, Side side) const noexcept;
    Volume touch_volume(const Symbol& symbol, Side side) const noexcept;

    Quantity emit(const Symbol& symbol, Side side, Quantity requested, Volume available);

    OrderSink& sink_;
    const OrderDepths& depths_;
    const Mids& mids_;
};

} // namespace statarb
