#include "strategy/pair_arbitrage.hpp"
#include "stats/rolling_stats.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cmath>

namespace statarb {

const BookSnapshot* PairArbitrageEngine::book(const Symbol& symbol) const noexcept {
    auto it = depths_.find(symbol);
    return it != depths_.end() ? &it->second : nullptr;
}

const double* PairArbitrageEngine::mid(const Symbol& symbol) const noexcept {
    auto it = mids_.find(symbol);
    return it != mids_.end() ? &it->second : nullptr;
}

Price PairArbitrageEngine::touch_or_mid(const Symbol& symbol, Side side) const noexcept {
    const BookSnapshot* b = book(symbol);
    if (b != nullptr) {
        auto touch = side == Side::Buy ? b->best_ask() : b->best_bid();
        if (touch) return *touch;
    }
    const double* m = mid(symbol);
    return m != nullptr ? *m : 0.0;
}

Volume PairArbitrageEngine::touch_volume(const Symbol& symbol, Side side) const noexcept {
    const BookSnapshot* b = book(symbol);
    if (b == nullptr) return UNLIMITED_VOLUME;
    if (side == Side::Buy) {
        auto ask = b->best_ask();
        return ask ? b->ask_volume(*ask) : UNLIMITED_VOLUME;
    }
    auto bid = b->best_bid();
    return bid ? b->bid_volume(*bid) : UNLIMITED_VOLUME;
}

Quantity PairArbitrageEngine::emit(const Symbol& symbol, Side side, Quantity requested,
                                   Volume available) {
    Price price = touch_or_mid(symbol, side);
    return side == Side::Buy ? sink_.buy(symbol, price, requested, available)
                             : sink_.sell(symbol, price, requested, available);
}

// ---------------------------------------------------------------------------
// Spread pair
// ---------------------------------------------------------------------------

SpreadSignal PairArbitrageEngine::trade_spread(const SpreadPairConfig& config, SpreadState& state) {
    SpreadSignal signal;
    const double* mid_a = mid(config.leg_a);
    const double* mid_b = mid(config.leg_b);
    if (mid_a == nullptr || mid_b == nullptr) return signal;

    EwmaEstimator estimator(config.ewma);
    signal.spread = *mid_a - config.hedge_ratio * *mid_b;
    estimator.update(state.ewma, signal.spread);
    signal.z_score = estimator.z_score(state.ewma, signal.spread);

    const BookSnapshot* book_a = book(config.leg_a);
    const BookSnapshot* book_b = book(config.leg_b);

    auto trade_leg = [&](const Symbol& symbol, const BookSnapshot* b, Side side) {
        if (b == nullptr) return;
        if (side == Side::Sell) {
            if (auto bid = b->best_bid()) {
                sink_.sell(symbol, *bid, sink_.remaining_sell(symbol), b->bid_volume(*bid));
            }
        } else if (auto ask = b->best_ask()) {
            sink_.buy(symbol, *ask, sink_.remaining_buy(symbol), b->ask_volume(*ask));
        }
    };

    Side side_a;
    if (signal.z_score > config.entry_z) {
        side_a = Side::Sell;   // spread rich: short the high-beta leg
    } else if (signal.z_score < -config.entry_z) {
        side_a = Side::Buy;
    } else {
        return signal;
    }

    LOG_DEBUG("pair %s: spread=%.4f z=%.3f -> %s %s", config.name.c_str(), signal.spread,
              signal.z_score, side_name(side_a), config.leg_a.c_str());
    if (config.trade_leg_a) trade_leg(config.leg_a, book_a, side_a);
    if (config.trade_leg_b) trade_leg(config.leg_b, book_b, opposite_side(side_a));
    return signal;
}

// ---------------------------------------------------------------------------
// Basket
// ---------------------------------------------------------------------------

Quantity PairArbitrageEngine::max_basket_quantity(const BasketConfig& config,
                                                  Side direction) const noexcept {
    Quantity qty = direction == Side::Buy ? sink_.remaining_buy(config.basket)
                                          : sink_.remaining_sell(config.basket);
    for (const auto& component : config.components) {
        if (component.weight <= 0) return 0;
        // Components move opposite to the basket
        Quantity capacity = direction == Side::Buy ? sink_.remaining_sell(component.symbol)
                                                   : sink_.remaining_buy(component.symbol);
        qty = std::min(qty, capacity / component.weight);
    }
    return std::max<Quantity>(qty, 0);
}

BasketSignal PairArbitrageEngine::trade_basket(const BasketConfig& config) {
    BasketSignal signal;
    const double* basket_mid = mid(config.basket);
    if (basket_mid == nullptr) return signal;

    double fair = 0.0;
    for (const auto& component : config.components) {
        const double* m = mid(component.symbol);
        if (m == nullptr) return signal;
        fair += static_cast<double>(component.weight) * *m;
    }
    signal.fair_value = fair;
    signal.premium = *basket_mid - fair;

    Side basket_side;
    if (signal.premium > config.edge) {
        basket_side = Side::Sell;
    } else if (signal.premium < -config.edge) {
        basket_side = Side::Buy;
    } else {
        return signal;
    }
    Side component_side = opposite_side(basket_side);

    Quantity qty = max_basket_quantity(config, basket_side);
    Volume basket_volume = touch_volume(config.basket, basket_side);
    qty = std::min<Quantity>(qty, basket_volume);
    for (const auto& component : config.components) {
        Volume available = touch_volume(component.symbol, component_side);
        if (available != UNLIMITED_VOLUME) {
            qty = std::min<Quantity>(qty, available / component.weight);
        }
    }
    if (qty <= 0) return signal;

    Quantity filled = emit(config.basket, basket_side, qty, basket_volume);
    for (const auto& component : config.components) {
        emit(component.symbol, component_side, filled * component.weight,
             touch_volume(component.symbol, component_side));
    }
    signal.quantity = basket_side == Side::Buy ? filled : -filled;

    LOG_DEBUG("basket %s: premium=%.2f %s %lld", config.name.c_str(), signal.premium,
              side_name(basket_side), static_cast<long long>(filled));
    return signal;
}

// ---------------------------------------------------------------------------
// Correlation momentum
// ---------------------------------------------------------------------------

CorrelationSignal PairArbitrageEngine::trade_correlation(const CorrelationConfig& config,
                                                         CorrelationState& state) {
    CorrelationSignal signal;
    const double* leader_mid = mid(config.leader);
    const double* follower_mid = mid(config.follower);
    if (leader_mid == nullptr || follower_mid == nullptr) return signal;

    if (state.leader.capacity() != config.window) state.leader.set_capacity(config.window);
    if (state.follower.capacity() != config.window) state.follower.set_capacity(config.window);
    if (state.correlation_history.capacity() != config.short_window) {
        state.correlation_history.set_capacity(config.short_window);
    }
    state.leader.push_back(*leader_mid);
    state.follower.push_back(*follower_mid);

    if (state.leader.size() < config.min_samples || state.follower.size() < config.min_samples) {
        return signal;
    }

    signal.correlation = pearson_correlation(state.leader, state.follower, config.window);
    state.correlation_history.push_back(signal.correlation);
    signal.recent_mean = compute_window_stats(state.correlation_history,
                                              config.short_window).mean;

    if (std::fabs(signal.correlation) <= config.threshold || state.leader.size() < 2) {
        return signal;
    }
    signal.active = true;

    double leader_move = state.leader.back() - state.leader.from_back(1);
    if (leader_move == 0.0) return signal;

    Quantity limit = sink_.limit(config.follower);
    auto budget = static_cast<Quantity>(std::floor(
        static_cast<double>(limit) * std::min(1.0, std::fabs(signal.correlation)) *
        config.scale_factor));

    bool go_long = (signal.correlation > 0.0) == (leader_move > 0.0);
    const BookSnapshot* b = book(config.follower);
    if (b == nullptr) return signal;

    Quantity position = sink_.position(config.follower);
    if (go_long) {
        if (auto ask = b->best_ask()) {
            sink_.buy(config.follower, *ask, budget - position, b->ask_volume(*ask));
        }
    } else if (auto bid = b->best_bid()) {
        sink_.sell(config.follower, *bid, budget + position, b->bid_volume(*bid));
    }

    LOG_DEBUG("corr %s: r=%.3f recent=%.3f leader_move=%.2f -> %s", config.name.c_str(),
              signal.correlation, signal.recent_mean, leader_move, go_long ? "long" : "short");
    return signal;
}

} // namespace statarb
