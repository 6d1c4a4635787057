#include "strategy/signal_engine.hpp"
#include "stats/rolling_stats.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace statarb {

void SignalEngine::mean_reversion(const Symbol& symbol, const BookSnapshot& book, double mean) {
    auto ask = book.best_ask();
    if (ask && *ask < mean) {
        sink_.buy(symbol, *ask, sink_.remaining_buy(symbol), book.ask_volume(*ask));
    }
    auto bid = book.best_bid();
    if (bid && *bid > mean) {
        sink_.sell(symbol, *bid, sink_.remaining_sell(symbol), book.bid_volume(*bid));
    }
}

void SignalEngine::zscore_reversion(const Symbol& symbol, const BookSnapshot& book,
                                    double z, double entry_z) {
    if (z > entry_z) {
        if (auto bid = book.best_bid()) {
            sink_.sell(symbol, *bid, sink_.remaining_sell(symbol), book.bid_volume(*bid));
        }
    } else if (z < -entry_z) {
        if (auto ask = book.best_ask()) {
            sink_.buy(symbol, *ask, sink_.remaining_buy(symbol), book.ask_volume(*ask));
        }
    }
}

void SignalEngine::crossover(const Symbol& symbol, const BookSnapshot& book,
                             double short_ma, double long_ma, double band) {
    if (short_ma > long_ma * (1.0 + band)) {
        auto ask = book.best_ask();
        if (ask && *ask < short_ma) {
            sink_.buy(symbol, *ask, sink_.remaining_buy(symbol), book.ask_volume(*ask));
        }
    } else if (short_ma < long_ma * (1.0 - band)) {
        auto bid = book.best_bid();
        if (bid && *bid > short_ma) {
            sink_.sell(symbol, *bid, sink_.remaining_sell(symbol), book.bid_volume(*bid));
        }
    }
}

void SignalEngine::market_make(const Symbol& symbol, const BookSnapshot& book,
                               double fair_value, const QuoteParams& params) {
    if (!params.enabled) return;

    Quantity limit = sink_.limit(symbol);
    double position_factor = 0.0;
    if (limit > 0) {
        position_factor = std::clamp(static_cast<double>(sink_.position(symbol)) /
                                     static_cast<double>(limit), -1.0, 1.0);
    }

    double spread = params.base_spread * (1.0 + params.widen * std::fabs(position_factor));
    double our_bid = fair_value - spread / 2.0;
    double our_ask = fair_value + spread / 2.0;

    auto buy_size = static_cast<Quantity>(std::floor(
        static_cast<double>(params.base_size) * (1.0 - params.skew * position_factor)));
    auto sell_size = static_cast<Quantity>(std::floor(
        static_cast<double>(params.base_size) * (1.0 + params.skew * position_factor)));

    auto best_bid = book.best_bid();
    auto best_ask = book.best_ask();

    bool bid_improves = !best_bid || our_bid > *best_bid;
    bool bid_crosses = best_ask && our_bid >= *best_ask;
    if (bid_improves && !bid_crosses) {
        sink_.buy(symbol, our_bid, buy_size);
    }

    bool ask_improves = !best_ask || our_ask < *best_ask;
    bool ask_crosses = best_bid && our_ask <= *best_bid;
    if (ask_improves && !ask_crosses) {
        sink_.sell(symbol, our_ask, sell_size);
    }
}

void SignalEngine::pocket_reversion(const Symbol& symbol, const BookSnapshot& book,
                                    double mid, const RegimeSignal& regime,
                                    const PocketParams& params) {
    if (!regime.in_pocket) return;

    auto size = static_cast<Quantity>(std::floor(
        regime.size_scale * static_cast<double>(params.base_size)));
    if (size <= 0) return;

    double band = params.entry_std * regime.rolling_std;
    if (mid < regime.rolling_mean - band) {
        if (auto ask = book.best_ask()) {
            sink_.buy(symbol, *ask, size, book.ask_volume(*ask));
        }
    } else if (mid > regime.rolling_mean + band) {
        if (auto bid = book.best_bid()) {
            sink_.sell(symbol, *bid, size, book.bid_volume(*bid));
        }
    }
}

void SignalEngine::flatten(const Symbol& symbol, const BookSnapshot& book, double mid) {
    Quantity position = sink_.position(symbol);
    if (position > 0) {
        Price price = book.best_bid().value_or(mid);
        sink_.sell(symbol, price, position);
    } else if (position < 0) {
        Price price = book.best_ask().value_or(mid);
        sink_.buy(symbol, price, -position);
    }
}

void update_crossover(CrossoverState& state, double mid,
                      const SignalEngine::CrossoverParams& params) {
    if (!std::isfinite(mid)) return;

    if (params.type == MaType::Simple) {
        if (state.prices.capacity() != params.long_window) {
            state.prices.set_capacity(params.long_window);
        }
        state.prices.push_back(mid);
        state.short_ma = compute_window_stats(state.prices, params.short_window).mean;
        state.long_ma = compute_window_stats(state.prices, params.long_window).mean;
    } else if (state.samples == 0) {
        state.short_ma = mid;
        state.long_ma = mid;
    } else {
        state.short_ma += params.short_alpha * (mid - state.short_ma);
        state.long_ma += params.long_alpha * (mid - state.long_ma);
    }
    ++state.samples;
}

void validate_crossover_params(const SignalEngine::CrossoverParams& params) {
    if (params.type == MaType::Simple) {
        if (params.short_window == 0) {
            throw std::invalid_argument("crossover.short_window must be >= 1");
        }
        if (params.long_window < params.short_window) {
            throw std::invalid_argument("crossover.long_window must be >= crossover.short_window");
        }
    } else {
        if (!(params.short_alpha > 0.0 && params.short_alpha < 1.0)) {
            throw std::invalid_argument("crossover.short_alpha must lie in (0, 1)");
        }
        if (!(params.long_alpha > 0.0 && params.long_alpha < 1.0)) {
            throw std::invalid_argument("crossover.long_alpha must lie in (0, 1)");
        }
    }
    if (!(params.band >= 0.0)) {
        throw std::invalid_argument("crossover.band must be non-negative");
    }
    if (!(params.fair_short_weight >= 0.0 && params.fair_short_weight <= 1.0)) {
        throw std::invalid_argument("crossover.fair_short_weight must lie in [0, 1]");
    }
}

} // namespace statarb
