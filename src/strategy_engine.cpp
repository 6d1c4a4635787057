#include "strategy/strategy_engine.hpp"
#include "strategy/signal_engine.hpp"
#include "stats/regime_detector.hpp"
#include "common/logger.hpp"
#include <utility>

namespace statarb {

StrategyEngine::StrategyEngine(StrategyConfig config) : config_(std::move(config)) {
    validate_strategy_config(config_);
}

TickResult StrategyEngine::run(const TradingState& state) {
    StrategyMemory memory = StrategyMemory::deserialize(state.trader_data);

    // Instruments with no liquidity on either side have no mid and are skipped.
    PairArbitrageEngine::Mids mids;
    for (const auto& [symbol, book] : state.order_depths) {
        if (auto mid = book.mid_price()) {
            mids.emplace(symbol, *mid);
        }
    }

    OrderSink sink(state.position, config_.limits);

    for (const auto& inst : config_.instruments) {
        auto book_it = state.order_depths.find(inst.symbol);
        auto mid_it = mids.find(inst.symbol);
        if (book_it == state.order_depths.end() || mid_it == mids.end()) continue;
        run_instrument(inst, book_it->second, mid_it->second, memory, sink);
    }

    PairArbitrageEngine arbitrage(sink, state.order_depths, mids);

    for (const auto& pair : config_.pairs) {
        if (mids.count(pair.leg_a) == 0 || mids.count(pair.leg_b) == 0) continue;
        auto& spread = memory.get_or_reset<SpreadState>(pair_memory_key(pair.name));
        arbitrage.trade_spread(pair, spread);
    }

    for (const auto& basket : config_.baskets) {
        arbitrage.trade_basket(basket);
    }

    for (const auto& corr : config_.correlations) {
        if (mids.count(corr.leader) == 0 || mids.count(corr.follower) == 0) continue;
        auto& history = memory.get_or_reset<CorrelationState>(correlation_memory_key(corr.name));
        arbitrage.trade_correlation(corr, history);
    }

    TickResult result;
    result.orders = sink.take();
    result.conversions = config_.conversions;
    result.trader_data = memory.serialize();
    return result;
}

void StrategyEngine::run_instrument(const InstrumentConfig& inst, const BookSnapshot& book,
                                    double mid, StrategyMemory& memory, OrderSink& sink) {
    SignalEngine signals(sink);

    switch (inst.kind) {
        case StrategyKind::MeanReversion: {
            auto& state = memory.get_or_reset<MeanReversionState>(inst.symbol);
            EwmaEstimator estimator(inst.ewma);
            // Trade against the mean as it stood before this tick
            double prior = state.ewma.samples > 0 ? state.ewma.mean : mid;
            signals.mean_reversion(inst.symbol, book, prior);
            signals.market_make(inst.symbol, book, prior, inst.quoting);
            estimator.update(state.ewma, mid);
            LOG_DEBUG("%s mean_reversion mid=%.2f mean=%.4f", inst.symbol.c_str(), mid, prior);
            break;
        }
        case StrategyKind::ZScoreReversion: {
            auto& state = memory.get_or_reset<MeanReversionState>(inst.symbol);
            EwmaEstimator estimator(inst.ewma);
            estimator.update(state.ewma, mid);
            double z = estimator.z_score(state.ewma, mid);
            signals.zscore_reversion(inst.symbol, book, z, inst.entry_z);
            signals.market_make(inst.symbol, book, state.ewma.mean, inst.quoting);
            LOG_DEBUG("%s zscore mid=%.2f z=%.3f", inst.symbol.c_str(), mid, z);
            break;
        }
        case StrategyKind::Crossover: {
            auto& state = memory.get_or_reset<CrossoverState>(inst.symbol);
            update_crossover(state, mid, inst.crossover);
            signals.crossover(inst.symbol, book, state.short_ma, state.long_ma, inst.crossover.band);
            double w = inst.crossover.fair_short_weight;
            signals.market_make(inst.symbol, book, w * state.short_ma + (1.0 - w) * state.long_ma,
                                inst.quoting);
            LOG_DEBUG("%s crossover short=%.3f long=%.3f", inst.symbol.c_str(),
                      state.short_ma, state.long_ma);
            break;
        }
        case StrategyKind::PocketRegime: {
            auto& state = memory.get_or_reset<PocketState>(inst.symbol);
            RegimeDetector detector(inst.regime);
            RegimeSignal regime = detector.update(state, mid);
            if (regime.in_pocket) {
                signals.pocket_reversion(inst.symbol, book, mid, regime, inst.pocket);
            } else {
                signals.flatten(inst.symbol, book, mid);
            }
            LOG_DEBUG("%s pocket in=%d age=%u risk=%.4f", inst.symbol.c_str(),
                      regime.in_pocket ? 1 : 0, regime.pocket_age, regime.transition_risk);
            break;
        }
    }
}

} // namespace statarb
