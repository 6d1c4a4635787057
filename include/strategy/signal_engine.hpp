#pragma once

#include "order_book/book_snapshot.hpp"
#include "stats/regime_detector.hpp"
#include "strategy/position_sizing.hpp"
#include "strategy/strategy_memory.hpp"

namespace statarb {

enum class MaType : uint8_t {
    Simple = 0,
    Exponential = 1
};

/// SignalEngine: single-instrument trading rules. Each rule reads estimator
/// output and the book, and emits through the OrderSink, which bounds every
/// order by the remaining capacity. Rules that find nothing to do are no-ops.
class SignalEngine {
public:
    struct CrossoverParams {
        MaType type = MaType::Exponential;
        size_t short_window = 10;     // Simple
        size_t long_window = 50;      // Simple
        double short_alpha = 0.3;     // Exponential
        double long_alpha = 0.1;      // Exponential
        double band = 0.0;            // relative threshold between the averages
        double fair_short_weight = 0.7;   // fair value for quoting
    };

    struct QuoteParams {
        bool enabled = false;
        double base_spread = 1.0;
        Quantity base_size = 10;
        double skew = 0.5;    // size skew per unit of position factor
        double widen = 0.5;   // spread widening per unit of |position factor|
    };

    struct PocketParams {
        Quantity base_size = 10;
        double entry_std = 0.5;   // entry band in rolling std units
    };

    explicit SignalEngine(OrderSink& sink) : sink_(sink) {}

    /// Buy at best ask when it is below `mean`, sell at best bid when it is
    /// above `mean`; each side sized to capacity and touch volume.
    void mean_reversion(const Symbol& symbol, const BookSnapshot& book, double mean);

    /// Sell at best bid when z > entry_z, buy at best ask when z < -entry_z.
    void zscore_reversion(const Symbol& symbol, const BookSnapshot& book,
                          double z, double entry_z);

    /// Trend following on two moving averages.
    void crossover(const Symbol& symbol, const BookSnapshot& book,
                   double short_ma, double long_ma, double band);

    /// Passive two-sided quote around `fair_value`, widened and skewed by
    /// inventory. A side is quoted only when it improves that side's best
    /// price without crossing the opposite best.
    void market_make(const Symbol& symbol, const BookSnapshot& book,
                     double fair_value, const QuoteParams& params);

    /// Range trading inside a stable pocket, sized down by transition risk.
    void pocket_reversion(const Symbol& symbol, const BookSnapshot& book,
                          double mid, const RegimeSignal& regime,
                          const PocketParams& params);

    /// Single order offsetting the whole position at the touch (mid when the
    /// needed side of the book is empty).
    void flatten(const Symbol& symbol, const BookSnapshot& book, double mid);

private:
    OrderSink& sink_;
};

/// Fold `mid` into the dual moving averages. The first sample seeds both.
void update_crossover(CrossoverState& state, double mid,
                      const SignalEngine::CrossoverParams& params);

/// Throws std::invalid_argument on inconsistent windows or alphas.
void validate_crossover_params(const SignalEngine::CrossoverParams& params);

} // namespace statarb
