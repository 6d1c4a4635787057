#pragma once

#include "common/types.hpp"
#include "execution/matching_engine.hpp"
#include "market_data/historical_feed.hpp"
#include "monitoring/metrics_collector.hpp"
#include "risk/ledger.hpp"
#include "risk/position_limits.hpp"
#include "risk/risk_manager.hpp"
#include "strategy/strategy_interface.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace statarb {

/// Account snapshot taken after each processed tick.
struct PnlPoint {
    Day day = 0;
    Timestamp timestamp = 0;
    double round_pnl = 0.0;             // Σ realized PnL of this tick's fills
    double cumulative_realized = 0.0;
    double cash = 0.0;
    double portfolio_value = 0.0;       // cash + Σ position · mark
};

/// Deterministic single-threaded replay of recorded ticks through a strategy.
///
/// Per tick group:
///   build snapshots + marks -> copy positions -> strategy.run()
///   -> normalize state string -> per order: reference price, risk check,
///      fill, ledger update -> PnlPoint
///
/// Orders are processed in symbol order, then in the order the strategy
/// returned them. A strategy exception skips the tick: no fills, no PnlPoint,
/// the state string from the previous tick is kept.
class ReplaySimulator {
public:
    struct Params {
        size_t depth_levels = MAX_BOOK_DEPTH;
        bool enforce_position_limits = false;   // false: audit and warn only
    };

    ReplaySimulator(StrategyInterface& strategy, const PositionLimits& limits);
    ReplaySimulator(StrategyInterface& strategy, const PositionLimits& limits, Params params);

    void run(const HistoricalFeed& feed);
    void run(const std::vector<TickGroup>& ticks);

    /// Process one tick group. Returns false if the tick was skipped.
    bool run_tick(const TickGroup& tick);

    const Ledger& ledger() const noexcept { return ledger_; }
    const std::vector<TradeRecord>& trades() const noexcept { return trades_; }
    const std::vector<PnlPoint>& pnl_history() const noexcept { return pnl_history_; }
    const std::string& trader_data() const noexcept { return trader_data_; }
    const MetricsCollector& metrics() const noexcept { return metrics_; }
    const RiskManager& risk_manager() const noexcept { return risk_; }
    const MatchingEngine& matching_engine() const noexcept { return matching_; }
    const Params& params() const noexcept { return params_; }

    /// CSV, one line per fill in execution order. Output depends only on the
    /// trades, so identical runs produce identical files.
    void write_trade_log(std::ostream& out) const;

    /// Throws std::runtime_error if the file cannot be written.
    void write_trade_log(const std::string& path) const;

    /// Clear all run state (ledger, trades, state string, counters).
    void reset();

private:
    void process_order(const Symbol& symbol, const Order& order, const TickGroup& tick,
                       const std::map<Symbol, Price>& references, double& round_pnl);

    StrategyInterface& strategy_;
    Params params_;
    RiskManager risk_;
    MatchingEngine matching_;
    Ledger ledger_;
    MetricsCollector metrics_;

    std::vector<TradeRecord> trades_;
    std::vector<PnlPoint> pnl_history_;
    std::string trader_data_;
};

/// The state string handed to the next tick: `data` when it is valid JSON,
/// "{}" otherwise (including the empty string).
std::string normalize_trader_data(const std::string& data);

} // namespace statarb
