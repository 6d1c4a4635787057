#pragma once

#include "common/types.hpp"
#include "risk/ledger.hpp"
#include <cstddef>
#include <vector>

namespace statarb {

struct PnlPoint;

/// Per-product trade statistics. pnl_std is the sample standard deviation
/// (0 with fewer than two trades).
struct ProductStats {
    Symbol symbol;
    size_t trades = 0;
    Quantity net_quantity = 0;
    Quantity volume = 0;
    double cash_flow = 0.0;
    double pnl_sum = 0.0;
    double pnl_mean = 0.0;
    double pnl_std = 0.0;
};

struct PositionLine {
    Symbol symbol;
    Quantity position = 0;
    Price mark = 0.0;
    double value = 0.0;
};

struct PerformanceReport {
    size_t total_trades = 0;
    size_t profitable_trades = 0;
    size_t losing_trades = 0;
    size_t break_even_trades = 0;

    double final_portfolio_value = 0.0;
    double cash = 0.0;
    double realized_pnl = 0.0;
    double unrealized_pnl = 0.0;

    // From the per-tick history, when one is supplied
    double peak_portfolio_value = 0.0;
    double max_drawdown = 0.0;

    std::vector<PositionLine> positions;
    std::vector<ProductStats> products;    // sorted by symbol
};

PerformanceReport analyze_performance(const std::vector<TradeRecord>& trades,
                                      const Ledger& ledger);

PerformanceReport analyze_performance(const std::vector<TradeRecord>& trades,
                                      const Ledger& ledger,
                                      const std::vector<PnlPoint>& history);

/// Human-readable report on stdout.
void print_report(const PerformanceReport& report);

} // namespace statarb
