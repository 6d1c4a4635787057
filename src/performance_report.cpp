#include "monitoring/performance_report.hpp"
#include "backtest/replay_simulator.hpp"
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>

namespace statarb {

namespace {

double percent(size_t part, size_t whole) {
    return whole == 0 ? 0.0 : 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

} // anonymous namespace

PerformanceReport analyze_performance(const std::vector<TradeRecord>& trades,
                                      const Ledger& ledger) {
    PerformanceReport report;
    report.total_trades = trades.size();

    std::map<Symbol, ProductStats> by_symbol;
    for (const auto& t : trades) {
        if (t.realized_pnl > 0.0) ++report.profitable_trades;
        else if (t.realized_pnl < 0.0) ++report.losing_trades;
        else ++report.break_even_trades;

        ProductStats& s = by_symbol[t.symbol];
        s.symbol = t.symbol;
        ++s.trades;
        s.net_quantity += t.quantity;
        s.volume += std::llabs(t.quantity);
        s.cash_flow += t.cash_flow;
        s.pnl_sum += t.realized_pnl;
    }

    for (auto& [symbol, s] : by_symbol) {
        s.pnl_mean = s.pnl_sum / static_cast<double>(s.trades);
    }

    // Second pass for the spread around each product's mean
    std::map<Symbol, double> sum_sq;
    for (const auto& t : trades) {
        double d = t.realized_pnl - by_symbol[t.symbol].pnl_mean;
        sum_sq[t.symbol] += d * d;
    }
    for (auto& [symbol, s] : by_symbol) {
        if (s.trades > 1) {
            s.pnl_std = std::sqrt(sum_sq[symbol] / static_cast<double>(s.trades - 1));
        }
        report.products.push_back(s);
    }

    report.final_portfolio_value = ledger.portfolio_value();
    report.cash = ledger.cash();
    report.realized_pnl = ledger.realized_pnl();
    report.unrealized_pnl = ledger.unrealized_pnl();
    report.peak_portfolio_value = report.final_portfolio_value;

    for (const auto& [symbol, pos] : ledger.positions()) {
        PositionLine line;
        line.symbol = symbol;
        line.position = pos;
        line.mark = ledger.mark_price(symbol).value_or(0.0);
        line.value = static_cast<double>(pos) * line.mark;
        report.positions.push_back(line);
    }

    return report;
}

PerformanceReport analyze_performance(const std::vector<TradeRecord>& trades,
                                      const Ledger& ledger,
                                      const std::vector<PnlPoint>& history) {
    PerformanceReport report = analyze_performance(trades, ledger);
    if (history.empty()) return report;

    double peak = history.front().portfolio_value;
    double max_dd = 0.0;
    for (const auto& point : history) {
        if (point.portfolio_value > peak) peak = point.portfolio_value;
        double dd = peak - point.portfolio_value;
        if (dd > max_dd) max_dd = dd;
    }
    report.peak_portfolio_value = peak;
    report.max_drawdown = max_dd;
    return report;
}

void print_report(const PerformanceReport& report) {
    printf("\n=== Trade Analysis ===\n");
    printf("  Total trades:       %zu\n", report.total_trades);
    printf("  Profitable trades:  %zu (%.2f%%)\n", report.profitable_trades,
           percent(report.profitable_trades, report.total_trades));
    printf("  Losing trades:      %zu (%.2f%%)\n", report.losing_trades,
           percent(report.losing_trades, report.total_trades));
    printf("  Break-even trades:  %zu (%.2f%%)\n", report.break_even_trades,
           percent(report.break_even_trades, report.total_trades));

    printf("\n=== Portfolio Summary ===\n");
    printf("  Final portfolio value:  %14.2f\n", report.final_portfolio_value);
    printf("  Cash:                   %14.2f\n", report.cash);
    printf("  Realized PnL:           %14.2f\n", report.realized_pnl);
    printf("  Unrealized PnL:         %14.2f\n", report.unrealized_pnl);
    printf("  Peak portfolio value:   %14.2f\n", report.peak_portfolio_value);
    printf("  Max drawdown:           %14.2f\n", report.max_drawdown);

    printf("\n=== Final Positions ===\n");
    for (const auto& p : report.positions) {
        printf("  %-18s %8" PRId64 " @ %10.2f = %14.2f\n",
               p.symbol.c_str(), p.position, p.mark, p.value);
    }

    printf("\n=== Product Analysis ===\n");
    printf("  %-18s %7s %9s %9s %14s %12s %10s %10s\n",
           "product", "trades", "net_qty", "volume", "cash_flow", "pnl_sum", "pnl_mean", "pnl_std");
    for (const auto& s : report.products) {
        printf("  %-18s %7zu %9" PRId64 " %9" PRId64 " %14.2f %12.2f %10.3f %10.3f\n",
               s.symbol.c_str(), s.trades, s.net_quantity, s.volume,
               s.cash_flow, s.pnl_sum, s.pnl_mean, s.pnl_std);
    }
    printf("\n");
}

} // namespace statarb
