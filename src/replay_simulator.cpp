#include "backtest/replay_simulator.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace statarb {

namespace {

constexpr const char* EMPTY_STATE = "{}";

} // anonymous namespace

std::string normalize_trader_data(const std::string& data) {
    if (data.empty() || !nlohmann::json::accept(data)) return EMPTY_STATE;
    return data;
}

ReplaySimulator::ReplaySimulator(StrategyInterface& strategy, const PositionLimits& limits)
    : ReplaySimulator(strategy, limits, Params{})
{}

ReplaySimulator::ReplaySimulator(StrategyInterface& strategy, const PositionLimits& limits,
                                 Params params)
    : strategy_(strategy)
    , params_(params)
    , risk_(limits)
    , trader_data_(EMPTY_STATE)
{}

void ReplaySimulator::run(const HistoricalFeed& feed) {
    run(feed.group_ticks());
}

void ReplaySimulator::run(const std::vector<TickGroup>& ticks) {
    LOG_INFO("replay start: strategy=%.*s ticks=%zu enforce_limits=%d",
             static_cast<int>(strategy_.name().size()), strategy_.name().data(),
             ticks.size(), params_.enforce_position_limits ? 1 : 0);

    for (const auto& tick : ticks) {
        run_tick(tick);
    }

    LOG_INFO("replay end: trades=%zu skipped=%lu cash=%.2f value=%.2f realized=%.2f",
             trades_.size(), static_cast<unsigned long>(metrics_.skipped_ticks()),
             ledger_.cash(), ledger_.portfolio_value(), ledger_.realized_pnl());
}

bool ReplaySimulator::run_tick(const TickGroup& tick) {
    metrics_.record_tick();

    TradingState state;
    state.timestamp = tick.timestamp;
    state.trader_data = trader_data_;

    // Market data; a repeated product within one tick replaces the earlier row
    std::map<Symbol, Price> references;
    for (const auto& row : tick.rows) {
        state.order_depths[row.product] = build_snapshot(row, params_.depth_levels);
        references[row.product] = row.mid_price;
        ledger_.track(row.product);
        ledger_.update_mark_price(row.product, row.mid_price);
    }
    state.position = ledger_.positions();

    TickResult result;
    try {
        ScopedLatency timer(metrics_.strategy_latency());
        result = strategy_.run(state);
    } catch (const std::exception& e) {
        metrics_.record_skipped_tick();
        LOG_ERROR("strategy failed at day %d timestamp %" PRId64 ", tick skipped: %s",
                  tick.day, tick.timestamp, e.what());
        return false;
    }

    trader_data_ = normalize_trader_data(result.trader_data);

    double round_pnl = 0.0;
    for (const auto& [symbol, orders] : result.orders) {
        for (const auto& order : orders) {
            process_order(symbol, order, tick, references, round_pnl);
        }
    }

    PnlPoint point;
    point.day = tick.day;
    point.timestamp = tick.timestamp;
    point.round_pnl = round_pnl;
    point.cumulative_realized = ledger_.realized_pnl();
    point.cash = ledger_.cash();
    point.portfolio_value = ledger_.portfolio_value();
    pnl_history_.push_back(point);
    return true;
}

void ReplaySimulator::process_order(const Symbol& symbol, const Order& order,
                                    const TickGroup& tick,
                                    const std::map<Symbol, Price>& references,
                                    double& round_pnl) {
    metrics_.record_order_received();

    Order fill_order = order;
    if (fill_order.symbol != symbol) {
        if (!fill_order.symbol.empty()) {
            LOG_WARN("order symbol %s filed under %s, using %s",
                     fill_order.symbol.c_str(), symbol.c_str(), symbol.c_str());
        }
        fill_order.symbol = symbol;
    }

    // Reference price: this tick's mid, else the last mark
    Price reference = 0.0;
    if (auto it = references.find(symbol); it != references.end()) {
        reference = it->second;
    } else if (auto mark = ledger_.mark_price(symbol)) {
        reference = *mark;
    } else {
        metrics_.record_order_rejected();
        LOG_WARN("order rejected: %s has no reference price", symbol.c_str());
        return;
    }

    Quantity position = ledger_.position(symbol);
    RiskCheckResult check = risk_.check_order(fill_order, position);
    switch (check) {
        case RiskCheckResult::Approved:
            break;
        case RiskCheckResult::PositionLimitBreached:
            if (params_.enforce_position_limits) {
                metrics_.record_order_rejected();
                LOG_WARN("order rejected: %s %" PRId64 " @ %.2f would breach limit %" PRId64
                         " from position %" PRId64,
                         symbol.c_str(), fill_order.quantity, fill_order.price,
                         risk_.limits().limit_for(symbol), position);
                return;
            }
            metrics_.record_limit_warning();
            LOG_WARN("limit audit: %s %" PRId64 " @ %.2f takes position %" PRId64
                     " past limit %" PRId64,
                     symbol.c_str(), fill_order.quantity, fill_order.price,
                     position + fill_order.quantity, risk_.limits().limit_for(symbol));
            break;
        case RiskCheckResult::ZeroQuantity:
        case RiskCheckResult::InvalidPrice:
            metrics_.record_order_rejected();
            LOG_WARN("order rejected: %s %" PRId64 " @ %.2f (%s)", symbol.c_str(),
                     fill_order.quantity, fill_order.price, risk_result_name(check));
            return;
    }

    auto trade = matching_.execute(fill_order, reference, position, tick.day, tick.timestamp);
    if (!trade) return;

    ledger_.apply_fill(*trade);
    metrics_.record_fill();
    round_pnl += trade->realized_pnl;

    LOG_DEBUG("fill %s %s %" PRId64 " @ %.2f mid=%.2f pnl=%.2f pos=%" PRId64,
              side_name(side_of(trade->quantity)), trade->symbol.c_str(),
              trade->quantity, trade->price, trade->market_price,
              trade->realized_pnl, trade->position_after);

    trades_.push_back(std::move(*trade));
}

void ReplaySimulator::write_trade_log(std::ostream& out) const {
    out << "day,timestamp,product,side,quantity,price,market_price,position,cash_flow,pnl\n";

    char line[512];
    for (const auto& t : trades_) {
        int len = std::snprintf(line, sizeof(line),
            "%d,%" PRId64 ",%s,%s,%" PRId64 ",%.10g,%.10g,%" PRId64 ",%.10g,%.10g\n",
            t.day, t.timestamp, t.symbol.c_str(), side_name(side_of(t.quantity)),
            t.quantity, t.price, t.market_price, t.position_after,
            t.cash_flow, t.realized_pnl);
        if (len > 0) {
            out.write(line, std::min<std::streamsize>(len, sizeof(line) - 1));
        }
    }
}

void ReplaySimulator::write_trade_log(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open trade log '" + path + "'");
    }
    write_trade_log(file);
    if (!file) {
        throw std::runtime_error("failed writing trade log '" + path + "'");
    }
    LOG_INFO("wrote %zu trades to %s", trades_.size(), path.c_str());
}

void ReplaySimulator::reset() {
    ledger_.reset();
    trades_.clear();
    pnl_history_.clear();
    trader_data_ = EMPTY_STATE;
    metrics_.reset();
    risk_.reset_counters();
    matching_.reset_counters();
}

} // namespace statarb
