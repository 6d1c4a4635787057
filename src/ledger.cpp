#include "risk/ledger.hpp"
#include <cstdlib>

namespace statarb {

void Ledger::apply_fill(const TradeRecord& trade) {
    positions_[trade.symbol] += trade.quantity;
    cash_ += trade.cash_flow;
    realized_pnl_ += trade.realized_pnl;
    symbol_pnl_[trade.symbol] += trade.realized_pnl;
}

void Ledger::update_mark_price(const Symbol& symbol, Price price) {
    marks_[symbol] = price;
}

std::optional<Price> Ledger::mark_price(const Symbol& symbol) const noexcept {
    auto it = marks_.find(symbol);
    if (it == marks_.end()) return std::nullopt;
    return it->second;
}

void Ledger::track(const Symbol& symbol) {
    positions_.try_emplace(symbol, 0);
}

Quantity Ledger::position(const Symbol& symbol) const noexcept {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? 0 : it->second;
}

int64_t Ledger::total_absolute_position() const noexcept {
    int64_t total = 0;
    for (const auto& [symbol, pos] : positions_) {
        total += std::llabs(pos);
    }
    return total;
}

double Ledger::mark_to_market() const noexcept {
    double value = 0.0;
    for (const auto& [symbol, pos] : positions_) {
        if (pos == 0) continue;
        auto mark = marks_.find(symbol);
        if (mark != marks_.end()) {
            value += static_cast<double>(pos) * mark->second;
        }
    }
    return value;
}

double Ledger::realized_pnl(const Symbol& symbol) const noexcept {
    auto it = symbol_pnl_.find(symbol);
    return it == symbol_pnl_.end() ? 0.0 : it->second;
}

void Ledger::reset() noexcept {
    positions_.clear();
    marks_.clear();
    symbol_pnl_.clear();
    cash_ = 0.0;
    realized_pnl_ = 0.0;
}

} // namespace statarb
