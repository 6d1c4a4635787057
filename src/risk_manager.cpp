#include "risk/risk_manager.hpp"
#include <cmath>
#include <cstdlib>

namespace statarb {

RiskManager::RiskManager(const PositionLimits& limits)
    : limits_(limits)
{}

__attribute__((hot))
RiskCheckResult RiskManager::check_order(const Order& order, Quantity current_position) noexcept {
    ++checks_performed_;

    // 1. Empty orders carry nothing to fill
    if (order.quantity == 0) [[unlikely]] {
        ++checks_rejected_;
        return RiskCheckResult::ZeroQuantity;
    }

    // 2. Price sanity
    if (!std::isfinite(order.price) || order.price <= 0.0) [[unlikely]] {
        ++checks_rejected_;
        return RiskCheckResult::InvalidPrice;
    }

    // 3. Position limit: |position + quantity| <= limit, unless the order
    // moves an already-breached position back toward zero
    int64_t new_pos = current_position + order.quantity;
    int64_t new_abs = std::llabs(new_pos);
    if (new_abs > limits_.limit_for(order.symbol) &&
        new_abs >= std::llabs(current_position)) [[unlikely]] {
        ++checks_rejected_;
        ++limit_breaches_;
        return RiskCheckResult::PositionLimitBreached;
    }

    return RiskCheckResult::Approved;
}

void RiskManager::reset_counters() noexcept {
    checks_performed_ = 0;
    checks_rejected_ = 0;
    limit_breaches_ = 0;
}

} // namespace statarb
