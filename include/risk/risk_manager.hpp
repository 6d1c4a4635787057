#pragma once

#include "common/types.hpp"
#include "risk/position_limits.hpp"
#include <cstdint>

namespace statarb {

enum class RiskCheckResult : uint8_t {
    Approved = 0,
    ZeroQuantity = 1,
    InvalidPrice = 2,
    PositionLimitBreached = 3
};

constexpr const char* risk_result_name(RiskCheckResult r) noexcept {
    switch (r) {
        case RiskCheckResult::Approved: return "APPROVED";
        case RiskCheckResult::ZeroQuantity: return "ZERO_QUANTITY";
        case RiskCheckResult::InvalidPrice: return "INVALID_PRICE";
        case RiskCheckResult::PositionLimitBreached: return "POSITION_LIMIT";
    }
    return "UNKNOWN";
}

/// Pre-trade check run by the simulator on every order a strategy returns.
/// Checks are ordered cheapest first; the first failure wins. Whether a
/// PositionLimitBreached result blocks the fill is the caller's policy.
class RiskManager {
public:
    explicit RiskManager(const PositionLimits& limits);

    __attribute__((hot))
    RiskCheckResult check_order(const Order& order, Quantity current_position) noexcept;

    const PositionLimits& limits() const noexcept { return limits_; }
    void set_limits(const PositionLimits& limits) { limits_ = limits; }

    uint64_t checks_performed() const noexcept { return checks_performed_; }
    uint64_t checks_rejected() const noexcept { return checks_rejected_; }
    uint64_t limit_breaches() const noexcept { return limit_breaches_; }

    void reset_counters() noexcept;

private:
    PositionLimits limits_;

    uint64_t checks_performed_ = 0;
    uint64_t checks_rejected_ = 0;
    uint64_t limit_breaches_ = 0;
};

} // namespace statarb
