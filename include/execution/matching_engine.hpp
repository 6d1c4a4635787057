#pragma once

#include "common/types.hpp"
#include <cstdint>
#include <optional>

namespace statarb {

/// Research matching model: every order fills completely at its own price.
/// The reference (mid) price only enters the per-trade PnL,
///   realized = (reference - price) * quantity
/// which is positive for a buy below the mid or a sell above it.
class MatchingEngine {
public:
    MatchingEngine() = default;

    /// Fill `order` against the reference price. Returns nullopt for an
    /// empty order; the caller is expected to have risk-checked it.
    std::optional<TradeRecord> execute(const Order& order, Price reference_price,
                                       Quantity position_before, Day day,
                                       Timestamp timestamp);

    uint64_t orders_processed() const noexcept { return orders_processed_; }
    uint64_t fills() const noexcept { return fills_; }
    Quantity volume_traded() const noexcept { return volume_traded_; }

    void reset_counters() noexcept;

private:
    uint64_t orders_processed_ = 0;
    uint64_t fills_ = 0;
    Quantity volume_traded_ = 0;
};

} // namespace statarb
