#pragma once

#include <cstdint>
#include <ctime>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace statarb {

// Core type aliases
using Price = double;           // Exchange prices are real numbers (mid can be x.5)
using Quantity = int64_t;       // Signed: positive = buy, negative = sell
using Volume = int64_t;         // Resting liquidity, always a positive magnitude
using Symbol = std::string;
using Timestamp = int64_t;      // Exchange tick timestamp within a day
using Day = int32_t;

constexpr Volume UNLIMITED_VOLUME = std::numeric_limits<Volume>::max();

enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

struct Order {
    Symbol symbol;
    Price price = 0.0;
    Quantity quantity = 0;
};

/// One executed fill as recorded by the simulator.
struct TradeRecord {
    Day day = 0;
    Timestamp timestamp = 0;
    Symbol symbol;
    Quantity quantity = 0;
    Price price = 0.0;
    Price market_price = 0.0;   // Reference mid at fill time
    Quantity position_after = 0;
    double cash_flow = 0.0;
    double realized_pnl = 0.0;
};

// Ordered maps keep iteration (and therefore replay output) deterministic.
using OrderMap = std::map<Symbol, std::vector<Order>>;
using PositionMap = std::map<Symbol, Quantity>;

constexpr Side side_of(Quantity quantity) noexcept {
    return quantity >= 0 ? Side::Buy : Side::Sell;
}

constexpr Side opposite_side(Side s) noexcept {
    return s == Side::Buy ? Side::Sell : Side::Buy;
}

constexpr const char* side_name(Side s) noexcept {
    return s == Side::Buy ? "BUY" : "SELL";
}

inline uint64_t now_ns() noexcept {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

} // namespace statarb
