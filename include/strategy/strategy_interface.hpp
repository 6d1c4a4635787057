#pragma once

#include "common/types.hpp"
#include "order_book/book_snapshot.hpp"
#include <string>
#include <string_view>

namespace statarb {

/// Everything a strategy sees for one tick.
struct TradingState {
    Timestamp timestamp = 0;
    OrderDepths order_depths;
    PositionMap position;
    std::string trader_data;   // opaque state returned by the previous tick
};

struct TickResult {
    OrderMap orders;
    int conversions = 0;
    std::string trader_data;
};

/// Abstract strategy interface. The simulator drives any implementation
/// through run() once per tick; all cross-tick state must travel in
/// trader_data.
class StrategyInterface {
public:
    virtual ~StrategyInterface() = default;

    /// May throw; the simulator logs and skips the tick.
    virtual TickResult run(const TradingState& state) = 0;

    /// Strategy name for logging
    virtual std::string_view name() const = 0;
};

} // namespace statarb
