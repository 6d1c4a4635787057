#pragma once

#include "common/types.hpp"
#include <functional>
#include <map>
#include <optional>

namespace statarb {

/// Mid-price from the best quotes: average when both sides exist,
/// ask*0.99 for an ask-only book, bid*1.01 for a bid-only book.
std::optional<Price> mid_price(std::optional<Price> best_bid,
                               std::optional<Price> best_ask) noexcept;

/// BookSnapshot: aggregated depth for one instrument at one tick.
/// - Bids: descending price (std::greater)
/// - Asks: ascending price (default)
/// Volumes are stored as positive magnitudes; a present level has >= 1 unit.
class BookSnapshot {
public:
    using BidLevels = std::map<Price, Volume, std::greater<Price>>;
    using AskLevels = std::map<Price, Volume>;

    BookSnapshot() = default;

    /// Add resting volume at a price. Sign of `volume` is ignored; zero volume
    /// and non-finite prices are dropped. Repeated prices accumulate.
    void add_bid(Price price, Volume volume);
    void add_ask(Price price, Volume volume);

    std::optional<Price> best_bid() const noexcept;
    std::optional<Price> best_ask() const noexcept;
    std::optional<Price> mid_price() const noexcept;

    /// Volume resting at exactly `price` (0 if the level is absent).
    Volume bid_volume(Price price) const noexcept;
    Volume ask_volume(Price price) const noexcept;

    const BidLevels& bids() const noexcept { return bids_; }
    const AskLevels& asks() const noexcept { return asks_; }

    bool empty() const noexcept { return bids_.empty() && asks_.empty(); }

private:
    BidLevels bids_;
    AskLevels asks_;
};

/// Per-instrument depth for one tick.
using OrderDepths = std::map<Symbol, BookSnapshot>;

} // namespace statarb
