#pragma once

#include "common/types.hpp"
#include "market_data/historical_feed.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace statarb {

/// Seeded random-walk generator producing the same rows as the CSV loader.
/// Mids walk in absolute price units; quotes are whole ticks around the mid
/// with three levels a side. An instrument with components is priced as
/// their weighted sum plus a mean-reverting premium, so basket rules see a
/// realistic spread.
class SyntheticFeed {
public:
    struct Component {
        Symbol symbol;
        double weight = 1.0;
    };

    struct InstrumentParams {
        Symbol symbol;
        double initial_price = 100.0;    // starting premium for a composite
        double volatility = 1.0;         // per-tick std of the mid move
        double reversion = 0.0;          // per-tick pull toward the start (premium toward 0), [0, 1)
        double spread = 2.0;             // full top-of-book spread
        Volume base_volume = 20;
        std::vector<Component> components;   // priced off these when non-empty
    };

    static constexpr uint64_t DEFAULT_SEED = 42;

    explicit SyntheticFeed(uint64_t seed = DEFAULT_SEED);

    /// Instruments are generated in insertion order; components must be
    /// added before the instrument that references them.
    void add_instrument(const InstrumentParams& params);

    /// Generate `ticks` timestamps for every instrument, starting at
    /// timestamp 0 and stepping by `step`.
    std::vector<MarketDataRow> generate(size_t ticks, Day day = 0, Timestamp step = 100);

    /// Generate straight into a feed.
    void fill(HistoricalFeed& feed, size_t ticks, Day day = 0, Timestamp step = 100);

    size_t instrument_count() const noexcept { return instruments_.size(); }

    /// The research universe: RESIN, KELP, SQUID_INK and the basket family.
    static SyntheticFeed research_universe(uint64_t seed = DEFAULT_SEED);

private:
    struct InstrumentState {
        InstrumentParams params;
        double mid = 0.0;
        double premium = 0.0;
    };

    MarketDataRow make_row(const InstrumentState& state, Day day, Timestamp ts);
    double current_mid(const Symbol& symbol) const noexcept;

    std::vector<InstrumentState> instruments_;
    std::mt19937_64 rng_;
    std::normal_distribution<double> normal_dist_{0.0, 1.0};
};

} // namespace statarb
