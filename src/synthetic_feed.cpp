#include "market_data/synthetic_feed.hpp"
#include <cmath>
#include <stdexcept>

namespace statarb {

SyntheticFeed::SyntheticFeed(uint64_t seed)
    : rng_(seed)
{}

void SyntheticFeed::add_instrument(const InstrumentParams& params) {
    if (params.symbol.empty()) {
        throw std::invalid_argument("synthetic instrument needs a symbol");
    }
    if (params.volatility < 0.0 || params.spread < 0.0 || params.base_volume <= 0 ||
        params.reversion < 0.0 || params.reversion >= 1.0) {
        throw std::invalid_argument("synthetic instrument " + params.symbol + ": bad parameters");
    }
    for (const auto& c : params.components) {
        bool known = false;
        for (const auto& inst : instruments_) {
            if (inst.params.symbol == c.symbol) known = true;
        }
        if (!known) {
            throw std::invalid_argument("synthetic instrument " + params.symbol +
                                        ": component " + c.symbol + " not added yet");
        }
    }

    InstrumentState state;
    state.params = params;
    if (params.components.empty()) {
        state.mid = params.initial_price;
    } else {
        state.premium = params.initial_price;
    }
    instruments_.push_back(std::move(state));
}

double SyntheticFeed::current_mid(const Symbol& symbol) const noexcept {
    for (const auto& inst : instruments_) {
        if (inst.params.symbol == symbol) return inst.mid;
    }
    return 0.0;
}

std::vector<MarketDataRow> SyntheticFeed::generate(size_t ticks, Day day, Timestamp step) {
    std::vector<MarketDataRow> rows;
    rows.reserve(ticks * instruments_.size());

    for (size_t t = 0; t < ticks; ++t) {
        Timestamp ts = static_cast<Timestamp>(t) * step;
        for (auto& inst : instruments_) {
            const InstrumentParams& p = inst.params;
            double shock = p.volatility * normal_dist_(rng_);
            if (p.components.empty()) {
                // Random walk with optional pull toward the starting level
                inst.mid += shock + p.reversion * (p.initial_price - inst.mid);
            } else {
                inst.premium += shock - p.reversion * inst.premium;
                double fair = 0.0;
                for (const auto& c : p.components) {
                    fair += c.weight * current_mid(c.symbol);
                }
                inst.mid = fair + inst.premium;
            }
            if (inst.mid < 1.0) inst.mid = 1.0;
            rows.push_back(make_row(inst, day, ts));
        }
    }
    return rows;
}

MarketDataRow SyntheticFeed::make_row(const InstrumentState& state, Day day, Timestamp ts) {
    const InstrumentParams& p = state.params;
    double half = p.spread / 2.0;
    double best_bid = std::floor(state.mid - half);
    double best_ask = std::ceil(state.mid + half);
    if (best_ask <= best_bid) best_ask = best_bid + 1.0;

    MarketDataRow row;
    row.day = day;
    row.timestamp = ts;
    row.product = p.symbol;
    for (size_t level = 0; level < MAX_BOOK_DEPTH; ++level) {
        double offset = static_cast<double>(level);
        Volume bid_vol = p.base_volume + static_cast<Volume>(
            std::floor(std::fabs(normal_dist_(rng_)) * static_cast<double>(p.base_volume) / 2.0));
        Volume ask_vol = p.base_volume + static_cast<Volume>(
            std::floor(std::fabs(normal_dist_(rng_)) * static_cast<double>(p.base_volume) / 2.0));
        row.bids[level].price = best_bid - offset;
        row.bids[level].volume = bid_vol;
        row.asks[level].price = best_ask + offset;
        row.asks[level].volume = ask_vol;
    }
    row.mid_price = (best_bid + best_ask) / 2.0;
    return row;
}

void SyntheticFeed::fill(HistoricalFeed& feed, size_t ticks, Day day, Timestamp step) {
    for (auto& row : generate(ticks, day, step)) {
        feed.add_row(std::move(row));
    }
}

SyntheticFeed SyntheticFeed::research_universe(uint64_t seed) {
    SyntheticFeed feed(seed);
    feed.add_instrument({"RAINFOREST_RESIN", 10000.0, 1.5, 0.5, 4.0, 25, {}});
    feed.add_instrument({"KELP", 2030.0, 0.8, 0.0, 3.0, 25, {}});
    feed.add_instrument({"SQUID_INK", 1970.0, 2.0, 0.02, 3.0, 20, {}});
    feed.add_instrument({"CROISSANTS", 4300.0, 1.0, 0.0, 2.0, 60, {}});
    feed.add_instrument({"JAMS", 6600.0, 1.0, 0.0, 2.0, 60, {}});
    feed.add_instrument({"DJEMBES", 13400.0, 2.0, 0.0, 2.0, 30, {}});
    feed.add_instrument({"PICNIC_BASKET1", 40.0, 4.0, 0.1, 6.0, 15,
                         {{"CROISSANTS", 6.0}, {"JAMS", 3.0}, {"DJEMBES", 1.0}}});
    feed.add_instrument({"PICNIC_BASKET2", 30.0, 3.0, 0.1, 4.0, 20,
                         {{"CROISSANTS", 4.0}, {"JAMS", 2.0}}});
    return feed;
}

} // namespace statarb
