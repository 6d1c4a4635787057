#include "order_book/book_snapshot.hpp"
#include <cmath>
#include <cstdint>

namespace statarb {

namespace {

Volume magnitude(Volume v) noexcept {
    return v < 0 ? -v : v;
}

} // anonymous namespace

std::optional<Price> mid_price(std::optional<Price> best_bid,
                               std::optional<Price> best_ask) noexcept {
    if (best_bid && best_ask) return (*best_bid + *best_ask) / 2.0;
    if (best_ask) return *best_ask * 0.99;
    if (best_bid) return *best_bid * 1.01;
    return std::nullopt;
}

void BookSnapshot::add_bid(Price price, Volume volume) {
    if (!std::isfinite(price) || volume == 0 || volume == INT64_MIN) return;
    bids_[price] += magnitude(volume);
}

void BookSnapshot::add_ask(Price price, Volume volume) {
    if (!std::isfinite(price) || volume == 0 || volume == INT64_MIN) return;
    asks_[price] += magnitude(volume);
}

std::optional<Price> BookSnapshot::best_bid() const noexcept {
    if (bids_.empty()) return std::nullopt;
    return bids_.begin()->first;
}

std::optional<Price> BookSnapshot::best_ask() const noexcept {
    if (asks_.empty()) return std::nullopt;
    return asks_.begin()->first;
}

std::optional<Price> BookSnapshot::mid_price() const noexcept {
    return statarb::mid_price(best_bid(), best_ask());
}

Volume BookSnapshot::bid_volume(Price price) const noexcept {
    auto it = bids_.find(price);
    return it != bids_.end() ? it->second : 0;
}

Volume BookSnapshot::ask_volume(Price price) const noexcept {
    auto it = asks_.find(price);
    return it != asks_.end() ? it->second : 0;
}

} // namespace statarb
