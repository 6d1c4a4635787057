#pragma once

#include "common/types.hpp"
#include "order_book/book_snapshot.hpp"
#include <array>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace statarb {

constexpr size_t MAX_BOOK_DEPTH = 3;

/// One price level from a data row. Either field may be absent when the
/// cell was empty or not a number.
struct LevelQuote {
    std::optional<Price> price;
    std::optional<Volume> volume;

    bool present() const noexcept { return price.has_value() && volume.has_value(); }
};

/// One instrument at one (day, timestamp) as recorded in the research CSV.
struct MarketDataRow {
    Day day = 0;
    Timestamp timestamp = 0;
    Symbol product;
    std::array<LevelQuote, MAX_BOOK_DEPTH> bids{};
    std::array<LevelQuote, MAX_BOOK_DEPTH> asks{};
    Price mid_price = 0.0;     // reference price for fills and marks
};

/// All rows sharing one (day, timestamp), in file order.
struct TickGroup {
    Day day = 0;
    Timestamp timestamp = 0;
    std::vector<MarketDataRow> rows;
};

/// Depth snapshot from a row: levels 1..depth that carry both a price and a
/// volume. `depth` is clamped to [1, MAX_BOOK_DEPTH].
BookSnapshot build_snapshot(const MarketDataRow& row, size_t depth = MAX_BOOK_DEPTH);

/// Lenient numeric cell parsing: empty, malformed or non-finite cells are absent.
std::optional<double> parse_price_cell(std::string_view cell) noexcept;
std::optional<int64_t> parse_integer_cell(std::string_view cell) noexcept;

/// Pick the delimiter for a header line: `preferred` when the header
/// contains it, otherwise ';', ',' or tab, whichever appears first in that order.
char detect_delimiter(std::string_view header, char preferred = ';') noexcept;

/// HistoricalFeed: loads the per-product order book CSV
///   day;timestamp;product;bid_price_1;bid_volume_1;...;ask_volume_3;mid_price[;profit_and_loss]
/// Columns are located by header name, so extra or reordered columns are fine.
/// Rows without a valid day, timestamp, product or mid_price are dropped
/// (counted, logged at warn).
class HistoricalFeed {
public:
    HistoricalFeed() = default;

    /// Load a file. Throws std::runtime_error if the file cannot be opened or
    /// the header lacks a required column.
    void load_csv(const std::string& path, char delimiter = ';');

    /// Parse from a stream (same rules as load_csv).
    void parse(std::istream& in, char delimiter = ';');

    void add_row(MarketDataRow row) { rows_.push_back(std::move(row)); }

    const std::vector<MarketDataRow>& rows() const noexcept { return rows_; }
    size_t row_count() const noexcept { return rows_.size(); }
    size_t dropped_rows() const noexcept { return dropped_rows_; }
    bool empty() const noexcept { return rows_.empty(); }

    /// Rows grouped by (day, timestamp) in chronological order. Rows keep
    /// their file order within a group.
    std::vector<TickGroup> group_ticks() const;

    void clear() noexcept;

private:
    std::vector<MarketDataRow> rows_;
    size_t dropped_rows_ = 0;
};

} // namespace statarb
