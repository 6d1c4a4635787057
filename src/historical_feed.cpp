#include "market_data/historical_feed.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cinttypes>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

namespace statarb {

namespace {

// Largest integral cell magnitude a double represents exactly.
constexpr double MAX_CELL_INTEGER = 9.0e15;

constexpr const char* REQUIRED_COLUMNS[] = {
    "day", "timestamp", "product",
    "bid_price_1", "bid_volume_1",
    "ask_price_1", "ask_volume_1",
    "mid_price"
};

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '"')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '"')) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> split(std::string_view line, char delimiter) {
    std::vector<std::string_view> cells;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(delimiter, start);
        if (pos == std::string_view::npos) {
            cells.push_back(trim(line.substr(start)));
            break;
        }
        cells.push_back(trim(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return cells;
}

// Column index per field, -1 when the header does not name it.
struct ColumnMap {
    int day = -1;
    int timestamp = -1;
    int product = -1;
    int mid_price = -1;
    std::array<int, MAX_BOOK_DEPTH> bid_price{-1, -1, -1};
    std::array<int, MAX_BOOK_DEPTH> bid_volume{-1, -1, -1};
    std::array<int, MAX_BOOK_DEPTH> ask_price{-1, -1, -1};
    std::array<int, MAX_BOOK_DEPTH> ask_volume{-1, -1, -1};
};

ColumnMap map_columns(const std::vector<std::string_view>& header) {
    std::map<std::string_view, int> index;
    for (size_t i = 0; i < header.size(); ++i) {
        index.emplace(header[i], static_cast<int>(i));
    }

    std::string missing;
    for (const char* name : REQUIRED_COLUMNS) {
        if (index.count(name) == 0) {
            if (!missing.empty()) missing += ", ";
            missing += name;
        }
    }
    if (!missing.empty()) {
        throw std::runtime_error("market data: missing required columns: " + missing);
    }

    auto lookup = [&](const std::string& name) {
        auto it = index.find(name);
        return it == index.end() ? -1 : it->second;
    };

    ColumnMap cols;
    cols.day = lookup("day");
    cols.timestamp = lookup("timestamp");
    cols.product = lookup("product");
    cols.mid_price = lookup("mid_price");
    for (size_t level = 0; level < MAX_BOOK_DEPTH; ++level) {
        std::string n = std::to_string(level + 1);
        cols.bid_price[level] = lookup("bid_price_" + n);
        cols.bid_volume[level] = lookup("bid_volume_" + n);
        cols.ask_price[level] = lookup("ask_price_" + n);
        cols.ask_volume[level] = lookup("ask_volume_" + n);
    }
    return cols;
}

std::string_view cell_at(const std::vector<std::string_view>& cells, int index) noexcept {
    if (index < 0 || static_cast<size_t>(index) >= cells.size()) return {};
    return cells[static_cast<size_t>(index)];
}

// Fractional volumes truncate toward zero; magnitudes beyond MAX_CELL_INTEGER
// are treated as malformed.
std::optional<Volume> parse_volume_cell(std::string_view cell) noexcept {
    auto value = parse_price_cell(cell);
    if (!value || std::fabs(*value) > MAX_CELL_INTEGER) return std::nullopt;
    return static_cast<Volume>(std::trunc(*value));
}

} // anonymous namespace

std::optional<double> parse_price_cell(std::string_view cell) noexcept {
    cell = trim(cell);
    if (cell.empty() || cell.size() >= 64) return std::nullopt;

    char buf[64];
    std::copy(cell.begin(), cell.end(), buf);
    buf[cell.size()] = '\0';

    char* end = nullptr;
    errno = 0;
    double value = std::strtod(buf, &end);
    if (end != buf + cell.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<int64_t> parse_integer_cell(std::string_view cell) noexcept {
    auto value = parse_price_cell(cell);
    if (!value || *value != std::floor(*value)) return std::nullopt;
    if (std::fabs(*value) > MAX_CELL_INTEGER) return std::nullopt;
    return static_cast<int64_t>(*value);
}

char detect_delimiter(std::string_view header, char preferred) noexcept {
    if (header.find(preferred) != std::string_view::npos) return preferred;
    for (char c : {';', ',', '\t'}) {
        if (header.find(c) != std::string_view::npos) return c;
    }
    return preferred;
}

BookSnapshot build_snapshot(const MarketDataRow& row, size_t depth) {
    depth = std::clamp<size_t>(depth, 1, MAX_BOOK_DEPTH);
    BookSnapshot book;
    for (size_t level = 0; level < depth; ++level) {
        const LevelQuote& bid = row.bids[level];
        if (bid.present()) book.add_bid(*bid.price, *bid.volume);
        const LevelQuote& ask = row.asks[level];
        if (ask.present()) book.add_ask(*ask.price, *ask.volume);
    }
    return book;
}

void HistoricalFeed::load_csv(const std::string& path, char delimiter) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("market data: cannot open '" + path + "'");
    }
    parse(file, delimiter);
    LOG_INFO("loaded %zu rows from %s (%zu dropped)", rows_.size(), path.c_str(), dropped_rows_);
}

void HistoricalFeed::parse(std::istream& in, char delimiter) {
    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("market data: empty input");
    }

    delimiter = detect_delimiter(line, delimiter);
    ColumnMap cols = map_columns(split(line, delimiter));

    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        auto cells = split(line, delimiter);

        auto day = parse_integer_cell(cell_at(cells, cols.day));
        auto timestamp = parse_integer_cell(cell_at(cells, cols.timestamp));
        std::string_view product = cell_at(cells, cols.product);
        auto mid = parse_price_cell(cell_at(cells, cols.mid_price));

        if (!day || !timestamp || product.empty() || !mid) [[unlikely]] {
            ++dropped_rows_;
            LOG_WARN("market data line %zu dropped: missing day, timestamp, product or mid_price",
                     line_no);
            continue;
        }
        if (*day < std::numeric_limits<Day>::min() || *day > std::numeric_limits<Day>::max()) [[unlikely]] {
            ++dropped_rows_;
            LOG_WARN("market data line %zu dropped: day %" PRId64 " out of range", line_no, *day);
            continue;
        }

        MarketDataRow row;
        row.day = static_cast<Day>(*day);
        row.timestamp = *timestamp;
        row.product = std::string(product);
        row.mid_price = *mid;
        for (size_t level = 0; level < MAX_BOOK_DEPTH; ++level) {
            row.bids[level].price = parse_price_cell(cell_at(cells, cols.bid_price[level]));
            row.bids[level].volume = parse_volume_cell(cell_at(cells, cols.bid_volume[level]));
            row.asks[level].price = parse_price_cell(cell_at(cells, cols.ask_price[level]));
            row.asks[level].volume = parse_volume_cell(cell_at(cells, cols.ask_volume[level]));
        }
        rows_.push_back(std::move(row));
    }
}

std::vector<TickGroup> HistoricalFeed::group_ticks() const {
    std::vector<size_t> order(rows_.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;

    std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
        const auto& ra = rows_[a];
        const auto& rb = rows_[b];
        if (ra.day != rb.day) return ra.day < rb.day;
        return ra.timestamp < rb.timestamp;
    });

    std::vector<TickGroup> groups;
    for (size_t idx : order) {
        const MarketDataRow& row = rows_[idx];
        if (groups.empty() || groups.back().day != row.day ||
            groups.back().timestamp != row.timestamp) {
            TickGroup group;
            group.day = row.day;
            group.timestamp = row.timestamp;
            groups.push_back(std::move(group));
        }
        groups.back().rows.push_back(row);
    }
    return groups;
}

void HistoricalFeed::clear() noexcept {
    rows_.clear();
    dropped_rows_ = 0;
}

} // namespace statarb
