#pragma once

#include "containers/circular_buffer.hpp"
#include "stats/ewma.hpp"
#include "stats/regime_detector.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace statarb {

/// Single-instrument EWMA mean (and dispersion) for mean reversion.
struct MeanReversionState {
    EwmaState ewma;
};

/// Dual moving averages. `prices` backs the simple-MA variant and is left
/// empty (capacity 0) for the exponential variant.
struct CrossoverState {
    double short_ma = 0.0;
    double long_ma = 0.0;
    uint64_t samples = 0;
    CircularBuffer<double> prices;
};

/// EWMA statistics of a two-leg spread.
struct SpreadState {
    EwmaState ewma;
};

/// Paired mid histories for a correlation-gated momentum rule.
struct CorrelationState {
    CircularBuffer<double> leader;
    CircularBuffer<double> follower;
    CircularBuffer<double> correlation_history;
};

/// One case per strategy family.
using InstrumentMemory = std::variant<MeanReversionState,
                                      CrossoverState,
                                      PocketState,
                                      SpreadState,
                                      CorrelationState>;

/// Tag written to the state string for each variant alternative.
const char* memory_kind(const InstrumentMemory& memory) noexcept;

/// Cross-tick strategy state, round-tripped through the opaque state string.
/// Keys are symbols for single-instrument rules, "pair:<name>" and
/// "corr:<name>" for multi-instrument rules.
class StrategyMemory {
public:
    /// nullptr when `key` is absent or holds another family's state.
    template<typename T>
    T* find(const std::string& key) noexcept {
        auto it = entries_.find(key);
        if (it == entries_.end()) return nullptr;
        return std::get_if<T>(&it->second);
    }

    template<typename T>
    const T* find(const std::string& key) const noexcept {
        auto it = entries_.find(key);
        if (it == entries_.end()) return nullptr;
        return std::get_if<T>(&it->second);
    }

    /// Existing state of type T, or a fresh one replacing whatever was there.
    template<typename T>
    T& get_or_reset(const std::string& key) {
        auto& slot = entries_[key];
        if (!std::holds_alternative<T>(slot)) {
            slot = T{};
        }
        return std::get<T>(slot);
    }

    void set(const std::string& key, InstrumentMemory memory) {
        entries_[key] = std::move(memory);
    }

    bool erase(const std::string& key) { return entries_.erase(key) > 0; }
    bool contains(const std::string& key) const { return entries_.count(key) > 0; }
    size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    const std::map<std::string, InstrumentMemory>& entries() const noexcept { return entries_; }

    /// JSON object, one member per key, each tagged with "kind".
    std::string serialize() const;

    /// Never throws: an empty or malformed string yields empty memory.
    /// Entries with an unknown kind are skipped.
    static StrategyMemory deserialize(std::string_view text) noexcept;

private:
    std::map<std::string, InstrumentMemory> entries_;
};

std::string pair_memory_key(const std::string& name);
std::string correlation_memory_key(const std::string& name);

} // namespace statarb
