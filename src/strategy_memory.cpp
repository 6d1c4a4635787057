#include "strategy/strategy_memory.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace statarb {

using json = nlohmann::json;

namespace {

// Upper bound on a restored window; larger values are treated as corrupt state.
constexpr uint64_t MAX_BUFFER_CAPACITY = 1u << 20;
// Largest count that survives a round trip through a double.
constexpr double MAX_COUNT = 9.0e15;

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

double read_double(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return 0.0;
    return it->get<double>();
}

/// Non-negative integral member; absent reads as 0. Throws on anything else.
uint64_t read_count(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    double v = it->get<double>();
    if (!(v >= 0.0 && v <= MAX_COUNT) || v != static_cast<double>(static_cast<uint64_t>(v))) {
        throw std::out_of_range(std::string(key) + " is not a valid count");
    }
    return static_cast<uint64_t>(v);
}

json encode_buffer(const CircularBuffer<double>& buf) {
    json arr = json::array();
    for (double v : buf) arr.push_back(v);
    return arr;
}

CircularBuffer<double> decode_buffer(const json& obj, const char* items_key,
                                     const char* capacity_key) {
    CircularBuffer<double> buf;
    auto items = obj.find(items_key);
    if (items == obj.end()) return buf;
    if (!items->is_array()) throw std::invalid_argument(std::string(items_key) + " is not an array");

    uint64_t capacity = obj.contains(capacity_key) ? read_count(obj, capacity_key) : items->size();
    capacity = std::max<uint64_t>(capacity, items->size());
    if (capacity > MAX_BUFFER_CAPACITY) {
        throw std::out_of_range(std::string(capacity_key) + " exceeds the window limit");
    }
    buf.set_capacity(static_cast<size_t>(capacity));
    for (const auto& v : *items) buf.push_back(v.get<double>());
    return buf;
}

void encode_ewma(json& obj, const EwmaState& s) {
    obj["mean"] = s.mean;
    obj["variance"] = s.variance;
    obj["samples"] = s.samples;
}

EwmaState decode_ewma(const json& obj) {
    EwmaState s;
    s.mean = read_double(obj, "mean");
    s.variance = read_double(obj, "variance");
    s.samples = read_count(obj, "samples");
    return s;
}

json encode(const InstrumentMemory& memory) {
    json obj = json::object();
    obj["kind"] = memory_kind(memory);

    std::visit(Overloaded{
        [&](const MeanReversionState& s) { encode_ewma(obj, s.ewma); },
        [&](const SpreadState& s) { encode_ewma(obj, s.ewma); },
        [&](const CrossoverState& s) {
            obj["short_ma"] = s.short_ma;
            obj["long_ma"] = s.long_ma;
            obj["samples"] = s.samples;
            obj["capacity"] = s.prices.capacity();
            obj["prices"] = encode_buffer(s.prices);
        },
        [&](const PocketState& s) {
            obj["capacity"] = s.price_history.capacity();
            obj["price_history"] = encode_buffer(s.price_history);
            obj["pocket_age"] = s.pocket_age;
            obj["in_pocket"] = s.in_pocket;
        },
        [&](const CorrelationState& s) {
            obj["capacity"] = s.leader.capacity();
            obj["leader"] = encode_buffer(s.leader);
            obj["follower"] = encode_buffer(s.follower);
            obj["history_capacity"] = s.correlation_history.capacity();
            obj["correlation_history"] = encode_buffer(s.correlation_history);
        },
    }, memory);
    return obj;
}

/// Returns false for an unrecognised kind. Throws on malformed fields.
bool decode(const json& obj, InstrumentMemory& out) {
    std::string kind = obj.value("kind", std::string());
    if (kind == "mean_reversion") {
        out = MeanReversionState{decode_ewma(obj)};
    } else if (kind == "spread") {
        out = SpreadState{decode_ewma(obj)};
    } else if (kind == "crossover") {
        CrossoverState s;
        s.short_ma = read_double(obj, "short_ma");
        s.long_ma = read_double(obj, "long_ma");
        s.samples = read_count(obj, "samples");
        s.prices = decode_buffer(obj, "prices", "capacity");
        out = std::move(s);
    } else if (kind == "pocket") {
        PocketState s;
        s.price_history = decode_buffer(obj, "price_history", "capacity");
        uint64_t age = read_count(obj, "pocket_age");
        if (age > UINT32_MAX) throw std::out_of_range("pocket_age is not a valid count");
        s.pocket_age = static_cast<uint32_t>(age);
        s.in_pocket = obj.value("in_pocket", false);
        out = std::move(s);
    } else if (kind == "correlation") {
        CorrelationState s;
        s.leader = decode_buffer(obj, "leader", "capacity");
        s.follower = decode_buffer(obj, "follower", "capacity");
        s.correlation_history = decode_buffer(obj, "correlation_history", "history_capacity");
        out = std::move(s);
    } else {
        return false;
    }
    return true;
}

} // anonymous namespace

const char* memory_kind(const InstrumentMemory& memory) noexcept {
    switch (memory.index()) {
        case 0: return "mean_reversion";
        case 1: return "crossover";
        case 2: return "pocket";
        case 3: return "spread";
        case 4: return "correlation";
        default: return "unknown";
    }
}

std::string StrategyMemory::serialize() const {
    json root = json::object();
    for (const auto& [key, memory] : entries_) {
        root[key] = encode(memory);
    }
    return root.dump();
}

StrategyMemory StrategyMemory::deserialize(std::string_view text) noexcept {
    StrategyMemory memory;
    if (text.empty()) return memory;

    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            LOG_WARN("strategy memory: discarding state that is not a JSON object");
            return memory;
        }
        for (const auto& [key, value] : root.items()) {
            InstrumentMemory entry;
            if (decode(value, entry)) {
                memory.entries_[key] = std::move(entry);
            } else {
                LOG_WARN("strategy memory: skipping entry '%s' with unknown kind", key.c_str());
            }
        }
    } catch (const json::exception& e) {
        LOG_WARN("strategy memory: discarding malformed state (%s)", e.what());
        return StrategyMemory{};
    } catch (const std::logic_error& e) {
        LOG_WARN("strategy memory: discarding malformed state (%s)", e.what());
        return StrategyMemory{};
    }
    return memory;
}

std::string pair_memory_key(const std::string& name) {
    return "pair:" + name;
}

std::string correlation_memory_key(const std::string& name) {
    return "corr:" + name;
}

} // namespace statarb
