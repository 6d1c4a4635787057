#include "strategy/strategy_config.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>

namespace statarb {

using json = nlohmann::json;

namespace {

[[noreturn]] void invalid(const std::string& field, const std::string& what) {
    throw std::invalid_argument(field + " " + what);
}

// Largest integer config value accepted; beyond it a double no longer holds
// every integer exactly.
constexpr double MAX_CONFIG_INTEGER = 9.0e15;

// Typed member readers that name the member on a type mismatch.

const json* member(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

double read_number(const json& obj, const char* key, double fallback, const std::string& ctx) {
    const json* v = member(obj, key);
    if (v == nullptr) return fallback;
    if (!v->is_number()) throw std::runtime_error(ctx + "." + key + " must be a number");
    return v->get<double>();
}

int64_t read_int(const json& obj, const char* key, int64_t fallback, const std::string& ctx) {
    double d = read_number(obj, key, static_cast<double>(fallback), ctx);
    if (!(std::fabs(d) <= MAX_CONFIG_INTEGER)) {
        throw std::runtime_error(ctx + "." + key + " is out of range");
    }
    if (std::floor(d) != d) throw std::runtime_error(ctx + "." + key + " must be an integer");
    return static_cast<int64_t>(d);
}

size_t read_size(const json& obj, const char* key, size_t fallback, const std::string& ctx) {
    int64_t v = read_int(obj, key, static_cast<int64_t>(fallback), ctx);
    if (v < 0) throw std::runtime_error(ctx + "." + key + " must be non-negative");
    return static_cast<size_t>(v);
}

bool read_bool(const json& obj, const char* key, bool fallback, const std::string& ctx) {
    const json* v = member(obj, key);
    if (v == nullptr) return fallback;
    if (!v->is_boolean()) throw std::runtime_error(ctx + "." + key + " must be a boolean");
    return v->get<bool>();
}

std::string read_string(const json& obj, const char* key, const std::string& fallback,
                        const std::string& ctx) {
    const json* v = member(obj, key);
    if (v == nullptr) return fallback;
    if (!v->is_string()) throw std::runtime_error(ctx + "." + key + " must be a string");
    return v->get<std::string>();
}

const json* read_object(const json& obj, const char* key, const std::string& ctx) {
    const json* v = member(obj, key);
    if (v != nullptr && !v->is_object()) throw std::runtime_error(ctx + "." + key + " must be an object");
    return v;
}

const json* read_array(const json& obj, const char* key, const std::string& ctx) {
    const json* v = member(obj, key);
    if (v != nullptr && !v->is_array()) throw std::runtime_error(ctx + "." + key + " must be an array");
    return v;
}

EwmaEstimator::Params parse_ewma(const json& obj, EwmaEstimator::Params p,
                                 const std::string& ctx) {
    p.alpha = read_number(obj, "alpha", p.alpha, ctx);
    p.dispersion_floor = read_number(obj, "floor", p.dispersion_floor, ctx);
    p.initial_variance = read_number(obj, "initial_variance", p.initial_variance, ctx);

    std::string mode = read_string(obj, "dispersion",
        p.mode == DispersionMode::SquaredDeviation ? "squared" : "absolute", ctx);
    if (mode == "squared") {
        p.mode = DispersionMode::SquaredDeviation;
    } else if (mode == "absolute") {
        p.mode = DispersionMode::AbsoluteDeviation;
    } else {
        throw std::runtime_error(ctx + ".dispersion must be \"squared\" or \"absolute\"");
    }
    return p;
}

SignalEngine::CrossoverParams parse_crossover(const json& obj, const std::string& ctx) {
    SignalEngine::CrossoverParams p;
    std::string type = read_string(obj, "type", "exponential", ctx);
    if (type == "simple") {
        p.type = MaType::Simple;
    } else if (type == "exponential") {
        p.type = MaType::Exponential;
    } else {
        throw std::runtime_error(ctx + ".type must be \"simple\" or \"exponential\"");
    }
    p.short_window = read_size(obj, "short_window", p.short_window, ctx);
    p.long_window = read_size(obj, "long_window", p.long_window, ctx);
    p.short_alpha = read_number(obj, "short_alpha", p.short_alpha, ctx);
    p.long_alpha = read_number(obj, "long_alpha", p.long_alpha, ctx);
    p.band = read_number(obj, "band", p.band, ctx);
    p.fair_short_weight = read_number(obj, "fair_short_weight", p.fair_short_weight, ctx);
    return p;
}

RegimeDetector::Params parse_regime(const json& obj, const std::string& ctx) {
    RegimeDetector::Params p;
    p.window = read_size(obj, "window", p.window, ctx);
    p.min_activity_std = read_number(obj, "min_activity_std", p.min_activity_std, ctx);
    p.mean_duration = read_number(obj, "mean_duration", p.mean_duration, ctx);
    p.std_duration = read_number(obj, "std_duration", p.std_duration, ctx);
    p.horizon = read_number(obj, "horizon", p.horizon, ctx);
    p.history_capacity = read_size(obj, "history_capacity", p.history_capacity, ctx);
    return p;
}

SignalEngine::QuoteParams parse_quoting(const json& obj, const std::string& ctx) {
    SignalEngine::QuoteParams p;
    p.enabled = read_bool(obj, "enabled", true, ctx);
    p.base_spread = read_number(obj, "base_spread", p.base_spread, ctx);
    p.base_size = read_int(obj, "base_size", p.base_size, ctx);
    p.skew = read_number(obj, "skew", p.skew, ctx);
    p.widen = read_number(obj, "widen", p.widen, ctx);
    return p;
}

InstrumentConfig parse_instrument(const json& obj, const std::string& ctx) {
    if (!obj.is_object()) throw std::runtime_error(ctx + " must be an object");

    InstrumentConfig inst;
    inst.symbol = read_string(obj, "symbol", "", ctx);
    std::string kind = read_string(obj, "strategy", strategy_kind_name(inst.kind), ctx);
    if (!parse_strategy_kind(kind, inst.kind)) {
        throw std::runtime_error(ctx + ".strategy: unknown strategy '" + kind + "'");
    }
    inst.entry_z = read_number(obj, "entry_z", inst.entry_z, ctx);

    if (const json* s = read_object(obj, "ewma", ctx)) {
        inst.ewma = parse_ewma(*s, inst.ewma, ctx + ".ewma");
    }
    if (const json* s = read_object(obj, "crossover", ctx)) {
        inst.crossover = parse_crossover(*s, ctx + ".crossover");
    }
    if (const json* s = read_object(obj, "regime", ctx)) {
        inst.regime = parse_regime(*s, ctx + ".regime");
    }
    if (const json* s = read_object(obj, "pocket", ctx)) {
        inst.pocket.base_size = read_int(*s, "base_size", inst.pocket.base_size, ctx + ".pocket");
        inst.pocket.entry_std = read_number(*s, "entry_std", inst.pocket.entry_std, ctx + ".pocket");
    }
    if (const json* s = read_object(obj, "quoting", ctx)) {
        inst.quoting = parse_quoting(*s, ctx + ".quoting");
    }
    return inst;
}

SpreadPairConfig parse_pair(const json& obj, const std::string& ctx) {
    if (!obj.is_object()) throw std::runtime_error(ctx + " must be an object");

    SpreadPairConfig pair;
    pair.name = read_string(obj, "name", "", ctx);
    pair.leg_a = read_string(obj, "leg_a", "", ctx);
    pair.leg_b = read_string(obj, "leg_b", "", ctx);
    pair.hedge_ratio = read_number(obj, "hedge_ratio", pair.hedge_ratio, ctx);
    pair.entry_z = read_number(obj, "entry_z", pair.entry_z, ctx);
    pair.trade_leg_a = read_bool(obj, "trade_leg_a", pair.trade_leg_a, ctx);
    pair.trade_leg_b = read_bool(obj, "trade_leg_b", pair.trade_leg_b, ctx);
    if (const json* s = read_object(obj, "ewma", ctx)) {
        pair.ewma = parse_ewma(*s, pair.ewma, ctx + ".ewma");
    }
    return pair;
}

BasketConfig parse_basket(const json& obj, const std::string& ctx) {
    if (!obj.is_object()) throw std::runtime_error(ctx + " must be an object");

    BasketConfig basket;
    basket.name = read_string(obj, "name", "", ctx);
    basket.basket = read_string(obj, "basket", "", ctx);
    basket.edge = read_number(obj, "edge", basket.edge, ctx);
    if (const json* s = read_object(obj, "components", ctx)) {
        for (auto it = s->begin(); it != s->end(); ++it) {
            basket.components.push_back(
                {it.key(), read_int(*s, it.key().c_str(), 0, ctx + ".components")});
        }
    }
    return basket;
}

CorrelationConfig parse_correlation(const json& obj, const std::string& ctx) {
    if (!obj.is_object()) throw std::runtime_error(ctx + " must be an object");

    CorrelationConfig corr;
    corr.name = read_string(obj, "name", "", ctx);
    corr.leader = read_string(obj, "leader", "", ctx);
    corr.follower = read_string(obj, "follower", "", ctx);
    corr.window = read_size(obj, "window", corr.window, ctx);
    corr.short_window = read_size(obj, "short_window", corr.short_window, ctx);
    corr.min_samples = read_size(obj, "min_samples", corr.min_samples, ctx);
    corr.threshold = read_number(obj, "threshold", corr.threshold, ctx);
    corr.scale_factor = read_number(obj, "scale_factor", corr.scale_factor, ctx);
    return corr;
}

template<typename Fn>
auto rethrow_with_context(const std::string& ctx, Fn&& fn) {
    try {
        return fn();
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(ctx + "." + e.what());
    }
}

void validate_instrument(const InstrumentConfig& inst, const std::string& ctx) {
    if (inst.symbol.empty()) invalid(ctx + ".symbol", "must not be empty");

    switch (inst.kind) {
        case StrategyKind::MeanReversion:
        case StrategyKind::ZScoreReversion:
            rethrow_with_context(ctx, [&] { EwmaEstimator::validate(inst.ewma); });
            if (inst.kind == StrategyKind::ZScoreReversion && !(inst.entry_z > 0.0)) {
                invalid(ctx + ".entry_z", "must be positive");
            }
            break;
        case StrategyKind::Crossover:
            rethrow_with_context(ctx, [&] { validate_crossover_params(inst.crossover); });
            break;
        case StrategyKind::PocketRegime:
            rethrow_with_context(ctx, [&] { RegimeDetector::validate(inst.regime); });
            if (inst.pocket.base_size < 0) invalid(ctx + ".pocket.base_size", "must be non-negative");
            if (!(inst.pocket.entry_std >= 0.0)) invalid(ctx + ".pocket.entry_std", "must be non-negative");
            break;
    }

    if (inst.quoting.enabled) {
        if (!(inst.quoting.base_spread > 0.0)) invalid(ctx + ".quoting.base_spread", "must be positive");
        if (inst.quoting.base_size < 0) invalid(ctx + ".quoting.base_size", "must be non-negative");
        if (!(inst.quoting.skew >= 0.0)) invalid(ctx + ".quoting.skew", "must be non-negative");
        if (!(inst.quoting.widen >= 0.0)) invalid(ctx + ".quoting.widen", "must be non-negative");
    }
}

} // anonymous namespace

const char* strategy_kind_name(StrategyKind kind) noexcept {
    switch (kind) {
        case StrategyKind::MeanReversion:   return "mean_reversion";
        case StrategyKind::ZScoreReversion: return "zscore_reversion";
        case StrategyKind::Crossover:       return "crossover";
        case StrategyKind::PocketRegime:    return "pocket";
    }
    return "unknown";
}

bool parse_strategy_kind(std::string_view name, StrategyKind& out) noexcept {
    if (name == "mean_reversion")   { out = StrategyKind::MeanReversion;   return true; }
    if (name == "zscore_reversion") { out = StrategyKind::ZScoreReversion; return true; }
    if (name == "crossover")        { out = StrategyKind::Crossover;       return true; }
    if (name == "pocket")           { out = StrategyKind::PocketRegime;    return true; }
    return false;
}

void validate_strategy_config(const StrategyConfig& config) {
    if (config.limits.default_limit() < 0) invalid("position_limits.default", "must be non-negative");
    for (const auto& [symbol, limit] : config.limits.overrides()) {
        if (limit < 0) invalid("position_limits." + symbol, "must be non-negative");
    }

    std::set<Symbol> seen;
    for (const auto& inst : config.instruments) {
        std::string ctx = "instruments[" + inst.symbol + "]";
        validate_instrument(inst, ctx);
        if (!seen.insert(inst.symbol).second) invalid(ctx, "is configured more than once");
    }

    std::set<std::string> names;
    for (const auto& pair : config.pairs) {
        std::string ctx = "pairs[" + pair.name + "]";
        if (pair.name.empty()) invalid("pairs[].name", "must not be empty");
        if (!names.insert("pair:" + pair.name).second) invalid(ctx, "is configured more than once");
        if (pair.leg_a.empty() || pair.leg_b.empty()) invalid(ctx + ".leg_a/leg_b", "must not be empty");
        if (pair.leg_a == pair.leg_b) invalid(ctx + ".leg_b", "must differ from leg_a");
        if (!std::isfinite(pair.hedge_ratio) || pair.hedge_ratio == 0.0) {
            invalid(ctx + ".hedge_ratio", "must be finite and non-zero");
        }
        if (!(pair.entry_z > 0.0)) invalid(ctx + ".entry_z", "must be positive");
        rethrow_with_context(ctx, [&] { EwmaEstimator::validate(pair.ewma); });
    }

    for (const auto& basket : config.baskets) {
        std::string ctx = "baskets[" + basket.name + "]";
        if (basket.basket.empty()) invalid(ctx + ".basket", "must not be empty");
        if (basket.components.empty()) invalid(ctx + ".components", "must not be empty");
        if (!(basket.edge >= 0.0)) invalid(ctx + ".edge", "must be non-negative");
        std::set<Symbol> parts;
        for (const auto& component : basket.components) {
            std::string cctx = ctx + ".components." + component.symbol;
            if (component.symbol == basket.basket) invalid(cctx, "must not be the basket itself");
            if (component.weight <= 0) invalid(cctx, "weight must be positive");
            if (!parts.insert(component.symbol).second) invalid(cctx, "is listed more than once");
        }
    }

    for (const auto& corr : config.correlations) {
        std::string ctx = "correlations[" + corr.name + "]";
        if (corr.name.empty()) invalid("correlations[].name", "must not be empty");
        if (!names.insert("corr:" + corr.name).second) invalid(ctx, "is configured more than once");
        if (corr.leader.empty() || corr.follower.empty()) invalid(ctx + ".leader/follower", "must not be empty");
        if (corr.leader == corr.follower) invalid(ctx + ".follower", "must differ from leader");
        if (corr.window < 2) invalid(ctx + ".window", "must be >= 2");
        if (corr.short_window < 1) invalid(ctx + ".short_window", "must be >= 1");
        if (corr.min_samples < 2 || corr.min_samples > corr.window) {
            invalid(ctx + ".min_samples", "must lie in [2, window]");
        }
        if (!(corr.threshold >= 0.0 && corr.threshold < 1.0)) invalid(ctx + ".threshold", "must lie in [0, 1)");
        if (!(corr.scale_factor >= 0.0)) invalid(ctx + ".scale_factor", "must be non-negative");
    }
}

StrategyConfig parse_strategy_config(const json& root) {
    if (!root.is_object()) throw std::runtime_error("config root must be an object");

    StrategyConfig config = default_strategy_config();

    if (const json* s = read_object(root, "position_limits", "config")) {
        PositionLimits limits(read_int(*s, "default", PositionLimits::DEFAULT_LIMIT, "position_limits"));
        for (auto it = s->begin(); it != s->end(); ++it) {
            if (it.key() == "default") continue;
            limits.set(it.key(), read_int(*s, it.key().c_str(), 0, "position_limits"));
        }
        config.limits = limits;
    }

    int64_t conversions = read_int(root, "conversions", config.conversions, "config");
    if (conversions < INT32_MIN || conversions > INT32_MAX) {
        throw std::runtime_error("config.conversions is out of range");
    }
    config.conversions = static_cast<int>(conversions);

    // Sections that are present replace the defaults wholesale.
    if (const json* s = read_array(root, "instruments", "config")) {
        config.instruments.clear();
        for (size_t i = 0; i < s->size(); ++i) {
            config.instruments.push_back(
                parse_instrument((*s)[i], "instruments[" + std::to_string(i) + "]"));
        }
    }
    if (const json* s = read_array(root, "pairs", "config")) {
        config.pairs.clear();
        for (size_t i = 0; i < s->size(); ++i) {
            config.pairs.push_back(parse_pair((*s)[i], "pairs[" + std::to_string(i) + "]"));
        }
    }
    if (const json* s = read_array(root, "baskets", "config")) {
        config.baskets.clear();
        for (size_t i = 0; i < s->size(); ++i) {
            config.baskets.push_back(parse_basket((*s)[i], "baskets[" + std::to_string(i) + "]"));
        }
    }
    if (const json* s = read_array(root, "correlations", "config")) {
        config.correlations.clear();
        for (size_t i = 0; i < s->size(); ++i) {
            config.correlations.push_back(
                parse_correlation((*s)[i], "correlations[" + std::to_string(i) + "]"));
        }
    }
    return config;
}

StrategyConfig default_strategy_config() {
    StrategyConfig config;

    config.limits.set("RAINFOREST_RESIN", 50);
    config.limits.set("KELP", 50);
    config.limits.set("SQUID_INK", 50);
    config.limits.set("CROISSANTS", 250);
    config.limits.set("JAMS", 350);
    config.limits.set("DJEMBES", 60);
    config.limits.set("PICNIC_BASKET1", 60);
    config.limits.set("PICNIC_BASKET2", 100);

    InstrumentConfig resin;
    resin.symbol = "RAINFOREST_RESIN";
    resin.kind = StrategyKind::MeanReversion;
    resin.ewma.alpha = 0.1;
    resin.quoting.enabled = true;
    resin.quoting.base_spread = 1.0;
    resin.quoting.base_size = 10;
    config.instruments.push_back(resin);

    InstrumentConfig kelp;
    kelp.symbol = "KELP";
    kelp.kind = StrategyKind::Crossover;
    kelp.crossover.type = MaType::Exponential;
    kelp.crossover.short_alpha = 0.3;
    kelp.crossover.long_alpha = 0.1;
    config.instruments.push_back(kelp);

    InstrumentConfig squid;
    squid.symbol = "SQUID_INK";
    squid.kind = StrategyKind::PocketRegime;
    config.instruments.push_back(squid);

    BasketConfig pb1;
    pb1.name = "pb1";
    pb1.basket = "PICNIC_BASKET1";
    pb1.components = {{"CROISSANTS", 6}, {"JAMS", 3}, {"DJEMBES", 1}};
    config.baskets.push_back(pb1);

    BasketConfig pb2;
    pb2.name = "pb2";
    pb2.basket = "PICNIC_BASKET2";
    pb2.components = {{"CROISSANTS", 4}, {"JAMS", 2}};
    config.baskets.push_back(pb2);

    return config;
}

} // namespace statarb
