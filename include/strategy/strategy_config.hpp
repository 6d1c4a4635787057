#pragma once

#include "common/types.hpp"
#include "risk/position_limits.hpp"
#include "stats/ewma.hpp"
#include "stats/regime_detector.hpp"
#include "strategy/pair_arbitrage.hpp"
#include "strategy/signal_engine.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string_view>
#include <vector>

namespace statarb {

/// Single-instrument strategy families.
enum class StrategyKind : uint8_t {
    MeanReversion = 0,     // EWMA mean, trade the touch against it
    ZScoreReversion = 1,   // EWMA mean/dispersion, trade z-score breakouts
    Crossover = 2,         // dual moving averages
    PocketRegime = 3       // stable-pocket range trading, flatten on exit
};

const char* strategy_kind_name(StrategyKind kind) noexcept;
bool parse_strategy_kind(std::string_view name, StrategyKind& out) noexcept;

struct InstrumentConfig {
    Symbol symbol;
    StrategyKind kind = StrategyKind::MeanReversion;
    EwmaEstimator::Params ewma;
    double entry_z = 1.0;
    SignalEngine::CrossoverParams crossover;
    RegimeDetector::Params regime;
    SignalEngine::PocketParams pocket;
    SignalEngine::QuoteParams quoting;
};

/// Everything a StrategyEngine needs, passed in at construction.
struct StrategyConfig {
    PositionLimits limits;
    std::vector<InstrumentConfig> instruments;
    std::vector<SpreadPairConfig> pairs;
    std::vector<BasketConfig> baskets;
    std::vector<CorrelationConfig> correlations;
    int conversions = 1;
};

/// Throws std::invalid_argument naming the first offending field.
void validate_strategy_config(const StrategyConfig& config);

/// Build from a parsed JSON document; absent members keep their defaults.
/// Throws std::runtime_error on members of the wrong type or unknown names.
StrategyConfig parse_strategy_config(const nlohmann::json& root);

/// Research setup: RAINFOREST_RESIN mean reversion with quoting, KELP EMA
/// crossover, SQUID_INK pocket trading, both picnic baskets.
StrategyConfig default_strategy_config();

} // namespace statarb
