#pragma once

#include "strategy/strategy_interface.hpp"
#include "strategy/strategy_config.hpp"
#include "strategy/strategy_memory.hpp"
#include "strategy/pair_arbitrage.hpp"

namespace statarb {

/// StrategyEngine: the configured research strategy behind the tick contract.
/// Per tick:
///   decode memory -> mids (skip instruments without liquidity)
///   -> single-instrument rules -> pair spreads -> baskets
///   -> correlation rules -> collect orders -> encode memory
/// The engine holds no cross-tick state of its own.
class StrategyEngine : public StrategyInterface {
public:
    /// Validates `config`; throws std::invalid_argument on a bad field.
    explicit StrategyEngine(StrategyConfig config);

    TickResult run(const TradingState& state) override;
    std::string_view name() const override { return "StatArbEngine"; }

    const StrategyConfig& config() const noexcept { return config_; }

private:
    void run_instrument(const InstrumentConfig& inst, const BookSnapshot& book, double mid,
                        StrategyMemory& memory, OrderSink& sink);

    StrategyConfig config_;
};

} // namespace statarb
