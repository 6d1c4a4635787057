#pragma once

#include "common/types.hpp"
#include <map>

namespace statarb {

/// Static per-instrument position bounds. Symbols without an explicit entry
/// use the default bound. A limit bounds |position| from both sides.
class PositionLimits {
public:
    static constexpr Quantity DEFAULT_LIMIT = 50;

    explicit PositionLimits(Quantity default_limit = DEFAULT_LIMIT)
        : default_limit_(default_limit) {}

    void set(const Symbol& symbol, Quantity limit) { limits_[symbol] = limit; }
    void set_default(Quantity limit) noexcept { default_limit_ = limit; }

    Quantity limit_for(const Symbol& symbol) const noexcept {
        auto it = limits_.find(symbol);
        return it != limits_.end() ? it->second : default_limit_;
    }

    Quantity default_limit() const noexcept { return default_limit_; }
    const std::map<Symbol, Quantity>& overrides() const noexcept { return limits_; }

private:
    Quantity default_limit_;
    std::map<Symbol, Quantity> limits_;
};

} // namespace statarb
