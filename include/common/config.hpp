#pragma once

#include "common/types.hpp"
#include "strategy/strategy_config.hpp"
#include <string>

namespace statarb {

struct ReplayConfig {
    std::string data_path;
    std::string trade_log_path;          // empty: no trade log written
    std::string log_path;                // empty: log to stderr
    std::string log_level = "info";
    size_t depth_levels = 3;             // book levels per side, 1..3
    char delimiter = ';';                // overridden when the header says otherwise
    bool enforce_position_limits = false;   // false: audit and warn only
};

struct SystemConfig {
    StrategyConfig strategy;
    ReplayConfig replay;
    std::string config_path;
};

/// Read a JSON config file on top of default_config(). A missing file yields
/// the defaults (with a warning); a malformed one throws std::runtime_error.
/// The strategy section is validated (std::invalid_argument on a bad field).
SystemConfig load_config(const std::string& path);

/// Parse config text directly (same rules as load_config).
SystemConfig parse_config(const std::string& text);

SystemConfig default_config();

} // namespace statarb
