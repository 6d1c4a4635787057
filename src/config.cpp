#include "common/config.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace statarb {

using json = nlohmann::json;

namespace {

void apply_replay_section(const json& section, ReplayConfig& replay) {
    if (!section.is_object()) throw std::runtime_error("replay must be an object");

    double depth = 0.0;
    std::string delimiter;
    try {
        replay.data_path = section.value("data_path", replay.data_path);
        replay.trade_log_path = section.value("trade_log_path", replay.trade_log_path);
        replay.log_path = section.value("log_path", replay.log_path);
        replay.log_level = section.value("log_level", replay.log_level);
        replay.enforce_position_limits =
            section.value("enforce_position_limits", replay.enforce_position_limits);
        depth = section.value("depth_levels", static_cast<double>(replay.depth_levels));
        delimiter = section.value("delimiter", std::string(1, replay.delimiter));
    } catch (const json::type_error& e) {
        throw std::runtime_error(std::string("replay: ") + e.what());
    }

    if (!(depth >= 1.0 && depth <= 3.0) || std::floor(depth) != depth) {
        throw std::runtime_error("replay.depth_levels must lie in [1, 3]");
    }
    replay.depth_levels = static_cast<size_t>(depth);

    if (delimiter.size() != 1) {
        throw std::runtime_error("replay.delimiter must be a single character");
    }
    replay.delimiter = delimiter[0];

    LogLevel level;
    if (!Logger::parse_level(replay.log_level, level)) {
        throw std::runtime_error("replay.log_level must be one of debug, info, warn, error");
    }
}

} // anonymous namespace

SystemConfig default_config() {
    SystemConfig config;
    config.strategy = default_strategy_config();
    return config;
}

SystemConfig parse_config(const std::string& text) {
    SystemConfig config = default_config();

    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
    }

    config.strategy = parse_strategy_config(root);
    if (auto replay = root.find("replay"); replay != root.end() && !replay->is_null()) {
        apply_replay_section(*replay, config.replay);
    }

    validate_strategy_config(config.strategy);
    return config;
}

SystemConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("config file '%s' not found, using built-in defaults", path.c_str());
        SystemConfig config = default_config();
        config.config_path = path;
        return config;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    SystemConfig config = parse_config(content);
    config.config_path = path;
    return config;
}

} // namespace statarb
