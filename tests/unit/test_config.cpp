#include <gtest/gtest.h>
#include "common/config.hpp"
#include <stdexcept>
#include <string>

using namespace statarb;

namespace {

std::string error_of(const std::string& text) {
    try {
        parse_config(text);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST(ConfigTest, DefaultsAreValid) {
    SystemConfig config = default_config();
    EXPECT_NO_THROW(validate_strategy_config(config.strategy));
    EXPECT_EQ(config.replay.depth_levels, 3u);
    EXPECT_EQ(config.replay.delimiter, ';');
    EXPECT_FALSE(config.replay.enforce_position_limits);
    EXPECT_EQ(config.strategy.conversions, 1);
}

TEST(ConfigTest, DefaultLimitsTable) {
    const PositionLimits& limits = default_config().strategy.limits;
    EXPECT_EQ(limits.limit_for("CROISSANTS"), 250);
    EXPECT_EQ(limits.limit_for("JAMS"), 350);
    EXPECT_EQ(limits.limit_for("DJEMBES"), 60);
    EXPECT_EQ(limits.limit_for("PICNIC_BASKET1"), 60);
    EXPECT_EQ(limits.limit_for("PICNIC_BASKET2"), 100);
    EXPECT_EQ(limits.limit_for("UNLISTED"), 50);
}

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    SystemConfig config = parse_config("{}");
    EXPECT_EQ(config.strategy.instruments.size(), default_config().strategy.instruments.size());
    EXPECT_EQ(config.strategy.baskets.size(), 2u);
}

TEST(ConfigTest, ReplaySection) {
    SystemConfig config = parse_config(R"({
        "replay": {"data_path": "d.csv", "trade_log_path": "t.csv", "log_level": "debug",
                   "depth_levels": 2, "delimiter": ",", "enforce_position_limits": true}
    })");
    EXPECT_EQ(config.replay.data_path, "d.csv");
    EXPECT_EQ(config.replay.trade_log_path, "t.csv");
    EXPECT_EQ(config.replay.log_level, "debug");
    EXPECT_EQ(config.replay.depth_levels, 2u);
    EXPECT_EQ(config.replay.delimiter, ',');
    EXPECT_TRUE(config.replay.enforce_position_limits);
}

TEST(ConfigTest, ReplaySectionRangeChecks) {
    EXPECT_NE(error_of(R"({"replay": {"depth_levels": 4}})").find("depth_levels"), std::string::npos);
    EXPECT_NE(error_of(R"({"replay": {"delimiter": ";;"}})").find("delimiter"), std::string::npos);
    EXPECT_NE(error_of(R"({"replay": {"log_level": "loud"}})").find("log_level"), std::string::npos);
}

TEST(ConfigTest, InstrumentsReplaceDefaults) {
    SystemConfig config = parse_config(R"({
        "position_limits": {"default": 20, "KELP": 30},
        "instruments": [
            {"symbol": "KELP", "strategy": "zscore_reversion", "entry_z": 1.5,
             "ewma": {"alpha": 0.2, "dispersion": "absolute", "floor": 0.5}}
        ]
    })");
    ASSERT_EQ(config.strategy.instruments.size(), 1u);
    const InstrumentConfig& kelp = config.strategy.instruments[0];
    EXPECT_EQ(kelp.kind, StrategyKind::ZScoreReversion);
    EXPECT_DOUBLE_EQ(kelp.entry_z, 1.5);
    EXPECT_DOUBLE_EQ(kelp.ewma.alpha, 0.2);
    EXPECT_EQ(kelp.ewma.mode, DispersionMode::AbsoluteDeviation);
    EXPECT_DOUBLE_EQ(kelp.ewma.dispersion_floor, 0.5);
    EXPECT_EQ(config.strategy.limits.limit_for("KELP"), 30);
    EXPECT_EQ(config.strategy.limits.limit_for("OTHER"), 20);
    // Sections not mentioned keep the built-in setup
    EXPECT_EQ(config.strategy.baskets.size(), 2u);
}

TEST(ConfigTest, BasketComponentsFromObject) {
    SystemConfig config = parse_config(R"({
        "baskets": [{"name": "b", "basket": "B", "components": {"X": 2, "Y": 1}, "edge": 3}]
    })");
    ASSERT_EQ(config.strategy.baskets.size(), 1u);
    const BasketConfig& b = config.strategy.baskets[0];
    EXPECT_EQ(b.basket, "B");
    EXPECT_EQ(b.components.size(), 2u);
    EXPECT_DOUBLE_EQ(b.edge, 3.0);
}

TEST(ConfigTest, MalformedJsonIsRuntimeError) {
    EXPECT_THROW(parse_config("{\"instruments\": ["), std::runtime_error);
    EXPECT_THROW(parse_config("[]"), std::runtime_error);
}

TEST(ConfigTest, WrongMemberTypeNamesField) {
    std::string err = error_of(R"({"instruments": [{"symbol": "KELP", "entry_z": "high"}]})");
    EXPECT_NE(err.find("entry_z"), std::string::npos);
}

TEST(ConfigTest, HugeIntegerMembersRejected) {
    std::string err = error_of(R"({"position_limits": {"KELP": 1e300}})");
    EXPECT_NE(err.find("position_limits.KELP"), std::string::npos);
    EXPECT_NE(err.find("out of range"), std::string::npos);

    err = error_of(R"({"instruments": [{"symbol": "KELP", "strategy": "crossover",
                      "crossover": {"type": "simple", "long_window": -1e300}}]})");
    EXPECT_NE(err.find("long_window"), std::string::npos);

    EXPECT_THROW(parse_config(R"({"conversions": 1e12})"), std::runtime_error);
    EXPECT_THROW(parse_config(R"({"replay": {"depth_levels": 1e300}})"), std::runtime_error);
}

TEST(ConfigTest, FractionalIntegerMemberRejected) {
    std::string err = error_of(R"({"baskets": [{"name": "b", "basket": "B",
                                               "components": {"X": 1.5}}]})");
    EXPECT_NE(err.find("components.X"), std::string::npos);
}

TEST(ConfigTest, UnknownStrategyRejected) {
    EXPECT_THROW(parse_config(R"({"instruments": [{"symbol": "KELP", "strategy": "magic"}]})"),
                 std::runtime_error);
}

TEST(ConfigTest, ValidationNamesBadField) {
    std::string err = error_of(R"({"instruments": [
        {"symbol": "KELP", "strategy": "crossover",
         "crossover": {"type": "simple", "short_window": 20, "long_window": 10}}]})");
    EXPECT_NE(err.find("instruments[KELP]"), std::string::npos);
    EXPECT_NE(err.find("long_window"), std::string::npos);

    err = error_of(R"({"instruments": [{"symbol": "A", "ewma": {"alpha": 1.5}}]})");
    EXPECT_NE(err.find("alpha"), std::string::npos);
}

TEST(ConfigTest, ValidationRejectsStructuralMistakes) {
    StrategyConfig config = default_strategy_config();
    config.instruments.push_back(config.instruments.front());
    EXPECT_THROW(validate_strategy_config(config), std::invalid_argument);

    config = default_strategy_config();
    config.baskets.front().components.push_back({config.baskets.front().basket, 1});
    EXPECT_THROW(validate_strategy_config(config), std::invalid_argument);

    config = default_strategy_config();
    config.limits.set("KELP", -1);
    EXPECT_THROW(validate_strategy_config(config), std::invalid_argument);
}

TEST(ConfigTest, MissingFileFallsBackToDefaults) {
    SystemConfig config = load_config("/nonexistent/statarb/config.json");
    EXPECT_EQ(config.config_path, "/nonexistent/statarb/config.json");
    EXPECT_EQ(config.strategy.instruments.size(), default_config().strategy.instruments.size());
}
