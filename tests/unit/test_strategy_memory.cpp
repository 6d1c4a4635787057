#include <gtest/gtest.h>
#include "strategy/strategy_memory.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>

using namespace statarb;

class StrategyMemoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }
    void TearDown() override {
        Logger::instance().set_level(LogLevel::Info);
    }
};

TEST_F(StrategyMemoryTest, EmptyStringIsEmptyMemory) {
    auto memory = StrategyMemory::deserialize("");
    EXPECT_TRUE(memory.empty());
    EXPECT_EQ(memory.serialize(), "{}");
}

TEST_F(StrategyMemoryTest, MalformedInputNeverThrows) {
    for (const char* text : {"{", "not json", "[1,2,3]", "{\"a\": {\"kind\": 5}}",
                             "{\"a\": {\"kind\": \"pocket\", \"price_history\": \"x\"}}"}) {
        StrategyMemory memory;
        EXPECT_NO_THROW(memory = StrategyMemory::deserialize(text)) << text;
        EXPECT_TRUE(memory.empty()) << text;
    }
}

TEST_F(StrategyMemoryTest, UnknownKindSkipped) {
    auto memory = StrategyMemory::deserialize(
        "{\"X\": {\"kind\": \"future_thing\"}, \"Y\": {\"kind\": \"mean_reversion\", \"mean\": 5}}");
    EXPECT_EQ(memory.size(), 1u);
    ASSERT_NE(memory.find<MeanReversionState>("Y"), nullptr);
    EXPECT_DOUBLE_EQ(memory.find<MeanReversionState>("Y")->ewma.mean, 5.0);
}

TEST_F(StrategyMemoryTest, FindRejectsOtherFamily) {
    StrategyMemory memory;
    memory.set("KELP", CrossoverState{});
    EXPECT_NE(memory.find<CrossoverState>("KELP"), nullptr);
    EXPECT_EQ(memory.find<PocketState>("KELP"), nullptr);
    EXPECT_EQ(memory.find<CrossoverState>("RESIN"), nullptr);
}

TEST_F(StrategyMemoryTest, GetOrResetReplacesMismatchedFamily) {
    StrategyMemory memory;
    MeanReversionState mr;
    mr.ewma.mean = 42.0;
    memory.set("SQUID_INK", mr);

    auto& pocket = memory.get_or_reset<PocketState>("SQUID_INK");
    EXPECT_EQ(pocket.pocket_age, 0u);
    EXPECT_EQ(memory.find<MeanReversionState>("SQUID_INK"), nullptr);
}

TEST_F(StrategyMemoryTest, EveryFamilySurvivesRoundTrip) {
    StrategyMemory memory;

    MeanReversionState mr;
    mr.ewma = EwmaState{10000.123456789, 0.1 + 0.2, 17};
    memory.set("RAINFOREST_RESIN", mr);

    CrossoverState cross;
    cross.short_ma = 2031.5;
    cross.long_ma = 2029.25;
    cross.samples = 80;
    cross.prices = CircularBuffer<double>(4);
    for (double p : {1.0, 2.0, 3.0, 4.0, 5.0}) cross.prices.push_back(p);
    memory.set("KELP", cross);

    PocketState pocket;
    pocket.price_history = CircularBuffer<double>(200);
    pocket.price_history.push_back(1970.5);
    pocket.price_history.push_back(1971.0);
    pocket.pocket_age = 12;
    pocket.in_pocket = true;
    memory.set("SQUID_INK", pocket);

    SpreadState spread;
    spread.ewma = EwmaState{-3.25, 1.5, 4};
    memory.set(pair_memory_key("kelp_squid"), spread);

    CorrelationState corr;
    corr.leader = CircularBuffer<double>(20);
    corr.follower = CircularBuffer<double>(20);
    corr.correlation_history = CircularBuffer<double>(5);
    corr.leader.push_back(1.0);
    corr.follower.push_back(2.0);
    corr.correlation_history.push_back(-0.75);
    memory.set(correlation_memory_key("squid_kelp"), corr);

    std::string text = memory.serialize();
    auto restored = StrategyMemory::deserialize(text);
    EXPECT_EQ(restored.size(), 5u);
    EXPECT_EQ(restored.serialize(), text);

    const auto* r_mr = restored.find<MeanReversionState>("RAINFOREST_RESIN");
    ASSERT_NE(r_mr, nullptr);
    EXPECT_EQ(r_mr->ewma.mean, 10000.123456789);
    EXPECT_EQ(r_mr->ewma.variance, 0.1 + 0.2);
    EXPECT_EQ(r_mr->ewma.samples, 17u);

    const auto* r_cross = restored.find<CrossoverState>("KELP");
    ASSERT_NE(r_cross, nullptr);
    EXPECT_EQ(r_cross->prices.capacity(), 4u);
    EXPECT_EQ(r_cross->prices.front(), 2.0);
    EXPECT_EQ(r_cross->prices.back(), 5.0);

    const auto* r_pocket = restored.find<PocketState>("SQUID_INK");
    ASSERT_NE(r_pocket, nullptr);
    EXPECT_EQ(r_pocket->price_history.capacity(), 200u);
    EXPECT_EQ(r_pocket->pocket_age, 12u);
    EXPECT_TRUE(r_pocket->in_pocket);

    const auto* r_corr = restored.find<CorrelationState>("corr:squid_kelp");
    ASSERT_NE(r_corr, nullptr);
    EXPECT_EQ(r_corr->correlation_history.capacity(), 5u);
    EXPECT_EQ(r_corr->correlation_history.back(), -0.75);
}

TEST_F(StrategyMemoryTest, SerializedFormIsTaggedJson) {
    StrategyMemory memory;
    memory.set("X", SpreadState{});
    auto doc = nlohmann::json::parse(memory.serialize());
    ASSERT_TRUE(doc.contains("X"));
    EXPECT_EQ(doc["X"]["kind"].get<std::string>(), "spread");
}

TEST_F(StrategyMemoryTest, OutOfRangeCountsDiscardState) {
    for (const char* text : {
             "{\"a\": {\"kind\": \"mean_reversion\", \"samples\": 1e300}}",
             "{\"a\": {\"kind\": \"mean_reversion\", \"samples\": -3}}",
             "{\"a\": {\"kind\": \"spread\", \"samples\": 2.5}}",
             "{\"a\": {\"kind\": \"pocket\", \"pocket_age\": 5000000000}}",
             "{\"a\": {\"kind\": \"pocket\", \"capacity\": 1e12, \"price_history\": [1]}}"}) {
        StrategyMemory memory;
        EXPECT_NO_THROW(memory = StrategyMemory::deserialize(text)) << text;
        EXPECT_TRUE(memory.empty()) << text;
    }
}

TEST_F(StrategyMemoryTest, IntegralDoublesAcceptedAsCounts) {
    auto memory = StrategyMemory::deserialize(
        "{\"a\": {\"kind\": \"mean_reversion\", \"mean\": 1.5, \"samples\": 7.0}}");
    ASSERT_NE(memory.find<MeanReversionState>("a"), nullptr);
    EXPECT_EQ(memory.find<MeanReversionState>("a")->ewma.samples, 7u);
}
