#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "stock_advisor/strategy/strategy_types.hpp"

using namespace stock_advisor;
using namespace stock_advisor::testing;

class StrategyTypesTest : public TestBase {};

TEST_F(StrategyTypesTest, ParsesDisplayNames) {
    auto result = parse_strategy("Growth Investing");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), Strategy::GROWTH);

    auto index = parse_strategy("Index Investing");
    ASSERT_TRUE(index.is_ok());
    EXPECT_EQ(index.value(), Strategy::INDEX);
}

TEST_F(StrategyTypesTest, ParsesShortKeysCaseInsensitively) {
    auto quality = parse_strategy("quality");
    ASSERT_TRUE(quality.is_ok());
    EXPECT_EQ(quality.value(), Strategy::QUALITY);

    auto value = parse_strategy("  VALUE investing ");
    ASSERT_TRUE(value.is_ok());
    EXPECT_EQ(value.value(), Strategy::VALUE);
}

TEST_F(StrategyTypesTest, UnknownNameIsRejected) {
    auto result = parse_strategy("Momentum Investing");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_STRATEGY);
    EXPECT_NE(std::string(result.error()->what()).find("Momentum Investing"),
              std::string::npos);
}

TEST_F(StrategyTypesTest, ParseStrategiesStopsAtFirstUnknown) {
    auto ok = parse_strategies({"Ethical Investing", "index"});
    ASSERT_TRUE(ok.is_ok());
    ASSERT_EQ(ok.value().size(), 2u);
    EXPECT_EQ(ok.value()[0], Strategy::ETHICAL);
    EXPECT_EQ(ok.value()[1], Strategy::INDEX);

    auto bad = parse_strategies({"Growth Investing", "Crypto"});
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error()->code(), ErrorCode::INVALID_STRATEGY);
}

TEST_F(StrategyTypesTest, NamesRoundTripThroughParser) {
    for (Strategy strategy : all_strategies()) {
        auto by_name = parse_strategy(strategy_to_string(strategy));
        ASSERT_TRUE(by_name.is_ok());
        EXPECT_EQ(by_name.value(), strategy);

        auto by_key = parse_strategy(strategy_key(strategy));
        ASSERT_TRUE(by_key.is_ok());
        EXPECT_EQ(by_key.value(), strategy);
    }
}

TEST_F(StrategyTypesTest, ResolutionModeStrings) {
    EXPECT_EQ(resolution_mode_to_string(ResolutionMode::STATIC), "STATIC");
    EXPECT_EQ(resolution_mode_from_string("static"), ResolutionMode::STATIC);
    EXPECT_EQ(resolution_mode_from_string("DYNAMIC"), ResolutionMode::DYNAMIC);
    EXPECT_EQ(resolution_mode_from_string("bogus", ResolutionMode::STATIC),
              ResolutionMode::STATIC);
}
