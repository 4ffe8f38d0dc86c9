#include <gtest/gtest.h>
#include "MeanReversion/MeanReversionStrategy.hpp"
#include "TestBars.hpp"

using namespace PaperPerp::Strategy;
using namespace PaperPerp::Strategy::MeanReversion;
using namespace PaperPerp::Strategy::Testing;
using PaperPerp::Dto::Direction;
using PaperPerp::Utils::Numeric::Decimal;

// closes 100, 101, ... 119 then `last`
static MarketView risingThen(double last) {
    std::vector<double> values;
    for (int i = 0; i < 20; ++i) values.push_back(100.0 + i);
    values.push_back(last);
    MarketView view;
    view.symbol = "ETHUSDT";
    view.bars = closes(values);
    view.now = view.bars.back().Timestamp;
    return view;
}

// closes 200, 199, ... 181 then `last`
static MarketView fallingThen(double last) {
    std::vector<double> values;
    for (int i = 0; i < 20; ++i) values.push_back(200.0 - i);
    values.push_back(last);
    MarketView view;
    view.symbol = "ETHUSDT";
    view.bars = closes(values);
    view.now = view.bars.back().Timestamp;
    return view;
}

static MarketView priceAt(double close, long long now) {
    MarketView view;
    view.symbol = "ETHUSDT";
    view.bars = flat(20, close);
    view.now = now;
    return view;
}

static PositionView position(Direction direction, double entry, double size) {
    PositionView p;
    p.id = 7;
    p.symbol = "ETHUSDT";
    p.direction = direction;
    p.entry_price = Decimal(entry);
    p.size = Decimal(size);
    p.opened_at = 0;
    return p;
}

TEST(MeanReversionStrategyTest, ShortsFailedUpImpulseWhenOverbought) {
    MeanReversionStrategy strategy;
    auto decision = strategy.evaluate(risingThen(118.0), std::nullopt);

    ASSERT_TRUE(is_open(decision));
    const auto& open = std::get<OpenDecision>(decision);
    EXPECT_EQ(open.direction, Direction::Short);
    EXPECT_GT(*open.stop_loss, 118.0);
    EXPECT_LT(*open.take_profit, 118.0);
    // every bar ranges 2 against the previous close: 2 x ATR beats the 2% floor
    EXPECT_NEAR(*open.stop_loss, 122.0, 1e-9);
    EXPECT_NEAR(*open.take_profit, 112.0, 1e-9);
}

TEST(MeanReversionStrategyTest, LongsFailedDownImpulseWhenOversold) {
    MeanReversionStrategy strategy;
    auto decision = strategy.evaluate(fallingThen(182.0), std::nullopt);

    ASSERT_TRUE(is_open(decision));
    EXPECT_EQ(std::get<OpenDecision>(decision).direction, Direction::Long);
}

TEST(MeanReversionStrategyTest, HoldsWhileImpulseContinues) {
    MeanReversionStrategy strategy;
    EXPECT_TRUE(is_hold(strategy.evaluate(risingThen(120.0), std::nullopt)));
    EXPECT_TRUE(is_hold(strategy.evaluate(fallingThen(180.0), std::nullopt)));
}

TEST(MeanReversionStrategyTest, HoldsWithoutRsiExtreme) {
    MeanReversionConfig config;
    config.overbought = 95.0;
    MeanReversionStrategy strategy(config);
    EXPECT_TRUE(is_hold(strategy.evaluate(risingThen(118.0), std::nullopt)));
}

TEST(MeanReversionStrategyTest, ExitsOnCurrencyBudgets) {
    MeanReversionStrategy strategy;   // target 1000, max loss 500

    auto target = strategy.evaluate(priceAt(200.0, 1000), position(Direction::Long, 100.0, 10.0));
    ASSERT_TRUE(is_close(target));
    EXPECT_NE(std::get<CloseDecision>(target).reason.find("target"), std::string::npos);

    auto loss = strategy.evaluate(priceAt(40.0, 1000), position(Direction::Long, 100.0, 10.0));
    ASSERT_TRUE(is_close(loss));
    EXPECT_NE(std::get<CloseDecision>(loss).reason.find("max loss"), std::string::npos);

    // short gains when price falls
    EXPECT_TRUE(is_close(strategy.evaluate(priceAt(0.5, 1000), position(Direction::Short, 100.0, 10.1))));
    EXPECT_TRUE(is_hold(strategy.evaluate(priceAt(101.0, 1000), position(Direction::Long, 100.0, 10.0))));
}

TEST(MeanReversionStrategyTest, ExitsAfterMaxHold) {
    MeanReversionStrategy strategy;   // 900 s
    EXPECT_TRUE(is_hold(strategy.evaluate(priceAt(100.0, 899000), position(Direction::Long, 100.0, 1.0))));
    auto decision = strategy.evaluate(priceAt(100.0, 900000), position(Direction::Long, 100.0, 1.0));
    ASSERT_TRUE(is_close(decision));
    EXPECT_NE(std::get<CloseDecision>(decision).reason.find("hold"), std::string::npos);
}

TEST(MeanReversionStrategyTest, CooldownBlocksReentry) {
    MeanReversionStrategy strategy;   // 120 s
    auto view = risingThen(118.0);
    strategy.on_position_closed("ETHUSDT", view.now - 60000);
    EXPECT_TRUE(is_hold(strategy.evaluate(view, std::nullopt)));

    view.now += 60000;
    EXPECT_TRUE(is_open(strategy.evaluate(view, std::nullopt)));
}

TEST(MeanReversionStrategyTest, ConfigValidationNamesField) {
    boost::property_tree::ptree options;
    options.put("oversold", "60");
    try {
        MeanReversionConfig::from_ptree(options);
        FAIL() << "expected invalid_argument";
    }
    catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("oversold"), std::string::npos);
    }

    boost::property_tree::ptree bad_type;
    bad_type.put("rsi_period", "fourteen");
    EXPECT_THROW(MeanReversionConfig::from_ptree(bad_type), std::invalid_argument);

    boost::property_tree::ptree unknown;
    unknown.put("rsi_periods", "14");
    EXPECT_THROW(MeanReversionConfig::from_ptree(unknown), std::invalid_argument);
}
