#include <gtest/gtest.h>
#include "Breakout/BreakoutStrategy.hpp"
#include "TestBars.hpp"

using namespace PaperPerp::Strategy;
using namespace PaperPerp::Strategy::Breakout;
using namespace PaperPerp::Strategy::Testing;
using PaperPerp::Dto::Direction;
using PaperPerp::Utils::Numeric::Decimal;

/////////////////////////////////////////////////////////
// Helpers
/////////////////////////////////////////////////////////

// 30 quiet bars around 100 followed by a bar closing at `close` on `volume`
static MarketView breakoutView(double close, double volume, long long now = 30 * kMinute) {
    MarketView view;
    view.symbol = "BTCUSDT";
    view.bars = flat(30, 100.0, 1.0, 100.0);
    const double high = close > 100 ? close + 0.5 : 99.2;
    const double low = close > 100 ? 100.8 : close - 0.5;
    view.bars.push_back(bar(30 * kMinute, 100.0, high, low, close, volume));
    view.now = now;
    return view;
}

static PositionView openLong(double entry) {
    PositionView position;
    position.id = 1;
    position.symbol = "BTCUSDT";
    position.direction = Direction::Long;
    position.size = Decimal(1);
    position.entry_price = Decimal(entry);
    position.opened_at = 0;
    return position;
}

TEST(BreakoutStrategyTest, LongOnResistanceBreakWithVolume) {
    BreakoutStrategy strategy;
    auto decision = strategy.evaluate(breakoutView(103.0, 300.0), std::nullopt);

    ASSERT_TRUE(is_open(decision));
    const auto& open = std::get<OpenDecision>(decision);
    EXPECT_EQ(open.direction, Direction::Long);
    ASSERT_TRUE(open.stop_loss.has_value());
    ASSERT_TRUE(open.take_profit.has_value());
    EXPECT_LT(*open.stop_loss, 103.0);
    EXPECT_GT(*open.take_profit, 103.0);
    EXPECT_NEAR(*open.take_profit - 103.0, 2.0 * (103.0 - *open.stop_loss), 1e-9);
    EXPECT_GT(open.confidence, 0.0);
    EXPECT_LE(open.confidence, 1.0);
    EXPECT_FALSE(open.trailing_distance.has_value());
}

TEST(BreakoutStrategyTest, ShortOnSupportBreak) {
    BreakoutStrategy strategy;
    auto decision = strategy.evaluate(breakoutView(97.0, 300.0), std::nullopt);

    ASSERT_TRUE(is_open(decision));
    const auto& open = std::get<OpenDecision>(decision);
    EXPECT_EQ(open.direction, Direction::Short);
    EXPECT_GT(*open.stop_loss, 97.0);
    EXPECT_LT(*open.take_profit, 97.0);
}

TEST(BreakoutStrategyTest, HoldsWithoutVolumeConfirmation) {
    BreakoutStrategy strategy;
    EXPECT_TRUE(is_hold(strategy.evaluate(breakoutView(103.0, 120.0), std::nullopt)));
}

TEST(BreakoutStrategyTest, HoldsInsideTheBand) {
    BreakoutStrategy strategy;
    EXPECT_TRUE(is_hold(strategy.evaluate(breakoutView(101.2, 300.0), std::nullopt)));
}

TEST(BreakoutStrategyTest, HoldsBelowMinimumBars) {
    BreakoutStrategy strategy;
    EXPECT_EQ(strategy.minimum_bars_required(), 21u);

    MarketView view = breakoutView(103.0, 300.0);
    view.bars.erase(view.bars.begin(), view.bars.begin() + 11);
    ASSERT_EQ(view.bars.size(), 20u);
    EXPECT_TRUE(is_hold(strategy.evaluate(view, std::nullopt)));
}

TEST(BreakoutStrategyTest, TrailingDistanceFromAtr) {
    BreakoutConfig config;
    config.trailing_atr_multiplier = 1.5;
    BreakoutStrategy strategy(config);

    auto decision = strategy.evaluate(breakoutView(103.0, 300.0), std::nullopt);
    ASSERT_TRUE(is_open(decision));
    const auto& open = std::get<OpenDecision>(decision);
    ASSERT_TRUE(open.trailing_distance.has_value());
    // 13 bars of range 2 and one of 3.5 against the previous close
    EXPECT_NEAR(*open.trailing_distance, 1.5 * (13 * 2.0 + 3.5) / 14.0, 1e-9);
}

TEST(BreakoutStrategyTest, SentimentVetoesOpposingEntry) {
    BreakoutConfig config;
    config.use_sentiment = true;
    BreakoutStrategy strategy(config);

    auto view = breakoutView(103.0, 300.0);
    PaperPerp::Dto::Market::SentimentDto sentiment{};
    sentiment.Score = -0.8;
    sentiment.Confidence = 0.9;
    view.sentiment = sentiment;
    EXPECT_TRUE(is_hold(strategy.evaluate(view, std::nullopt)));

    // low confidence is ignored
    view.sentiment->Confidence = 0.2;
    EXPECT_TRUE(is_open(strategy.evaluate(view, std::nullopt)));
}

TEST(BreakoutStrategyTest, ClosesWhenRangeContracts) {
    BreakoutStrategy strategy;
    MarketView view;
    view.symbol = "BTCUSDT";
    view.bars = flat(30, 100.0, 0.2);
    view.now = 30 * kMinute;

    auto decision = strategy.evaluate(view, openLong(100.0));
    ASSERT_TRUE(is_close(decision));
    EXPECT_NE(std::get<CloseDecision>(decision).reason.find("range"), std::string::npos);

    view.bars = flat(30, 100.0, 1.0);
    EXPECT_TRUE(is_hold(strategy.evaluate(view, openLong(100.0))));
}

TEST(BreakoutStrategyTest, CooldownAfterPositionDisappears) {
    BreakoutStrategy strategy;   // 300 s cooldown
    MarketView holding;
    holding.symbol = "BTCUSDT";
    holding.bars = flat(30, 100.0, 1.0);
    holding.now = 10 * kMinute;
    EXPECT_TRUE(is_hold(strategy.evaluate(holding, openLong(100.0))));

    // position gone at the next call: closed at that call's timestamp
    auto view = breakoutView(103.0, 300.0, 11 * kMinute);
    EXPECT_TRUE(is_hold(strategy.evaluate(view, std::nullopt)));
    EXPECT_TRUE(strategy.in_cooldown("BTCUSDT", 15 * kMinute));
    EXPECT_FALSE(strategy.in_cooldown("ETHUSDT", 15 * kMinute));

    view.now = 16 * kMinute;
    EXPECT_TRUE(is_open(strategy.evaluate(view, std::nullopt)));
}

TEST(BreakoutStrategyTest, ExplicitCloseNotificationStartsCooldown) {
    BreakoutStrategy strategy;
    strategy.on_position_closed("BTCUSDT", 30 * kMinute);
    EXPECT_TRUE(is_hold(strategy.evaluate(breakoutView(103.0, 300.0, 31 * kMinute), std::nullopt)));
    EXPECT_TRUE(is_open(strategy.evaluate(breakoutView(103.0, 300.0, 36 * kMinute), std::nullopt)));
}

TEST(BreakoutStrategyTest, ConfigValidation) {
    BreakoutConfig config;
    config.lookback = 1;
    EXPECT_THROW(BreakoutStrategy{ config }, std::invalid_argument);

    BreakoutStrategy strategy;
    boost::property_tree::ptree options;
    options.put("reward_risk", "-1");
    EXPECT_THROW(strategy.configure(options), std::invalid_argument);
    EXPECT_DOUBLE_EQ(strategy.config().reward_risk, 2.0);

    boost::property_tree::ptree good;
    good.put("lookback", "10");
    good.put("cooldown_seconds", "0");
    strategy.configure(good);
    EXPECT_EQ(strategy.config().lookback, 10u);
    EXPECT_EQ(strategy.minimum_bars_required(), 15u);
}

// Keys not given keep the built-in defaults
TEST(BreakoutStrategyTest, FromOptionsStartsFromDefaults) {
    boost::property_tree::ptree options;
    options.put("lookback", "30");
    BreakoutConfig config = BreakoutConfig::from_ptree(options);
    EXPECT_EQ(config.lookback, 30u);
    EXPECT_DOUBLE_EQ(config.reward_risk, 2.0);
    EXPECT_DOUBLE_EQ(config.cooldown_seconds, 300.0);

    EXPECT_EQ(BreakoutConfig::from_ptree(boost::property_tree::ptree()).lookback, 20u);
}
