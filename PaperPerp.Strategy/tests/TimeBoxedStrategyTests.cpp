#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <stdexcept>
#include <boost/thread.hpp>
#include "TimeBoxedStrategy.hpp"
#include "TestBars.hpp"

using namespace PaperPerp::Strategy;
using namespace PaperPerp::Strategy::Testing;
using PaperPerp::Dto::Direction;

/////////////////////////////////////////////////////////
// Helpers
/////////////////////////////////////////////////////////

// Answers OPEN after an interruptible sleep, or after `gate` is released when one is set
class ScriptedStrategy : public IStrategy {
public:
    std::atomic<int> delay_ms{ 0 };
    std::atomic<int> calls{ 0 };
    std::atomic<bool> throw_next{ false };
    std::shared_future<void> gate;
    std::vector<std::pair<std::string, long long>> closes;

    Decision evaluate(const MarketView& view, const std::optional<PositionView>&) override {
        ++calls;
        if (throw_next) {
            throw std::runtime_error("strategy failure");
        }
        if (gate.valid()) {
            gate.wait();
        }
        else if (delay_ms > 0) {
            boost::this_thread::sleep_for(boost::chrono::milliseconds(delay_ms.load()));
        }
        OpenDecision open;
        open.direction = Direction::Long;
        open.confidence = 0.7;
        return open;
    }

    void configure(const boost::property_tree::ptree&) override { }
    std::size_t minimum_bars_required() const override { return 1; }
    const std::string& name() const override { return name_; }
    void on_position_closed(const std::string& symbol, long long timestamp) override {
        closes.emplace_back(symbol, timestamp);
    }

private:
    std::string name_ = "scripted";
};

static MarketView anyView() {
    MarketView view;
    view.symbol = "BTCUSDT";
    view.bars = flat(3, 100.0);
    return view;
}

TEST(TimeBoxedStrategyTest, PassesThroughFastAnswers) {
    auto inner = std::make_shared<ScriptedStrategy>();
    TimeBoxedStrategy boxed(inner, std::chrono::milliseconds(1000));

    EXPECT_TRUE(is_open(boxed.evaluate(anyView(), std::nullopt)));
    EXPECT_EQ(boxed.timeouts(), 0);
    EXPECT_EQ(boxed.name(), "scripted");
    EXPECT_EQ(boxed.minimum_bars_required(), 1u);
}

TEST(TimeBoxedStrategyTest, HoldsOnTimeoutAndCancelsTheCall) {
    auto inner = std::make_shared<ScriptedStrategy>();
    inner->delay_ms = 10000;
    TimeBoxedStrategy boxed(inner, std::chrono::milliseconds(50));

    EXPECT_TRUE(is_hold(boxed.evaluate(anyView(), std::nullopt)));
    EXPECT_EQ(boxed.timeouts(), 1);

    // the interrupted sleep ends well before its 10 s
    for (int i = 0; i < 100 && boxed.busy(); ++i) {
        boost::this_thread::sleep_for(boost::chrono::milliseconds(10));
    }
    EXPECT_FALSE(boxed.busy());

    inner->delay_ms = 0;
    EXPECT_TRUE(is_open(boxed.evaluate(anyView(), std::nullopt)));
}

TEST(TimeBoxedStrategyTest, HoldsWhilePreviousCallStillRuns) {
    auto inner = std::make_shared<ScriptedStrategy>();
    std::promise<void> release;
    inner->gate = release.get_future().share();
    TimeBoxedStrategy boxed(inner, std::chrono::milliseconds(30));

    EXPECT_TRUE(is_hold(boxed.evaluate(anyView(), std::nullopt)));
    EXPECT_TRUE(boxed.busy());
    EXPECT_TRUE(is_hold(boxed.evaluate(anyView(), std::nullopt)));
    EXPECT_EQ(inner->calls.load(), 1);

    // a close reported meanwhile reaches the inner strategy once it is idle
    boxed.on_position_closed("BTCUSDT", 42);
    EXPECT_TRUE(inner->closes.empty());

    release.set_value();
    for (int i = 0; i < 100 && boxed.busy(); ++i) {
        boost::this_thread::sleep_for(boost::chrono::milliseconds(10));
    }
    EXPECT_TRUE(is_open(boxed.evaluate(anyView(), std::nullopt)));
    EXPECT_EQ(inner->calls.load(), 2);
    ASSERT_EQ(inner->closes.size(), 1u);
    EXPECT_EQ(inner->closes[0].second, 42);
}

TEST(TimeBoxedStrategyTest, PropagatesStrategyFaults) {
    auto inner = std::make_shared<ScriptedStrategy>();
    inner->throw_next = true;
    TimeBoxedStrategy boxed(inner, std::chrono::milliseconds(1000));
    EXPECT_THROW(boxed.evaluate(anyView(), std::nullopt), std::runtime_error);
}

TEST(TimeBoxedStrategyTest, RejectsBadArguments) {
    EXPECT_THROW(TimeBoxedStrategy(nullptr, std::chrono::milliseconds(10)), std::invalid_argument);
    EXPECT_THROW(TimeBoxedStrategy(std::make_shared<ScriptedStrategy>(), std::chrono::milliseconds(0)), std::invalid_argument);
}
