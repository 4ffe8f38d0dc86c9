#include <gtest/gtest.h>
#include "RunnerTestSupport.hpp"
#include "TickProcessor.hpp"

using namespace PaperPerp::Runner;
using namespace PaperPerp::Runner::Testing;
using PaperPerp::Dto::CloseReason;
using PaperPerp::Dto::Direction;

static SymbolSnapshot snapshotAt(const std::string& symbol, double price, long long ts, bool bar_triggers = false) {
    SymbolSnapshot snapshot;
    snapshot.symbol = symbol;
    snapshot.bars = series({ 100.0, price }, ts - kMinute);
    snapshot.price = price;
    snapshot.timestamp = ts;
    snapshot.bar_triggers = bar_triggers;
    return snapshot;
}

TEST(TickProcessorTest, OpensWithDefaultSizePercent) {
    auto engine = make_engine();
    auto strategy = open_once(Direction::Long);
    TickProcessor processor(*engine, strategy, TickSettings{ 10.0, true });

    auto report = processor.process({ snapshotAt("BTCUSDT", 100.0, kMinute) });
    EXPECT_EQ(report.opened, 1);

    const auto* position = engine->ledger().find_open("BTCUSDT");
    ASSERT_NE(position, nullptr);
    // 10% of 10,000 at reference 100
    EXPECT_EQ(position->size, Decimal(10));
    EXPECT_EQ(position->strategy, "scripted");
    EXPECT_EQ(position->opened_at, kMinute);
}

TEST(TickProcessorTest, TriggerClosesBeforeStrategyRuns) {
    auto engine = make_engine();
    auto strategy = open_once(Direction::Long, 95.0);
    TickProcessor processor(*engine, strategy, TickSettings{ 10.0, true });

    processor.process({ snapshotAt("BTCUSDT", 100.0, kMinute) });
    auto report = processor.process({ snapshotAt("BTCUSDT", 94.0, 2 * kMinute) });

    EXPECT_EQ(report.closed_by_trigger, 1);
    EXPECT_EQ(report.opened, 0);
    ASSERT_EQ(engine->ledger().trades().size(), 1u);
    EXPECT_EQ(engine->ledger().trades()[0].reason, CloseReason::StopLoss);
    ASSERT_EQ(strategy->closes.size(), 1u);
    EXPECT_EQ(strategy->closes[0].second, 2 * kMinute);
    EXPECT_EQ(engine->ledger().find_open("BTCUSDT"), nullptr);
}

TEST(TickProcessorTest, BarRangeTriggersStopFirst) {
    auto engine = make_engine();
    auto strategy = open_once(Direction::Long, 95.0, 105.0);
    TickProcessor processor(*engine, strategy, TickSettings{ 10.0, true });
    processor.process({ snapshotAt("BTCUSDT", 100.0, kMinute, true) });

    // one bar spanning both levels
    SymbolSnapshot wide;
    wide.symbol = "BTCUSDT";
    wide.bars = { bar(kMinute, 100, 100, 99, 100), bar(2 * kMinute, 100, 106, 94, 101) };
    wide.price = 101.0;
    wide.timestamp = 2 * kMinute;
    wide.bar_triggers = true;
    processor.process({ wide });

    ASSERT_EQ(engine->ledger().trades().size(), 1u);
    EXPECT_EQ(engine->ledger().trades()[0].reason, CloseReason::StopLoss);
}

TEST(TickProcessorTest, StrategyCloseAndMarking) {
    auto engine = make_engine();
    bool want_close = false;
    auto strategy = std::make_shared<ScriptedStrategy>([&](const MarketView&, const std::optional<PositionView>& position) {
        if (!position) {
            OpenDecision open;
            open.direction = Direction::Short;
            open.confidence = 0.9;
            return Decision{ open };
        }
        return want_close ? Decision{ CloseDecision{ "done" } } : Decision{ HoldDecision{} };
    });
    TickProcessor processor(*engine, strategy, TickSettings{ 10.0, true });

    processor.process({ snapshotAt("ETHUSDT", 100.0, kMinute) });
    processor.process({ snapshotAt("ETHUSDT", 90.0, 2 * kMinute) });
    const auto* position = engine->ledger().find_open("ETHUSDT");
    ASSERT_NE(position, nullptr);
    EXPECT_EQ(position->mark_price, Decimal(90));
    EXPECT_GT(position->unrealized_pnl, 0);

    want_close = true;
    auto report = processor.process({ snapshotAt("ETHUSDT", 90.0, 3 * kMinute) });
    EXPECT_EQ(report.closed_by_strategy, 1);
    ASSERT_EQ(engine->ledger().trades().size(), 1u);
    EXPECT_EQ(engine->ledger().trades()[0].reason, CloseReason::Strategy);
    EXPECT_GT(engine->ledger().trades()[0].net_pnl, 0);
}

TEST(TickProcessorTest, NoOpensWhenDisallowed) {
    auto engine = make_engine();
    TickProcessor processor(*engine, open_once(Direction::Long), TickSettings{ 10.0, false });
    auto report = processor.process({ snapshotAt("BTCUSDT", 100.0, kMinute) });
    EXPECT_EQ(report.opened, 0);
    EXPECT_EQ(report.held, 1);
    EXPECT_TRUE(engine->ledger().open_positions().empty());
}

TEST(TickProcessorTest, FailingStepLeavesLedgerUntouched) {
    auto store = std::make_shared<InMemoryLedgerStore>();
    auto engine = make_engine(Decimal(10000), store);
    const int saves_before = store->save_count();

    auto strategy = std::make_shared<ScriptedStrategy>([](const MarketView& view, const std::optional<PositionView>&) {
        if (view.symbol == "ETHUSDT") {
            throw std::runtime_error("model unavailable");
        }
        OpenDecision open;
        open.direction = Direction::Long;
        open.confidence = 1.0;
        return Decision{ open };
    });
    TickProcessor processor(*engine, strategy, TickSettings{ 10.0, true });

    EXPECT_THROW(processor.process({ snapshotAt("BTCUSDT", 100.0, kMinute), snapshotAt("ETHUSDT", 100.0, kMinute) }),
        std::runtime_error);
    EXPECT_TRUE(engine->ledger().open_positions().empty());
    EXPECT_EQ(engine->ledger().account().balance, Decimal(10000));
    EXPECT_EQ(store->save_count(), saves_before);
}

TEST(TickProcessorTest, OneSavePerStep) {
    auto store = std::make_shared<InMemoryLedgerStore>();
    auto engine = make_engine(Decimal(10000), store);
    const int saves_before = store->save_count();
    TickProcessor processor(*engine, open_once(Direction::Long), TickSettings{ 10.0, true });

    processor.process({ snapshotAt("BTCUSDT", 100.0, kMinute), snapshotAt("ETHUSDT", 50.0, kMinute) });
    EXPECT_EQ(engine->ledger().open_positions().size(), 2u);
    EXPECT_EQ(store->save_count(), saves_before + 1);
}

TEST(TickProcessorTest, SkipsSnapshotsWithoutPrice) {
    auto engine = make_engine();
    auto strategy = always_hold();
    TickProcessor processor(*engine, strategy, TickSettings{ 10.0, true });
    SymbolSnapshot empty;
    empty.symbol = "BTCUSDT";
    processor.process({ empty });
    EXPECT_EQ(strategy->evaluations, 0);
}
