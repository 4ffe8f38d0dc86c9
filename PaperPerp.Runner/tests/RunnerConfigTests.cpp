#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include "RunnerConfig.hpp"

using namespace PaperPerp::Runner;
using PaperPerp::Utils::Numeric::Decimal;
namespace fs = boost::filesystem;

class RunnerConfigTests : public ::testing::Test {
protected:
    fs::path file;

    void SetUp() override {
        file = fs::temp_directory_path() / fs::unique_path("paperperp-%%%%-%%%%.ini");
    }

    void TearDown() override {
        fs::remove(file);
    }

    void write(const std::string& text) {
        fs::ofstream out(file);
        out << text;
    }
};

TEST_F(RunnerConfigTests, DefaultsWithoutFile) {
    auto cfg = RunnerConfig::from_ptree({});
    EXPECT_EQ(cfg.account.name, "paper");
    EXPECT_EQ(cfg.account.starting_equity, Decimal(10000));
    EXPECT_EQ(cfg.strategy.name, "breakout");
    EXPECT_EQ(cfg.bot.tick_interval.count(), 60000);
    EXPECT_EQ(cfg.bot.duration.count(), 0);
    EXPECT_TRUE(cfg.bot.symbols.empty());
    EXPECT_TRUE(cfg.backtest.data_files.empty());
}

TEST_F(RunnerConfigTests, LoadsEverySection) {
    write(
        "[account]\n"
        "name = swing\n"
        "starting_equity = 25000.50\n"
        "leverage = 3\n"
        "size_percent = 20\n"
        "[engine]\n"
        "vip_level = 1\n"
        "slippage_rate = 0.0005\n"
        "max_open_positions = 5\n"
        "[bot]\n"
        "symbols = BTCUSDT, ETHUSDT\n"
        "tick_interval_seconds = 30\n"
        "duration_minutes = 90\n"
        "max_loss = 750\n"
        "retry_attempts = 5\n"
        "[backtest]\n"
        "data = BTCUSDT:data/btc.csv, ETHUSDT : data/eth.csv\n"
        "window_bars = 300\n"
        "[strategy]\n"
        "name = mean_reversion\n"
        "rsi_period = 10\n"
        "cooldown_seconds = 60\n");

    auto cfg = RunnerConfig::load(file.string());
    EXPECT_EQ(cfg.account.name, "swing");
    EXPECT_EQ(cfg.account.starting_equity, Decimal("25000.50"));
    EXPECT_DOUBLE_EQ(cfg.account.leverage, 3.0);
    EXPECT_DOUBLE_EQ(cfg.account.size_percent, 20.0);
    EXPECT_EQ(cfg.engine.slippage_rate, Decimal("0.0005"));
    EXPECT_EQ(cfg.engine.max_open_positions, 5);
    EXPECT_EQ(cfg.bot.symbols, (std::vector<std::string>{ "BTCUSDT", "ETHUSDT" }));
    EXPECT_EQ(cfg.bot.tick_interval.count(), 30000);
    EXPECT_EQ(cfg.bot.duration.count(), 5400);
    EXPECT_DOUBLE_EQ(cfg.bot.max_loss, 750.0);
    EXPECT_EQ(cfg.bot.retry.max_attempts, 5);
    ASSERT_EQ(cfg.backtest.data_files.size(), 2u);
    EXPECT_EQ(cfg.backtest.data_files.at("ETHUSDT"), "data/eth.csv");
    EXPECT_EQ(cfg.backtest.window_bars, 300u);
    EXPECT_EQ(cfg.strategy.name, "mean_reversion");
    EXPECT_EQ(cfg.strategy.options.get<int>("rsi_period"), 10);
    EXPECT_EQ(cfg.strategy.options.count("name"), 0u);
}

TEST_F(RunnerConfigTests, RejectsBadValuesByField) {
    boost::property_tree::ptree tree;
    tree.put("account.leverage", "0.5");
    try {
        RunnerConfig::from_ptree(tree);
        FAIL() << "expected invalid_argument";
    }
    catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("account.leverage"), std::string::npos);
    }

    boost::property_tree::ptree text;
    text.put("bot.max_loss", "a lot");
    EXPECT_THROW(RunnerConfig::from_ptree(text), std::invalid_argument);

    boost::property_tree::ptree equity;
    equity.put("account.starting_equity", "ten");
    EXPECT_THROW(RunnerConfig::from_ptree(equity), std::invalid_argument);
}

TEST_F(RunnerConfigTests, RejectsMalformedDataList) {
    EXPECT_THROW(parse_data_files("BTCUSDT"), std::invalid_argument);
    EXPECT_THROW(parse_data_files("BTCUSDT:a.csv,BTCUSDT:b.csv"), std::invalid_argument);
    EXPECT_TRUE(parse_data_files("").empty());
    EXPECT_EQ(split_list(" a, ,b ,"), (std::vector<std::string>{ "a", "b" }));
}

TEST_F(RunnerConfigTests, MissingFileIsAnError) {
    EXPECT_THROW(RunnerConfig::load((file.parent_path() / "does-not-exist.ini").string()), std::runtime_error);
}
