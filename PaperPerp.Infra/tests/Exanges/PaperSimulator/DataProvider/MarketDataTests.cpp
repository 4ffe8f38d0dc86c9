#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include "Exanges/PaperSimulator/DataProvider/HistoricalDataSource.hpp"
#include "Exanges/PaperSimulator/DataProvider/MarketData.hpp"

using namespace PaperPerp::Infra::Exanges::PaperSimulator;

static const char* test_csv_filename = "test_bar_data.csv";

class MarketDataTests : public ::testing::Test {
protected:
    void SetUp() override {
        boost::filesystem::ofstream ofs(test_csv_filename);
        ofs << "timestamp,open,high,low,close,volume,funding_rate\n";
        ofs << "1733497320000,7020,7100,7000,7050,200,0.012\n";
        ofs << "1733497260000,7000,7050,6950,7020,100,\n";
        ofs << "1733497380000,7050,7080,7040,7060,150\n";
        ofs << "not,a,bar,row,at,all\n";
        ofs << "1733497380000,1,1,1,1,1\n";
        ofs.close();
    }

    void TearDown() override {
        boost::filesystem::remove(test_csv_filename);
    }
};

TEST_F(MarketDataTests, LoadSortsAndSkipsBadRows) {
    testing::internal::CaptureStderr();
    MarketData md("BTCUSDT", test_csv_filename);
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(md.get_bars_count(), 3u);
    EXPECT_EQ(md.get_bar(0).Timestamp, 1733497260000);
    EXPECT_EQ(md.get_bar(1).Timestamp, 1733497320000);
    EXPECT_EQ(md.get_bar(2).Timestamp, 1733497380000);
    // First row of a duplicated timestamp wins
    EXPECT_DOUBLE_EQ(md.get_bar(2).ClosePrice, 7060.0);
    EXPECT_NE(err.find("skipped 1"), std::string::npos);
}

TEST_F(MarketDataTests, OptionalFundingColumn) {
    testing::internal::CaptureStderr();
    MarketData md("BTCUSDT", test_csv_filename);
    testing::internal::GetCapturedStderr();

    EXPECT_FALSE(md.get_bar(0).FundingRate.has_value());
    ASSERT_TRUE(md.get_bar(1).FundingRate.has_value());
    EXPECT_DOUBLE_EQ(*md.get_bar(1).FundingRate, 0.012);
    EXPECT_FALSE(md.get_bar(2).FundingRate.has_value());
}

TEST_F(MarketDataTests, GetBarOutOfRange) {
    testing::internal::CaptureStderr();
    MarketData md("BTCUSDT", test_csv_filename);
    testing::internal::GetCapturedStderr();
    EXPECT_THROW(md.get_bar(3), std::out_of_range);
    EXPECT_THROW(md.window(3, 2), std::out_of_range);
}

TEST_F(MarketDataTests, MissingFileThrows) {
    EXPECT_THROW(MarketData("BTCUSDT", "does_not_exist.csv"), std::runtime_error);
}

TEST(MarketDataWindowTest, WindowEndsAtIndex) {
    BarSeries bars;
    for (long long i = 0; i < 5; ++i) {
        BarDto bar{};
        bar.Timestamp = i;
        bar.ClosePrice = 100.0 + static_cast<double>(i);
        bars.push_back(bar);
    }
    MarketData md("X", bars);

    auto w = md.window(3, 2);
    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(w.front().Timestamp, 2);
    EXPECT_EQ(w.back().Timestamp, 3);
    EXPECT_EQ(md.window(1, 10).size(), 2u);

    size_t seen = 0;
    for (const auto& bar : md) {
        EXPECT_EQ(bar.Timestamp, static_cast<long long>(seen));
        ++seen;
    }
    EXPECT_EQ(seen, md.get_bars_count());
}

TEST(HistoricalDataSourceTest, RevealsOneBarPerFetch) {
    BarSeries bars;
    for (long long i = 0; i < 4; ++i) {
        BarDto bar{};
        bar.Timestamp = i * 60000;
        bar.ClosePrice = 10.0 + static_cast<double>(i);
        if (i == 1) bar.FundingRate = 0.02;
        bars.push_back(bar);
    }

    HistoricalDataSource source(2);
    source.add(MarketData("BTCUSDT", bars));

    auto first = source.fetch_bars("BTCUSDT", 10);
    EXPECT_EQ(first.size(), 3u);
    EXPECT_DOUBLE_EQ(source.latest_price("BTCUSDT"), 12.0);
    EXPECT_DOUBLE_EQ(*source.funding_rate("BTCUSDT"), 0.02);
    EXPECT_FALSE(source.exhausted());

    auto second = source.fetch_bars("BTCUSDT", 2);
    EXPECT_EQ(second.size(), 2u);
    EXPECT_EQ(second.back().Timestamp, 180000);
    EXPECT_TRUE(source.exhausted());

    // Past the end the last window is repeated
    EXPECT_EQ(source.fetch_bars("BTCUSDT", 2).back().Timestamp, 180000);
    EXPECT_THROW(source.fetch_bars("ETHUSDT", 1), std::out_of_range);
}

TEST(InMemorySentimentSourceTest, LatestScore) {
    InMemorySentimentSource source;
    EXPECT_FALSE(source.latest("BTCUSDT").has_value());

    PaperPerp::Dto::Market::SentimentDto score{};
    score.Timestamp = 1;
    score.Score = 0.6;
    score.Confidence = 0.8;
    source.set("BTCUSDT", score);
    EXPECT_DOUBLE_EQ(source.latest("BTCUSDT")->Score, 0.6);
}
