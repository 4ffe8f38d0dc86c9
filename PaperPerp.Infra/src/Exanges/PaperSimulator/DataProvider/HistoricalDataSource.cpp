#include "Exanges/PaperSimulator/DataProvider/HistoricalDataSource.hpp"
#include <algorithm>
#include <stdexcept>

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    HistoricalDataSource::HistoricalDataSource(size_t warmup) : warmup_(warmup) {
    }

    void HistoricalDataSource::add(MarketData data) {
        if (data.get_bars_count() == 0) {
            throw std::invalid_argument("No bars recorded for " + data.get_symbol());
        }
        std::lock_guard<std::mutex> lock(mtx_);
        std::string symbol = data.get_symbol();
        size_t visible = std::min(warmup_, data.get_bars_count());
        series_.insert_or_assign(symbol, Replay{ std::move(data), visible });
    }

    HistoricalDataSource::Replay& HistoricalDataSource::replay_for(const std::string& symbol) {
        auto it = series_.find(symbol);
        if (it == series_.end()) {
            throw std::out_of_range("No recorded series for " + symbol);
        }
        return it->second;
    }

    Dto::Market::BarSeries HistoricalDataSource::fetch_bars(const std::string& symbol, std::size_t limit) {
        std::lock_guard<std::mutex> lock(mtx_);
        Replay& replay = replay_for(symbol);
        size_t count = replay.data.get_bars_count();
        replay.visible = std::min(replay.visible + 1, count);
        return replay.data.window(replay.visible - 1, limit);
    }

    double HistoricalDataSource::latest_price(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mtx_);
        Replay& replay = replay_for(symbol);
        size_t index = replay.visible == 0 ? 0 : replay.visible - 1;
        return replay.data.get_bar(index).ClosePrice;
    }

    std::optional<double> HistoricalDataSource::funding_rate(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mtx_);
        Replay& replay = replay_for(symbol);
        size_t last = replay.visible == 0 ? 0 : replay.visible - 1;
        for (size_t i = last + 1; i-- > 0;) {
            const auto& bar = replay.data.get_bar(i);
            if (bar.FundingRate) return bar.FundingRate;
        }
        return std::nullopt;
    }

    bool HistoricalDataSource::exhausted() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return std::all_of(series_.begin(), series_.end(),
            [](const auto& entry) { return entry.second.visible >= entry.second.data.get_bars_count(); });
    }

    void InMemorySentimentSource::set(const std::string& symbol, const Dto::Market::SentimentDto& score) {
        std::lock_guard<std::mutex> lock(mtx_);
        scores_.insert_or_assign(symbol, score);
    }

    std::optional<Dto::Market::SentimentDto> InMemorySentimentSource::latest(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = scores_.find(symbol);
        if (it == scores_.end()) return std::nullopt;
        return it->second;
    }
}
