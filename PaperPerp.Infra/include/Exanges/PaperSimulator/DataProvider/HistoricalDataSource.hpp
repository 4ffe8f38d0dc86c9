#pragma once

#include <map>
#include <mutex>
#include <string>
#include "Exanges/IMarketDataSource.h"
#include "Exanges/PaperSimulator/DataProvider/MarketData.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    /**
     * Plays recorded MarketData through the live interface: each fetch_bars()
     * call for a symbol reveals one more bar of its series. Lets the live loop
     * run unattended against a recording.
     */
    class HistoricalDataSource : public IMarketDataSource {
    public:
        // warmup: bars visible before the first fetch
        explicit HistoricalDataSource(size_t warmup = 0);

        void add(MarketData data);

        Dto::Market::BarSeries fetch_bars(const std::string& symbol, std::size_t limit) override;
        double latest_price(const std::string& symbol) override;
        std::optional<double> funding_rate(const std::string& symbol) override;

        // True once every series has revealed its final bar
        bool exhausted() const override;

    private:
        struct Replay {
            MarketData data;
            size_t visible;
        };

        size_t warmup_;
        mutable std::mutex mtx_;
        std::map<std::string, Replay> series_;

        Replay& replay_for(const std::string& symbol);
    };

    // Fixed per-symbol scores, set by the caller
    class InMemorySentimentSource : public ISentimentSource {
    public:
        void set(const std::string& symbol, const Dto::Market::SentimentDto& score);
        std::optional<Dto::Market::SentimentDto> latest(const std::string& symbol) override;

    private:
        std::mutex mtx_;
        std::map<std::string, Dto::Market::SentimentDto> scores_;
    };
}
