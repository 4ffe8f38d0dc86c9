#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "Dto/Market/Bar.hpp"
#include "Dto/Market/Sentiment.hpp"

namespace PaperPerp::Infra::Exanges {
    /// Price input of both drivers. Implementations throw
    /// Utils::Retry::TransientError for failures worth retrying.
    class IMarketDataSource {
    public:
        virtual ~IMarketDataSource() = default;

        /// Up to `limit` most recent bars, oldest first
        virtual Dto::Market::BarSeries fetch_bars(const std::string& symbol, std::size_t limit) = 0;

        /// Current trade price
        virtual double latest_price(const std::string& symbol) = 0;

        /// Latest periodic funding rate in percent, if the symbol has one
        virtual std::optional<double> funding_rate(const std::string& symbol) = 0;

        /// A finite source (a recording) returns true once it has nothing new to show
        virtual bool exhausted() const { return false; }
    };

    /// Optional precomputed sentiment/LLM score per symbol
    class ISentimentSource {
    public:
        virtual ~ISentimentSource() = default;

        virtual std::optional<Dto::Market::SentimentDto> latest(const std::string& symbol) = 0;
    };
}
