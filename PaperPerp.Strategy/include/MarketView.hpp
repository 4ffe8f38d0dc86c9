#pragma once

#include <optional>
#include <string>
#include "Dto/Market/Bar.hpp"
#include "Dto/Market/Sentiment.hpp"
#include "Dto/Position.hpp"

namespace PaperPerp::Strategy {
    // What a strategy sees of the market for one symbol at one step
    struct MarketView {
        std::string                 symbol;
        Dto::Market::BarSeries      bars;           // oldest first, last bar is the current one
        long long                   now = 0;        // series time in backtests, wall clock live
        std::optional<double>       funding_rate;   // percent per funding period
        std::optional<Dto::Market::SentimentDto> sentiment;

        double last_close() const { return bars.empty() ? 0.0 : bars.back().ClosePrice; }
    };

    // Read-only copy of the open position handed to evaluate()
    using PositionView = Dto::Position;
}
