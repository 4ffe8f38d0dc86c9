#pragma once

#include <cstddef>
#include <optional>
#include "Dto/Market/Bar.hpp"

namespace PaperPerp::Strategy::Indicators {
    using Dto::Market::BarSeries;

    // All functions look at the trailing `period` bars ending at the last bar.
    // An empty optional means there is not enough history.

    std::optional<double> sma(const BarSeries& bars, std::size_t period);
    std::optional<double> ema(const BarSeries& bars, std::size_t period);

    // Wilder's RSI on closes, 0 .. 100
    std::optional<double> rsi(const BarSeries& bars, std::size_t period);

    // Simple average of true range over `period` bars (needs period + 1 bars)
    std::optional<double> atr(const BarSeries& bars, std::size_t period);

    // Extremes over the `period` bars preceding the last one
    std::optional<double> highest_high(const BarSeries& bars, std::size_t period);
    std::optional<double> lowest_low(const BarSeries& bars, std::size_t period);

    // Average volume over the `period` bars preceding the last one
    std::optional<double> average_volume(const BarSeries& bars, std::size_t period);

    // Percent change of the last close against the close `period` bars earlier
    std::optional<double> change_percent(const BarSeries& bars, std::size_t period);
}
