#pragma once

#include <algorithm>
#include <vector>
#include "Dto/Market/Bar.hpp"

namespace PaperPerp::Strategy::Testing {
    using Dto::Market::BarDto;
    using Dto::Market::BarSeries;

    constexpr long long kMinute = 60000;

    inline BarDto bar(long long ts, double open, double high, double low, double close, double volume = 100.0) {
        BarDto b{};
        b.Timestamp = ts;
        b.OpenPrice = open;
        b.HighPrice = high;
        b.LowPrice = low;
        b.ClosePrice = close;
        b.Volume = volume;
        return b;
    }

    // `count` bars closing at `close` with a symmetric +-half_range wick
    inline BarSeries flat(std::size_t count, double close, double half_range = 1.0, double volume = 100.0) {
        BarSeries bars;
        for (std::size_t i = 0; i < count; ++i) {
            bars.push_back(bar(static_cast<long long>(i) * kMinute, close, close + half_range, close - half_range, close, volume));
        }
        return bars;
    }

    inline BarSeries closes(const std::vector<double>& values, double half_range = 0.5) {
        BarSeries bars;
        for (std::size_t i = 0; i < values.size(); ++i) {
            const double c = values[i];
            const double o = i == 0 ? c : values[i - 1];
            bars.push_back(bar(static_cast<long long>(i) * kMinute, o, std::max(o, c) + half_range, std::min(o, c) - half_range, c));
        }
        return bars;
    }
}
