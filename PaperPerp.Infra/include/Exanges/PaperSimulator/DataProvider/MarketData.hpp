#pragma once

#include <string>
#include <vector>
#include "Dto/Market/Bar.hpp"

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    using PaperPerp::Dto::Market::BarDto;
    using PaperPerp::Dto::Market::BarSeries;

    /**
     * Bar series of one symbol loaded from CSV:
     *   timestamp,open,high,low,close,volume[,funding_rate]
     * with a header line and epoch-millisecond timestamps. Rows that do not
     * parse are skipped; the result is sorted by timestamp without duplicates.
     */
    class MarketData {
    public:
        MarketData(const std::string& symbol, const std::string& csv_file);
        MarketData(const std::string& symbol, BarSeries bars);

        const std::string& get_symbol() const { return symbol; }
        const BarDto& get_latest_bar() const;
        const BarDto& get_bar(size_t index) const;
        size_t get_bars_count() const;
        const BarSeries& get_bars() const { return bars; }

        // Up to `count` bars ending at index `last` (inclusive)
        BarSeries window(size_t last, size_t count) const;

        using iterator = BarSeries::iterator;
        using const_iterator = BarSeries::const_iterator;

        iterator begin();
        iterator end();
        const_iterator begin() const;
        const_iterator end() const;
        const_iterator cbegin() const;
        const_iterator cend() const;

    private:
        std::string symbol;
        BarSeries bars;

        void load_csv(const std::string& csv_file);
        void normalize();
    };
}
