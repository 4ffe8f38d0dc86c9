#include "Exanges/PaperSimulator/DataProvider/MarketData.hpp"
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/stream.hpp>
#include <iostream>
#include <stdexcept>

namespace PaperPerp::Infra::Exanges::PaperSimulator {
    MarketData::MarketData(const std::string& symbol, const std::string& csv_file) : symbol(symbol) {
        load_csv(csv_file);
        normalize();
    }

    MarketData::MarketData(const std::string& symbol, BarSeries series) : symbol(symbol), bars(std::move(series)) {
        normalize();
    }

    void MarketData::load_csv(const std::string& csv_file) {
        namespace io = boost::iostreams;

        io::file_source file_source(csv_file);
        if (!file_source.is_open()) {
            throw std::runtime_error("Cannot open file: " + csv_file);
        }

        io::stream<io::file_source> file(file_source);
        std::string line;

        if (!std::getline(file, line)) {
            throw std::runtime_error("CSV file is empty or cannot read header: " + csv_file);
        }

        size_t skipped = 0;
        while (std::getline(file, line)) {
            boost::trim(line);
            if (line.empty()) continue;

            std::vector<std::string> tokens;
            boost::split(tokens, line, boost::is_any_of(","));
            if (tokens.size() < 6) {
                ++skipped;
                continue;
            }

            try {
                BarDto bar;
                bar.Timestamp = std::stoll(tokens[0]);
                bar.OpenPrice = std::stod(tokens[1]);
                bar.HighPrice = std::stod(tokens[2]);
                bar.LowPrice = std::stod(tokens[3]);
                bar.ClosePrice = std::stod(tokens[4]);
                bar.Volume = std::stod(tokens[5]);
                if (tokens.size() > 6 && !boost::trim_copy(tokens[6]).empty()) {
                    bar.FundingRate = std::stod(tokens[6]);
                }
                bars.push_back(bar);
            }
            catch (const std::invalid_argument&) {
                ++skipped;
            }
            catch (const std::out_of_range&) {
                ++skipped;
            }
        }

        if (skipped > 0) {
            std::cerr << "[MarketData::load_csv] " << symbol << ": skipped " << skipped << " malformed rows in " << csv_file << "\n";
        }
    }

    void MarketData::normalize() {
        std::stable_sort(bars.begin(), bars.end(),
            [](const BarDto& a, const BarDto& b) { return a.Timestamp < b.Timestamp; });
        auto last = std::unique(bars.begin(), bars.end(),
            [](const BarDto& a, const BarDto& b) { return a.Timestamp == b.Timestamp; });
        bars.erase(last, bars.end());
    }

    const BarDto& MarketData::get_latest_bar() const {
        if (bars.empty()) {
            throw std::out_of_range("No bars loaded for " + symbol);
        }
        return bars.back();
    }

    const BarDto& MarketData::get_bar(size_t index) const {
        if (index < bars.size()) {
            return bars[index];
        }
        else {
            throw std::out_of_range("Bar index out of range");
        }
    }

    size_t MarketData::get_bars_count() const {
        return bars.size();
    }

    BarSeries MarketData::window(size_t last, size_t count) const {
        if (last >= bars.size()) {
            throw std::out_of_range("Bar index out of range");
        }
        size_t first = (count == 0 || last + 1 < count) ? 0 : last + 1 - count;
        return BarSeries(bars.begin() + static_cast<std::ptrdiff_t>(first),
            bars.begin() + static_cast<std::ptrdiff_t>(last + 1));
    }

    MarketData::iterator MarketData::begin() { return bars.begin(); }
    MarketData::iterator MarketData::end() { return bars.end(); }
    MarketData::const_iterator MarketData::begin() const { return bars.begin(); }
    MarketData::const_iterator MarketData::end() const { return bars.end(); }
    MarketData::const_iterator MarketData::cbegin() const { return bars.cbegin(); }
    MarketData::const_iterator MarketData::cend() const { return bars.cend(); }
}
