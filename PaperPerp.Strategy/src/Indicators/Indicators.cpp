#include "Indicators/Indicators.hpp"
#include <algorithm>
#include <cmath>

namespace PaperPerp::Strategy::Indicators {
    std::optional<double> sma(const BarSeries& bars, std::size_t period) {
        if (period == 0 || bars.size() < period) {
            return std::nullopt;
        }
        double sum = 0.0;
        for (auto it = bars.end() - period; it != bars.end(); ++it) {
            sum += it->ClosePrice;
        }
        return sum / static_cast<double>(period);
    }

    std::optional<double> ema(const BarSeries& bars, std::size_t period) {
        if (period == 0 || bars.size() < period) {
            return std::nullopt;
        }
        const double k = 2.0 / (static_cast<double>(period) + 1.0);
        double value = 0.0;
        for (std::size_t i = 0; i < period; ++i) {
            value += bars[i].ClosePrice;
        }
        value /= static_cast<double>(period);
        for (std::size_t i = period; i < bars.size(); ++i) {
            value = bars[i].ClosePrice * k + value * (1.0 - k);
        }
        return value;
    }

    std::optional<double> rsi(const BarSeries& bars, std::size_t period) {
        if (period == 0 || bars.size() < period + 1) {
            return std::nullopt;
        }
        double gain = 0.0;
        double loss = 0.0;
        for (std::size_t i = 1; i <= period; ++i) {
            const double delta = bars[i].ClosePrice - bars[i - 1].ClosePrice;
            if (delta > 0) gain += delta; else loss -= delta;
        }
        gain /= static_cast<double>(period);
        loss /= static_cast<double>(period);
        for (std::size_t i = period + 1; i < bars.size(); ++i) {
            const double delta = bars[i].ClosePrice - bars[i - 1].ClosePrice;
            gain = (gain * (period - 1) + std::max(delta, 0.0)) / static_cast<double>(period);
            loss = (loss * (period - 1) + std::max(-delta, 0.0)) / static_cast<double>(period);
        }
        if (loss == 0.0) {
            return gain == 0.0 ? 50.0 : 100.0;
        }
        const double rs = gain / loss;
        return 100.0 - 100.0 / (1.0 + rs);
    }

    std::optional<double> atr(const BarSeries& bars, std::size_t period) {
        if (period == 0 || bars.size() < period + 1) {
            return std::nullopt;
        }
        double sum = 0.0;
        for (std::size_t i = bars.size() - period; i < bars.size(); ++i) {
            const auto& bar = bars[i];
            const double prev_close = bars[i - 1].ClosePrice;
            sum += std::max({ bar.HighPrice - bar.LowPrice,
                std::abs(bar.HighPrice - prev_close),
                std::abs(bar.LowPrice - prev_close) });
        }
        return sum / static_cast<double>(period);
    }

    std::optional<double> highest_high(const BarSeries& bars, std::size_t period) {
        if (period == 0 || bars.size() < period + 1) {
            return std::nullopt;
        }
        double value = bars[bars.size() - 1 - period].HighPrice;
        for (std::size_t i = bars.size() - period; i + 1 < bars.size(); ++i) {
            value = std::max(value, bars[i].HighPrice);
        }
        return value;
    }

    std::optional<double> lowest_low(const BarSeries& bars, std::size_t period) {
        if (period == 0 || bars.size() < period + 1) {
            return std::nullopt;
        }
        double value = bars[bars.size() - 1 - period].LowPrice;
        for (std::size_t i = bars.size() - period; i + 1 < bars.size(); ++i) {
            value = std::min(value, bars[i].LowPrice);
        }
        return value;
    }

    std::optional<double> average_volume(const BarSeries& bars, std::size_t period) {
        if (period == 0 || bars.size() < period + 1) {
            return std::nullopt;
        }
        double sum = 0.0;
        for (std::size_t i = bars.size() - 1 - period; i + 1 < bars.size(); ++i) {
            sum += bars[i].Volume;
        }
        return sum / static_cast<double>(period);
    }

    std::optional<double> change_percent(const BarSeries& bars, std::size_t period) {
        if (period == 0 || bars.size() < period + 1) {
            return std::nullopt;
        }
        const double reference = bars[bars.size() - 1 - period].ClosePrice;
        if (reference == 0.0) {
            return std::nullopt;
        }
        return (bars.back().ClosePrice - reference) / reference * 100.0;
    }
}
