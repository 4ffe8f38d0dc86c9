#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "Exanges/IMarketDataSource.h"
#include "Exanges/PaperSimulator/Engine/SimulationEngine.hpp"
#include "Exanges/PaperSimulator/Ledger/InMemoryLedgerStore.hpp"
#include "IStrategy.hpp"
#include "Retry/Backoff.hpp"

namespace PaperPerp::Runner::Testing {
    using namespace PaperPerp::Strategy;
    using namespace PaperPerp::Infra::Exanges::PaperSimulator;
    using PaperPerp::Dto::Market::BarDto;
    using PaperPerp::Dto::Market::BarSeries;
    using PaperPerp::Utils::Numeric::Decimal;

    constexpr long long kMinute = 60000;

    // Strategy whose answers come from a callback
    class ScriptedStrategy : public IStrategy {
    public:
        using Script = std::function<Decision(const MarketView&, const std::optional<PositionView>&)>;

        explicit ScriptedStrategy(Script script, std::size_t min_bars = 1)
            : script_(std::move(script)), min_bars_(min_bars) {}

        Decision evaluate(const MarketView& view, const std::optional<PositionView>& position) override {
            ++evaluations;
            last_bar_count = view.bars.size();
            last_funding = view.funding_rate;
            return script_(view, position);
        }
        void configure(const boost::property_tree::ptree&) override { }
        std::size_t minimum_bars_required() const override { return min_bars_; }
        const std::string& name() const override { return name_; }
        void on_position_closed(const std::string& symbol, long long ts) override {
            closes.emplace_back(symbol, ts);
        }

        int evaluations = 0;
        std::size_t last_bar_count = 0;
        std::optional<double> last_funding;
        std::vector<std::pair<std::string, long long>> closes;

    private:
        Script script_;
        std::size_t min_bars_;
        std::string name_ = "scripted";
    };

    inline std::shared_ptr<ScriptedStrategy> always_hold() {
        return std::make_shared<ScriptedStrategy>([](const MarketView&, const std::optional<PositionView>&) {
            return Decision{ HoldDecision{} };
        });
    }

    // Opens `direction` once per symbol whenever flat, with optional stop / target
    inline std::shared_ptr<ScriptedStrategy> open_once(Dto::Direction direction,
        std::optional<double> stop_loss = std::nullopt, std::optional<double> take_profit = std::nullopt)
    {
        auto opened = std::make_shared<std::map<std::string, bool>>();
        return std::make_shared<ScriptedStrategy>([=](const MarketView& view, const std::optional<PositionView>& position) {
            if (position || (*opened)[view.symbol]) {
                return Decision{ HoldDecision{} };
            }
            (*opened)[view.symbol] = true;
            OpenDecision open;
            open.direction = direction;
            open.confidence = 1.0;
            open.stop_loss = stop_loss;
            open.take_profit = take_profit;
            open.reason = "scripted";
            return Decision{ open };
        });
    }

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

    // One bar per close, `step` apart, each with a +-0.5 range
    inline BarSeries series(const std::vector<double>& closes, long long start = 0, long long step = kMinute) {
        BarSeries bars;
        for (std::size_t i = 0; i < closes.size(); ++i) {
            const double c = closes[i];
            const double o = i == 0 ? c : closes[i - 1];
            bars.push_back(bar(start + static_cast<long long>(i) * step, o, std::max(o, c) + 0.5, std::min(o, c) - 0.5, c));
        }
        return bars;
    }

    inline std::unique_ptr<SimulationEngine> make_engine(const Decimal& equity = Decimal(10000),
        std::shared_ptr<ILedgerStore> store = std::make_shared<InMemoryLedgerStore>())
    {
        EngineConfig config;
        return std::make_unique<SimulationEngine>(
            Ledger::create("paper", equity, 2.0, config.maker_fee_rate, config.taker_fee_rate, 0), config, store);
    }

    // Scripted live source: a fixed series per symbol plus injected failures
    class FakeMarketSource : public PaperPerp::Infra::Exanges::IMarketDataSource {
    public:
        void set(const std::string& symbol, BarSeries bars, std::optional<double> funding = std::nullopt) {
            std::lock_guard<std::mutex> lock(mtx_);
            bars_[symbol] = std::move(bars);
            funding_[symbol] = funding;
        }

        // Next `count` fetches of symbol throw TransientError
        void fail_next(const std::string& symbol, int count) {
            std::lock_guard<std::mutex> lock(mtx_);
            failures_[symbol] = count;
        }

        // A fetch of symbol throws a non-retryable error
        void break_symbol(const std::string& symbol) {
            std::lock_guard<std::mutex> lock(mtx_);
            broken_[symbol] = true;
        }

        BarSeries fetch_bars(const std::string& symbol, std::size_t limit) override {
            std::lock_guard<std::mutex> lock(mtx_);
            ++fetches[symbol];
            if (broken_[symbol]) {
                throw std::runtime_error("feed for " + symbol + " is corrupt");
            }
            if (failures_[symbol] > 0) {
                --failures_[symbol];
                throw PaperPerp::Utils::Retry::TransientError("rate limited");
            }
            const auto& all = bars_.at(symbol);
            const std::size_t n = std::min(limit, all.size());
            return BarSeries(all.end() - static_cast<std::ptrdiff_t>(n), all.end());
        }

        double latest_price(const std::string& symbol) override {
            std::lock_guard<std::mutex> lock(mtx_);
            return bars_.at(symbol).back().ClosePrice;
        }

        std::optional<double> funding_rate(const std::string& symbol) override {
            std::lock_guard<std::mutex> lock(mtx_);
            return funding_[symbol];
        }

        std::map<std::string, int> fetches;

    private:
        std::mutex mtx_;
        std::map<std::string, BarSeries> bars_;
        std::map<std::string, std::optional<double>> funding_;
        std::map<std::string, int> failures_;
        std::map<std::string, bool> broken_;
    };
}
