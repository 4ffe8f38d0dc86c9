#include "BacktestReplayer.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include "Exanges/PaperSimulator/Ledger/InMemoryLedgerStore.hpp"
#include "SignalTrap.hpp"
#include "StrategyFactory.hpp"
#include "SummaryPrinter.hpp"

namespace PaperPerp::Runner {
    using namespace PaperPerp::Infra::Exanges::PaperSimulator;
    using PaperPerp::Utils::Numeric::from_double;
    using PaperPerp::Utils::Numeric::to_double;

    BacktestReplayer::BacktestReplayer(SimulationEngine& engine, std::shared_ptr<Strategy::IStrategy> strategy,
        BacktestSettings settings, double size_percent)
        : engine_(engine),
          strategy_(strategy),
          settings_(std::move(settings)),
          processor_(engine, strategy, TickSettings{ size_percent, true })
    {
    }

    void BacktestReplayer::add(MarketData data) {
        const std::string symbol = data.get_symbol();
        if (series_.count(symbol)) {
            throw std::invalid_argument("series for " + symbol + " added twice");
        }
        series_.emplace(symbol, std::move(data));
    }

    std::shared_ptr<Strategy::IStrategy> BacktestReplayer::make_strategy(const StrategySettings& settings) {
        return Strategy::StrategyFactory::create(settings.name, settings.options, false);
    }

    std::unique_ptr<SimulationEngine> BacktestReplayer::make_engine(const RunnerConfig& config) {
        const auto& account = config.account;
        Ledger ledger = Ledger::create(account.name, account.starting_equity, account.leverage,
            config.engine.maker_fee_rate, config.engine.taker_fee_rate, 0);
        return std::make_unique<SimulationEngine>(std::move(ledger), config.engine,
            std::make_shared<InMemoryLedgerStore>());
    }

    BacktestResult BacktestReplayer::run() {
        RunHandle handle;
        return run(handle);
    }

    int BacktestReplayer::force_close_all(long long timestamp) {
        int closed = 0;
        auto tx = engine_.transaction();
        std::vector<std::pair<long long, std::string>> open;
        for (const auto& [symbol, position] : engine_.ledger().open_positions()) {
            open.emplace_back(position.id, symbol);
        }
        for (const auto& [id, symbol] : open) {
            const double last_close = series_.at(symbol).get_latest_bar().ClosePrice;
            auto outcome = engine_.close(id, from_double(last_close), Dto::CloseReason::EndOfData, timestamp);
            if (!outcome) {
                throw std::runtime_error("end of data close of " + symbol + " rejected: " + outcome.rejection().reason);
            }
            strategy_->on_position_closed(symbol, timestamp);
            ++closed;
        }
        tx.commit();
        return closed;
    }

    BacktestResult BacktestReplayer::finish(RunHandle& handle, RunState state, const std::string& reason,
        std::size_t steps, int force_closed)
    {
        engine_.halt();
        BacktestResult result;
        result.state = state;
        result.stop_reason = reason;
        result.steps = steps;
        result.force_closed = force_closed;
        result.statistics = engine_.performance();
        result.summary = engine_.summary();
        print_statistics(std::cout, result.statistics);
        print_summary(std::cout, result.summary, "Backtest summary (" + to_string(state) + ": " + reason + ")");
        handle.finish(state, reason);
        return result;
    }

    BacktestResult BacktestReplayer::run(RunHandle& handle) {
        if (series_.empty()) {
            throw std::invalid_argument("backtest has no data");
        }
        const auto& ledger = engine_.ledger();
        if (!ledger.trades().empty() || !ledger.open_positions().empty()) {
            throw std::invalid_argument("backtest needs a fresh account, " + ledger.account().name + " has "
                + std::to_string(ledger.trades().size()) + " trades and "
                + std::to_string(ledger.open_positions().size()) + " open positions");
        }
        handle.begin();

        std::set<long long> timeline;
        for (const auto& [symbol, data] : series_) {
            for (const auto& bar : data) {
                timeline.insert(bar.Timestamp);
            }
        }
        const std::size_t window = std::max(settings_.window_bars, strategy_->minimum_bars_required());
        std::map<std::string, std::size_t> cursor;
        std::map<std::string, std::optional<double>> funding;

        std::cout << "[BacktestReplayer::run] " << strategy_->name() << " over " << series_.size()
            << " symbols, " << timeline.size() << " steps" << std::endl;

        std::size_t steps = 0;
        long long last_timestamp = timeline.empty() ? 0 : *timeline.rbegin();
        try {
            for (long long ts : timeline) {
                if (SignalTrap::triggered()) {
                    handle.request_stop("signal " + std::to_string(SignalTrap::last_signal()));
                }
                if (handle.stop_requested()) {
                    return finish(handle, RunState::StoppedBySignal, handle.requested_reason(), steps, 0);
                }

                std::vector<SymbolSnapshot> snapshots;
                for (const auto& [symbol, data] : series_) {
                    std::size_t& index = cursor[symbol];
                    if (index >= data.get_bars_count() || data.get_bar(index).Timestamp != ts) {
                        continue;
                    }
                    const auto& bar = data.get_bar(index);
                    if (bar.FundingRate) {
                        funding[symbol] = bar.FundingRate;
                    }
                    SymbolSnapshot snapshot;
                    snapshot.symbol = symbol;
                    snapshot.bars = data.window(index, window);
                    snapshot.price = bar.ClosePrice;
                    snapshot.funding_rate = funding[symbol];
                    snapshot.timestamp = ts;
                    snapshot.bar_triggers = true;
                    snapshots.push_back(std::move(snapshot));
                    ++index;
                }

                processor_.process(snapshots);
                ++steps;

                if (settings_.max_loss > 0.0) {
                    const double total_pnl = to_double(engine_.summary().total_pnl);
                    if (total_pnl <= -settings_.max_loss) {
                        return finish(handle, RunState::StoppedByLossLimit,
                            "loss " + std::to_string(total_pnl) + " crossed floor -" + std::to_string(settings_.max_loss),
                            steps, 0);
                    }
                }
            }

            const int closed = force_close_all(last_timestamp);
            return finish(handle, RunState::Completed, "end of data", steps, closed);
        }
        catch (const std::exception& e) {
            std::cerr << "[BacktestReplayer::run] step " << steps + 1 << " failed: " << e.what() << std::endl;
            return finish(handle, RunState::Error, e.what(), steps, 0);
        }
    }
}
