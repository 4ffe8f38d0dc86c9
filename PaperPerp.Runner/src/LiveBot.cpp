#include "LiveBot.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include "SignalTrap.hpp"
#include "SummaryPrinter.hpp"

namespace PaperPerp::Runner {
    using PaperPerp::Utils::Numeric::from_double;
    using PaperPerp::Utils::Numeric::to_double;
    using PaperPerp::Utils::Retry::TransientError;
    using PaperPerp::Utils::Retry::with_backoff;

    LiveBot::LiveBot(SimulationEngine& engine,
        std::shared_ptr<Strategy::IStrategy> strategy,
        std::shared_ptr<Infra::Exanges::IMarketDataSource> market,
        BotSettings settings,
        double size_percent,
        std::shared_ptr<IClock> clock,
        std::shared_ptr<Infra::Exanges::ISentimentSource> sentiment)
        : engine_(engine),
          strategy_(strategy),
          market_(std::move(market)),
          sentiment_(std::move(sentiment)),
          settings_(std::move(settings)),
          clock_(std::move(clock)),
          processor_(engine, strategy, TickSettings{ size_percent, true }),
          pool_(settings_.fetch_workers, std::max<std::size_t>(settings_.symbols.size(), 1))
    {
        if (!market_ || !clock_) {
            throw std::invalid_argument("LiveBot needs a market data source and a clock");
        }
        if (settings_.symbols.empty()) {
            throw std::invalid_argument("LiveBot needs at least one symbol");
        }
    }

    LiveBot::~LiveBot() {
        join();
    }

    void LiveBot::start(RunHandle& handle) {
        if (worker_thread_.joinable()) {
            std::cout << "[LiveBot::start] Thread is already running!" << std::endl;
            return;
        }
        std::cout << "[LiveBot::start] Starting thread..." << std::endl;
        worker_thread_ = boost::thread([this, &handle] { run(handle); });
    }

    void LiveBot::join() {
        if (worker_thread_.joinable()) {
            worker_thread_.join();
        }
    }

    SymbolSnapshot LiveBot::fetch_symbol(const std::string& symbol, long long now) {
        SymbolSnapshot snapshot;
        snapshot.symbol = symbol;
        snapshot.timestamp = now;
        snapshot.bars = market_->fetch_bars(symbol, settings_.bars_limit);
        snapshot.price = market_->latest_price(symbol);
        snapshot.funding_rate = market_->funding_rate(symbol);
        if (sentiment_) {
            snapshot.sentiment = sentiment_->latest(symbol);
        }
        return snapshot;
    }

    std::vector<SymbolSnapshot> LiveBot::fetch_all(long long now) {
        std::vector<std::pair<std::string, std::future<SymbolSnapshot>>> pending;
        for (const auto& symbol : settings_.symbols) {
            pending.emplace_back(symbol, pool_.submit([this, symbol, now] {
                return with_backoff(settings_.retry, "fetch " + symbol,
                    [this, &symbol, now] { return fetch_symbol(symbol, now); },
                    [this](std::chrono::milliseconds delay) { clock_->sleep(delay); });
            }));
        }

        std::vector<SymbolSnapshot> snapshots;
        for (auto& [symbol, future] : pending) {
            try {
                snapshots.push_back(future.get());
            }
            catch (const TransientError& e) {
                ++skipped_fetches_;
                std::cerr << "[LiveBot::fetch_all] skipping " << symbol << " this tick: " << e.what() << std::endl;
            }
        }
        return snapshots;
    }

    std::optional<std::pair<RunState, std::string>> LiveBot::check_breakers(long long started_at) const {
        const long long elapsed_ms = clock_->now_ms() - started_at;
        if (settings_.duration.count() > 0 && elapsed_ms >= settings_.duration.count() * 1000) {
            return std::make_pair(RunState::StoppedByTimeLimit,
                "time limit of " + std::to_string(settings_.duration.count()) + " s reached");
        }
        if (settings_.max_loss > 0.0) {
            const double total_pnl = to_double(engine_.summary().total_pnl);
            if (total_pnl <= -settings_.max_loss) {
                return std::make_pair(RunState::StoppedByLossLimit,
                    "loss " + std::to_string(total_pnl) + " crossed floor -" + std::to_string(settings_.max_loss));
            }
        }
        return std::nullopt;
    }

    void LiveBot::shutdown(RunHandle& handle, RunState state, const std::string& reason) {
        processor_.set_allow_opens(false);
        engine_.halt();
        print_summary(std::cout, engine_.summary(), "Final summary (" + to_string(state) + ": " + reason + ")");
        handle.finish(state, reason);
    }

    void LiveBot::run(RunHandle& handle) {
        handle.begin();
        const long long started_at = clock_->now_ms();
        std::cout << "[LiveBot::run] " << strategy_->name() << " on " << settings_.symbols.size()
            << " symbols, tick " << settings_.tick_interval.count() << " ms" << std::endl;

        try {
            while (true) {
                if (SignalTrap::triggered()) {
                    handle.request_stop("signal " + std::to_string(SignalTrap::last_signal()));
                }
                if (handle.stop_requested()) {
                    shutdown(handle, RunState::StoppedBySignal, handle.requested_reason());
                    return;
                }

                const long long now = clock_->now_ms();
                auto report = processor_.process(fetch_all(now));
                ++ticks_;
                if (report.rejected > 0) {
                    std::cerr << "[LiveBot::run] tick " << ticks_ << ": " << report.rejected << " rejected requests" << std::endl;
                }
                if (ticks_ % settings_.summary_every_ticks == 0) {
                    print_summary(std::cout, engine_.summary(), "Summary after tick " + std::to_string(ticks_));
                }

                if (auto breaker = check_breakers(started_at)) {
                    std::cout << "[LiveBot::run] breaker tripped: " << breaker->second << std::endl;
                    shutdown(handle, breaker->first, breaker->second);
                    return;
                }
                if (market_->exhausted()) {
                    std::cout << "[LiveBot::run] market data exhausted after tick " << ticks_ << std::endl;
                    shutdown(handle, RunState::Completed, "market data exhausted");
                    return;
                }

                clock_->wait(settings_.tick_interval, handle);
            }
        }
        catch (const std::exception& e) {
            std::cerr << "[LiveBot::run] tick " << ticks_ + 1 << " failed: " << e.what() << std::endl;
            shutdown(handle, RunState::Error, e.what());
        }
    }
}
