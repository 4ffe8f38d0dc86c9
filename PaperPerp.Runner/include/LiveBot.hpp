#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/thread.hpp>
#include "Clock.hpp"
#include "Exanges/IMarketDataSource.h"
#include "RunHandle.hpp"
#include "RunnerConfig.hpp"
#include "TickProcessor.hpp"
#include "Threading/WorkerPool.hpp"

namespace PaperPerp::Runner {
    /**
     * Polling loop of one bot. Every tick:
     *   fetch bars / price / funding per symbol on the worker pool (with retry),
     *   run the shared TickProcessor step, print a summary every N ticks, then
     *   check the time limit and loss floor breakers. A finite source that has
 *   nothing new left ends the run as COMPLETED.
     * A tripped breaker, a stop request or a trapped signal halts the engine:
     * nothing is opened or closed afterwards, open positions stay open and are
     * listed in the final summary.
     */
    class LiveBot {
    public:
        LiveBot(SimulationEngine& engine,
            std::shared_ptr<Strategy::IStrategy> strategy,
            std::shared_ptr<Infra::Exanges::IMarketDataSource> market,
            BotSettings settings,
            double size_percent,
            std::shared_ptr<IClock> clock = std::make_shared<SystemClock>(),
            std::shared_ptr<Infra::Exanges::ISentimentSource> sentiment = nullptr);
        ~LiveBot();

        LiveBot(const LiveBot&) = delete;
        LiveBot& operator=(const LiveBot&) = delete;

        // Runs on the calling thread until a terminal state
        void run(RunHandle& handle);

        // Runs on a background boost::thread; join() waits for it
        void start(RunHandle& handle);
        void join();

        int ticks() const { return ticks_; }
        int skipped_fetches() const { return skipped_fetches_; }

    private:
        SimulationEngine& engine_;
        std::shared_ptr<Strategy::IStrategy> strategy_;
        std::shared_ptr<Infra::Exanges::IMarketDataSource> market_;
        std::shared_ptr<Infra::Exanges::ISentimentSource> sentiment_;
        BotSettings settings_;
        std::shared_ptr<IClock> clock_;
        TickProcessor processor_;
        Utils::Threading::WorkerPool pool_;
        boost::thread worker_thread_;
        int ticks_ = 0;
        int skipped_fetches_ = 0;

        std::vector<SymbolSnapshot> fetch_all(long long now);
        SymbolSnapshot fetch_symbol(const std::string& symbol, long long now);

        // Terminal state the breakers call for, if any
        std::optional<std::pair<RunState, std::string>> check_breakers(long long started_at) const;
        void shutdown(RunHandle& handle, RunState state, const std::string& reason);
    };
}
