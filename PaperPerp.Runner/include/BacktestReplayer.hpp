#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include "Analytics/Statistics.hpp"
#include "Exanges/PaperSimulator/DataProvider/MarketData.hpp"
#include "RunHandle.hpp"
#include "RunnerConfig.hpp"
#include "TickProcessor.hpp"

namespace PaperPerp::Runner {
    struct BacktestResult {
        RunState    state = RunState::Idle;
        std::string stop_reason;
        std::size_t steps = 0;
        int         force_closed = 0;
        Infra::Analytics::TradeStatistics statistics;
        Infra::Exanges::PaperSimulator::AccountSummary summary;
    };

    /**
     * Replays recorded series through the same TickProcessor step the live
     * loop uses, without waiting. Several symbols are merged on one timeline;
     * at each timestamp every symbol with a bar there is stepped, with stops
     * checked against that bar's range. When the data runs out, positions
     * still open are closed at their last close as END_OF_DATA, then the
     * statistics are computed from the trade list.
     * The engine must hold a fresh account: no trades and no open positions.
     */
    class BacktestReplayer {
    public:
        BacktestReplayer(SimulationEngine& engine, std::shared_ptr<Strategy::IStrategy> strategy,
            BacktestSettings settings, double size_percent);

        void add(Infra::Exanges::PaperSimulator::MarketData data);

        BacktestResult run();
        BacktestResult run(RunHandle& handle);

        // Strategy evaluated on the replay thread; evaluate_timeout_ms is ignored
        static std::shared_ptr<Strategy::IStrategy> make_strategy(const StrategySettings& settings);

        // Engine over a new in-memory account; account.store_dir is not read
        static std::unique_ptr<SimulationEngine> make_engine(const RunnerConfig& config);

    private:
        SimulationEngine& engine_;
        std::shared_ptr<Strategy::IStrategy> strategy_;
        BacktestSettings settings_;
        TickProcessor processor_;
        std::map<std::string, Infra::Exanges::PaperSimulator::MarketData> series_;

        int force_close_all(long long timestamp);
        BacktestResult finish(RunHandle& handle, RunState state, const std::string& reason, std::size_t steps, int force_closed);
    };
}
