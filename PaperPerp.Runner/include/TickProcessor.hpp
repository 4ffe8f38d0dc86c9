#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Dto/Market/Bar.hpp"
#include "Dto/Market/Sentiment.hpp"
#include "Exanges/PaperSimulator/Engine/SimulationEngine.hpp"
#include "IStrategy.hpp"

namespace PaperPerp::Runner {
    using Infra::Exanges::PaperSimulator::SimulationEngine;

    // Market state of one symbol at one step
    struct SymbolSnapshot {
        std::string                                 symbol;
        Dto::Market::BarSeries                      bars;
        double                                      price = 0.0;    // mark / reference price
        std::optional<double>                       funding_rate;
        std::optional<Dto::Market::SentimentDto>    sentiment;
        long long                                   timestamp = 0;
        bool                                        bar_triggers = false;   // check SL/TP against the last bar's range
    };

    struct TickReport {
        int opened = 0;
        int closed_by_trigger = 0;
        int closed_by_strategy = 0;
        int rejected = 0;
        int held = 0;
    };

    struct TickSettings {
        double size_percent = 10.0;
        bool   allow_opens = true;
    };

    /**
     * The per-step sequence both drivers share, run inside one ledger
     * transaction for the whole step:
     *   1. stop-loss / take-profit / trailing triggers against the new price
     *   2. mark to market and trail stops of surviving positions
     *   3. strategy evaluate per symbol
     *   4. OPEN / CLOSE decisions through the engine
     * Any exception leaves the ledger as it was before the step.
     */
    class TickProcessor {
    public:
        TickProcessor(SimulationEngine& engine, std::shared_ptr<Strategy::IStrategy> strategy, TickSettings settings);

        TickReport process(const std::vector<SymbolSnapshot>& snapshots);

        void set_allow_opens(bool allow) { settings_.allow_opens = allow; }
        const Strategy::IStrategy& strategy() const { return *strategy_; }

    private:
        SimulationEngine& engine_;
        std::shared_ptr<Strategy::IStrategy> strategy_;
        TickSettings settings_;

        void apply_triggers(const SymbolSnapshot& snapshot, TickReport& report);
        void apply_decision(const SymbolSnapshot& snapshot, const Strategy::Decision& decision, TickReport& report);
    };
}
