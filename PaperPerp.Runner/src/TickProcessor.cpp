#include "TickProcessor.hpp"
#include <iostream>
#include <stdexcept>

namespace PaperPerp::Runner {
    using namespace PaperPerp::Infra::Exanges::PaperSimulator;
    using PaperPerp::Utils::Numeric::from_double;
    using PaperPerp::Utils::Numeric::to_string;
    using Dto::CloseReason;

    TickProcessor::TickProcessor(SimulationEngine& engine, std::shared_ptr<Strategy::IStrategy> strategy, TickSettings settings)
        : engine_(engine), strategy_(std::move(strategy)), settings_(settings)
    {
        if (!strategy_) {
            throw std::invalid_argument("TickProcessor needs a strategy");
        }
        if (!(settings_.size_percent > 0.0 && settings_.size_percent <= 100.0)) {
            throw std::invalid_argument("size_percent must be in (0, 100]");
        }
    }

    TickReport TickProcessor::process(const std::vector<SymbolSnapshot>& snapshots) {
        TickReport report;
        auto tx = engine_.transaction();

        for (const auto& snapshot : snapshots) {
            if (snapshot.bars.empty() || !(snapshot.price > 0.0)) {
                std::cerr << "[TickProcessor::process] no usable price for " << snapshot.symbol << ", skipped" << std::endl;
                continue;
            }
            apply_triggers(snapshot, report);

            Strategy::MarketView view;
            view.symbol = snapshot.symbol;
            view.bars = snapshot.bars;
            view.now = snapshot.timestamp;
            view.funding_rate = snapshot.funding_rate;
            view.sentiment = snapshot.sentiment;

            std::optional<Strategy::PositionView> position;
            if (const auto* open = engine_.ledger().find_open(snapshot.symbol)) {
                position = *open;
            }
            apply_decision(snapshot, strategy_->evaluate(view, position), report);
        }

        tx.commit();
        return report;
    }

    void TickProcessor::apply_triggers(const SymbolSnapshot& snapshot, TickReport& report) {
        const auto* open = engine_.ledger().find_open(snapshot.symbol);
        if (!open) {
            return;
        }
        const Decimal price = from_double(snapshot.price);
        auto trigger = snapshot.bar_triggers
            ? engine_.check_risk_triggers(*open, snapshot.bars.back())
            : engine_.check_risk_triggers(*open, price);

        if (trigger) {
            const long long position_id = open->id;
            auto outcome = engine_.close(position_id, trigger->reference_price, trigger->reason, snapshot.timestamp);
            if (outcome) {
                ++report.closed_by_trigger;
                strategy_->on_position_closed(snapshot.symbol, snapshot.timestamp);
            }
            else {
                ++report.rejected;
                std::cerr << "[TickProcessor::apply_triggers] " << snapshot.symbol << " "
                    << Dto::to_string(trigger->reason) << " close rejected: " << outcome.rejection().reason << std::endl;
            }
            return;
        }

        engine_.mark(snapshot.symbol, price);
        engine_.update_trailing_stop(snapshot.symbol, price);
    }

    void TickProcessor::apply_decision(const SymbolSnapshot& snapshot, const Strategy::Decision& decision, TickReport& report) {
        if (const auto* open = std::get_if<Strategy::OpenDecision>(&decision)) {
            if (!settings_.allow_opens) {
                ++report.held;
                return;
            }
            OpenRequest request;
            request.symbol = snapshot.symbol;
            request.direction = open->direction;
            request.size = PositionSize::percent_of_balance(from_double(open->size_percent.value_or(settings_.size_percent)));
            request.reference_price = from_double(snapshot.price);
            if (open->stop_loss) request.stop_loss = from_double(*open->stop_loss);
            if (open->take_profit) request.take_profit = from_double(*open->take_profit);
            if (open->trailing_distance) request.trailing_distance = from_double(*open->trailing_distance);
            request.strategy = strategy_->name();
            request.timestamp = snapshot.timestamp;

            auto outcome = engine_.open(request);
            if (outcome) {
                ++report.opened;
                std::cout << "[TickProcessor] " << strategy_->name() << " " << Strategy::to_string(decision) << std::endl;
            }
            else {
                ++report.rejected;
            }
            return;
        }

        if (const auto* close = std::get_if<Strategy::CloseDecision>(&decision)) {
            const auto* position = engine_.ledger().find_open(snapshot.symbol);
            if (!position) {
                ++report.held;
                return;
            }
            auto outcome = engine_.close(position->id, from_double(snapshot.price), CloseReason::Strategy, snapshot.timestamp);
            if (outcome) {
                ++report.closed_by_strategy;
                strategy_->on_position_closed(snapshot.symbol, snapshot.timestamp);
                std::cout << "[TickProcessor] " << snapshot.symbol << " closed: " << close->reason
                    << ", net " << to_string(outcome.value().net_pnl, 2) << std::endl;
            }
            else {
                ++report.rejected;
            }
            return;
        }

        ++report.held;
    }
}
