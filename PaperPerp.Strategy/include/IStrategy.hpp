#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <boost/property_tree/ptree.hpp>
#include "Decision.hpp"
#include "MarketView.hpp"

namespace PaperPerp::Strategy {
    /**
     * Decision boundary shared by the live loop and the backtest replayer.
     * Implementations never touch the ledger; they look at the market view and
     * the current position (if any) and answer OPEN, CLOSE or HOLD.
     */
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        virtual Decision evaluate(const MarketView& view, const std::optional<PositionView>& position) = 0;

        // Replace the configuration; throws std::invalid_argument naming the bad field
        virtual void configure(const boost::property_tree::ptree& options) = 0;

        virtual std::size_t minimum_bars_required() const = 0;

        virtual const std::string& name() const = 0;

        // Driver notification that the strategy's position on symbol was closed
        virtual void on_position_closed(const std::string& symbol, long long timestamp) { }
    };
}
