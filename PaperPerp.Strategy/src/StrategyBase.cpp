#include "StrategyBase.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace PaperPerp::Strategy {
    StrategyBase::StrategyBase(std::string name, double cooldown_seconds)
        : name_(std::move(name)), cooldown_ms_(0)
    {
        set_cooldown_seconds(cooldown_seconds);
    }

    void StrategyBase::set_cooldown_seconds(double seconds) {
        if (!(seconds >= 0.0)) {
            throw std::invalid_argument("cooldown_seconds must be >= 0");
        }
        cooldown_ms_ = static_cast<long long>(std::llround(seconds * 1000.0));
    }

    void StrategyBase::on_position_closed(const std::string& symbol, long long timestamp) {
        cooldown_until_[symbol] = timestamp + cooldown_ms_;
        had_position_[symbol] = false;
    }

    bool StrategyBase::in_cooldown(const std::string& symbol, long long now) const {
        auto it = cooldown_until_.find(symbol);
        return it != cooldown_until_.end() && now < it->second;
    }

    Decision StrategyBase::evaluate(const MarketView& view, const std::optional<PositionView>& position) {
        bool& had = had_position_[view.symbol];
        if (had && !position) {
            on_position_closed(view.symbol, view.now);
        }
        had_position_[view.symbol] = position.has_value();

        if (view.bars.size() < minimum_bars_required()) {
            return HoldDecision{};
        }
        if (position) {
            return decide_exit(view, *position);
        }
        if (in_cooldown(view.symbol, view.now)) {
            return HoldDecision{};
        }
        return decide_entry(view);
    }
}
