#pragma once

#include <map>
#include <string>
#include "IStrategy.hpp"

namespace PaperPerp::Strategy {
    /**
     * Shared evaluate() flow for the concrete families:
     *  - fewer bars than minimum_bars_required() -> HOLD
     *  - with a position -> decide_exit()
     *  - without one, inside the post-close cooldown of that symbol -> HOLD
     *  - otherwise -> decide_entry()
     * A position that disappears between two calls counts as closed at the
     * later call's timestamp, so stop-loss closes also start the cooldown.
     */
    class StrategyBase : public IStrategy {
    public:
        Decision evaluate(const MarketView& view, const std::optional<PositionView>& position) final;
        void on_position_closed(const std::string& symbol, long long timestamp) override;
        const std::string& name() const override { return name_; }

        bool in_cooldown(const std::string& symbol, long long now) const;

    protected:
        StrategyBase(std::string name, double cooldown_seconds);

        virtual Decision decide_entry(const MarketView& view) = 0;
        virtual Decision decide_exit(const MarketView& view, const PositionView& position) = 0;

        void set_cooldown_seconds(double seconds);

    private:
        std::string name_;
        long long cooldown_ms_;
        std::map<std::string, long long> cooldown_until_;
        std::map<std::string, bool> had_position_;
    };
}
