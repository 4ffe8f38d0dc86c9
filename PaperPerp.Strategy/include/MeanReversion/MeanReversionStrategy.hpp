#pragma once

#include <cstddef>
#include "StrategyBase.hpp"

namespace PaperPerp::Strategy::MeanReversion {
    struct MeanReversionConfig {
        std::size_t rsi_period = 14;
        double      oversold = 30.0;
        double      overbought = 70.0;
        std::size_t impulse_lookback = 4;           // bars measured by the impulse
        double      impulse_threshold_pct = 0.8;
        double      failure_pct = 0.3;              // counter move of the last bar that marks a failed impulse
        std::size_t atr_period = 14;
        double      atr_stop_multiplier = 2.0;
        double      atr_target_multiplier = 3.0;
        double      min_stop_pct = 2.0;
        double      min_target_pct = 3.0;
        double      target_profit = 1000.0;         // currency
        double      max_loss = 500.0;               // currency
        double      max_hold_seconds = 900.0;
        double      size_percent = 0.0;
        double      cooldown_seconds = 120.0;

        void validate() const;
        static MeanReversionConfig from_ptree(const boost::property_tree::ptree& options);
        static MeanReversionConfig from_ptree(const boost::property_tree::ptree& options, const MeanReversionConfig& defaults);
    };

    // Fades an impulse that fails while the RSI sits at an extreme
    class MeanReversionStrategy : public StrategyBase {
    public:
        explicit MeanReversionStrategy(MeanReversionConfig config = {});

        void configure(const boost::property_tree::ptree& options) override;
        std::size_t minimum_bars_required() const override;

        const MeanReversionConfig& config() const { return config_; }

    protected:
        Decision decide_entry(const MarketView& view) override;
        Decision decide_exit(const MarketView& view, const PositionView& position) override;

    private:
        MeanReversionConfig config_;
    };
}
