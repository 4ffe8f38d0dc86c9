#pragma once

#include <cstddef>
#include "StrategyBase.hpp"

namespace PaperPerp::Strategy::Breakout {
    struct BreakoutConfig {
        std::size_t lookback = 20;                  // bars forming support / resistance
        double      breakout_threshold_pct = 0.5;   // close must clear the band by this much
        double      min_volume_ratio = 1.5;         // last volume against the lookback average
        std::size_t momentum_period = 3;
        std::size_t atr_period = 14;
        double      atr_stop_multiplier = 2.0;
        double      min_stop_pct = 1.0;             // floor on the stop distance, percent of price
        double      reward_risk = 2.0;              // take-profit distance / stop distance
        double      trailing_atr_multiplier = 0.0;  // 0 disables the trailing distance
        double      consolidation_threshold_pct = 1.0;
        double      size_percent = 0.0;             // 0 leaves sizing to the driver
        bool        use_sentiment = false;
        double      sentiment_veto = 0.3;           // opposing score that blocks an entry
        double      sentiment_min_confidence = 0.5;
        double      cooldown_seconds = 300.0;

        void validate() const;
        static BreakoutConfig from_ptree(const boost::property_tree::ptree& options);
        static BreakoutConfig from_ptree(const boost::property_tree::ptree& options, const BreakoutConfig& defaults);
    };

    // Threshold breakout of the rolling support / resistance band
    class BreakoutStrategy : public StrategyBase {
    public:
        explicit BreakoutStrategy(BreakoutConfig config = {});

        void configure(const boost::property_tree::ptree& options) override;
        std::size_t minimum_bars_required() const override;

        const BreakoutConfig& config() const { return config_; }

    protected:
        Decision decide_entry(const MarketView& view) override;
        Decision decide_exit(const MarketView& view, const PositionView& position) override;

    private:
        bool vetoed_by_sentiment(const MarketView& view, Dto::Direction direction) const;

        BreakoutConfig config_;
    };
}
