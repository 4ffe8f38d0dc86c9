#pragma once

#include <cstddef>
#include "StrategyBase.hpp"

namespace PaperPerp::Strategy::FundingCarry {
    struct FundingCarryConfig {
        double min_rate = 0.01;                 // percent per funding period
        double exit_fraction = 0.5;             // close once the rate decays below exit_fraction * min_rate
        double min_hold_hours = 24.0;           // decay exit waits this long; a negative rate does not
        double max_price_deviation_pct = 10.0;
        double stop_loss_pct = 5.0;
        double take_profit_pct = 5.0;
        double size_percent = 0.0;
        double cooldown_seconds = 3600.0;

        void validate() const;
        static FundingCarryConfig from_ptree(const boost::property_tree::ptree& options);
        static FundingCarryConfig from_ptree(const boost::property_tree::ptree& options, const FundingCarryConfig& defaults);
    };

    // Collects positive funding by holding the short perpetual leg
    class FundingCarryStrategy : public StrategyBase {
    public:
        explicit FundingCarryStrategy(FundingCarryConfig config = {});

        void configure(const boost::property_tree::ptree& options) override;
        std::size_t minimum_bars_required() const override { return 1; }

        const FundingCarryConfig& config() const { return config_; }

    protected:
        Decision decide_entry(const MarketView& view) override;
        Decision decide_exit(const MarketView& view, const PositionView& position) override;

    private:
        FundingCarryConfig config_;
    };
}
