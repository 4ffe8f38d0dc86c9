#include "FundingCarry/FundingCarryStrategy.hpp"
#include <algorithm>
#include <cmath>
#include "Numeric/Decimal.hpp"
#include "Options.hpp"

namespace PaperPerp::Strategy::FundingCarry {
    using Dto::Direction;
    using PaperPerp::Utils::Numeric::to_double;

    void FundingCarryConfig::validate() const {
        require(min_rate > 0.0, "min_rate", "must be > 0");
        require(exit_fraction >= 0.0 && exit_fraction <= 1.0, "exit_fraction", "must be in [0, 1]");
        require(min_hold_hours >= 0.0, "min_hold_hours", "must be >= 0");
        require(max_price_deviation_pct > 0.0, "max_price_deviation_pct", "must be > 0");
        require(stop_loss_pct > 0.0 && stop_loss_pct < 100.0, "stop_loss_pct", "must be in (0, 100)");
        require(take_profit_pct > 0.0 && take_profit_pct < 100.0, "take_profit_pct", "must be in (0, 100)");
        require(size_percent >= 0.0 && size_percent <= 100.0, "size_percent", "must be in [0, 100]");
        require(cooldown_seconds >= 0.0, "cooldown_seconds", "must be >= 0");
    }

    FundingCarryConfig FundingCarryConfig::from_ptree(const boost::property_tree::ptree& options) {
        return from_ptree(options, FundingCarryConfig{});
    }

    FundingCarryConfig FundingCarryConfig::from_ptree(const boost::property_tree::ptree& options, const FundingCarryConfig& defaults) {
        reject_unknown_options(options, {
            "min_rate", "exit_fraction", "min_hold_hours", "max_price_deviation_pct",
            "stop_loss_pct", "take_profit_pct", "size_percent" }, "funding_carry");

        FundingCarryConfig cfg = defaults;
        cfg.min_rate = read_option(options, "min_rate", cfg.min_rate);
        cfg.exit_fraction = read_option(options, "exit_fraction", cfg.exit_fraction);
        cfg.min_hold_hours = read_option(options, "min_hold_hours", cfg.min_hold_hours);
        cfg.max_price_deviation_pct = read_option(options, "max_price_deviation_pct", cfg.max_price_deviation_pct);
        cfg.stop_loss_pct = read_option(options, "stop_loss_pct", cfg.stop_loss_pct);
        cfg.take_profit_pct = read_option(options, "take_profit_pct", cfg.take_profit_pct);
        cfg.size_percent = read_option(options, "size_percent", cfg.size_percent);
        cfg.cooldown_seconds = read_option(options, "cooldown_seconds", cfg.cooldown_seconds);
        cfg.validate();
        return cfg;
    }

    FundingCarryStrategy::FundingCarryStrategy(FundingCarryConfig config)
        : StrategyBase("funding_carry", config.cooldown_seconds), config_(std::move(config))
    {
        config_.validate();
    }

    void FundingCarryStrategy::configure(const boost::property_tree::ptree& options) {
        config_ = FundingCarryConfig::from_ptree(options, config_);
        set_cooldown_seconds(config_.cooldown_seconds);
    }

    Decision FundingCarryStrategy::decide_entry(const MarketView& view) {
        if (!view.funding_rate || *view.funding_rate < config_.min_rate) {
            return HoldDecision{};
        }
        const double price = view.last_close();
        const double rate = *view.funding_rate;

        OpenDecision open;
        open.direction = Direction::Short;
        open.stop_loss = price * (1.0 + config_.stop_loss_pct / 100.0);
        open.take_profit = price * (1.0 - config_.take_profit_pct / 100.0);
        if (config_.size_percent > 0.0) {
            open.size_percent = config_.size_percent;
        }
        open.confidence = std::clamp(rate / (2.0 * config_.min_rate), 0.0, 1.0);
        open.reason = "funding " + std::to_string(rate) + "% per period";
        return open;
    }

    Decision FundingCarryStrategy::decide_exit(const MarketView& view, const PositionView& position) {
        const double entry = to_double(position.entry_price);
        if (entry > 0.0) {
            const double deviation_pct = std::abs(view.last_close() - entry) / entry * 100.0;
            if (deviation_pct > config_.max_price_deviation_pct) {
                return CloseDecision{ "price deviated " + std::to_string(deviation_pct) + "% from entry" };
            }
        }
        if (!view.funding_rate) {
            return HoldDecision{};
        }
        const double rate = *view.funding_rate;
        if (rate < 0.0) {
            return CloseDecision{ "funding turned negative" };
        }
        const double held_hours = static_cast<double>(view.now - position.opened_at) / 3600000.0;
        if (rate < config_.exit_fraction * config_.min_rate && held_hours >= config_.min_hold_hours) {
            return CloseDecision{ "funding decayed to " + std::to_string(rate) + "%" };
        }
        return HoldDecision{};
    }
}
