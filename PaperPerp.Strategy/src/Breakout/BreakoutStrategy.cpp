#include "Breakout/BreakoutStrategy.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include "Indicators/Indicators.hpp"
#include "Options.hpp"

namespace PaperPerp::Strategy::Breakout {
    using Dto::Direction;
    namespace ind = PaperPerp::Strategy::Indicators;

    void BreakoutConfig::validate() const {
        require(lookback >= 2, "lookback", "must be >= 2");
        require(breakout_threshold_pct >= 0.0, "breakout_threshold_pct", "must be >= 0");
        require(min_volume_ratio >= 0.0, "min_volume_ratio", "must be >= 0");
        require(momentum_period >= 1, "momentum_period", "must be >= 1");
        require(atr_period >= 1, "atr_period", "must be >= 1");
        require(atr_stop_multiplier > 0.0, "atr_stop_multiplier", "must be > 0");
        require(min_stop_pct >= 0.0 && min_stop_pct < 100.0, "min_stop_pct", "must be in [0, 100)");
        require(reward_risk > 0.0, "reward_risk", "must be > 0");
        require(trailing_atr_multiplier >= 0.0, "trailing_atr_multiplier", "must be >= 0");
        require(consolidation_threshold_pct >= 0.0, "consolidation_threshold_pct", "must be >= 0");
        require(size_percent >= 0.0 && size_percent <= 100.0, "size_percent", "must be in [0, 100]");
        require(sentiment_veto >= 0.0 && sentiment_veto <= 1.0, "sentiment_veto", "must be in [0, 1]");
        require(sentiment_min_confidence >= 0.0 && sentiment_min_confidence <= 1.0,
            "sentiment_min_confidence", "must be in [0, 1]");
        require(cooldown_seconds >= 0.0, "cooldown_seconds", "must be >= 0");
    }

    BreakoutConfig BreakoutConfig::from_ptree(const boost::property_tree::ptree& options) {
        return from_ptree(options, BreakoutConfig{});
    }

    BreakoutConfig BreakoutConfig::from_ptree(const boost::property_tree::ptree& options, const BreakoutConfig& defaults) {
        reject_unknown_options(options, {
            "lookback", "breakout_threshold_pct", "min_volume_ratio", "momentum_period", "atr_period",
            "atr_stop_multiplier", "min_stop_pct", "reward_risk", "trailing_atr_multiplier",
            "consolidation_threshold_pct", "size_percent", "use_sentiment", "sentiment_veto",
            "sentiment_min_confidence" }, "breakout");

        BreakoutConfig cfg = defaults;
        cfg.lookback = read_option(options, "lookback", cfg.lookback);
        cfg.breakout_threshold_pct = read_option(options, "breakout_threshold_pct", cfg.breakout_threshold_pct);
        cfg.min_volume_ratio = read_option(options, "min_volume_ratio", cfg.min_volume_ratio);
        cfg.momentum_period = read_option(options, "momentum_period", cfg.momentum_period);
        cfg.atr_period = read_option(options, "atr_period", cfg.atr_period);
        cfg.atr_stop_multiplier = read_option(options, "atr_stop_multiplier", cfg.atr_stop_multiplier);
        cfg.min_stop_pct = read_option(options, "min_stop_pct", cfg.min_stop_pct);
        cfg.reward_risk = read_option(options, "reward_risk", cfg.reward_risk);
        cfg.trailing_atr_multiplier = read_option(options, "trailing_atr_multiplier", cfg.trailing_atr_multiplier);
        cfg.consolidation_threshold_pct = read_option(options, "consolidation_threshold_pct", cfg.consolidation_threshold_pct);
        cfg.size_percent = read_option(options, "size_percent", cfg.size_percent);
        cfg.use_sentiment = read_option(options, "use_sentiment", cfg.use_sentiment);
        cfg.sentiment_veto = read_option(options, "sentiment_veto", cfg.sentiment_veto);
        cfg.sentiment_min_confidence = read_option(options, "sentiment_min_confidence", cfg.sentiment_min_confidence);
        cfg.cooldown_seconds = read_option(options, "cooldown_seconds", cfg.cooldown_seconds);
        cfg.validate();
        return cfg;
    }

    BreakoutStrategy::BreakoutStrategy(BreakoutConfig config)
        : StrategyBase("breakout", config.cooldown_seconds), config_(std::move(config))
    {
        config_.validate();
    }

    void BreakoutStrategy::configure(const boost::property_tree::ptree& options) {
        config_ = BreakoutConfig::from_ptree(options, config_);
        set_cooldown_seconds(config_.cooldown_seconds);
    }

    std::size_t BreakoutStrategy::minimum_bars_required() const {
        return std::max({ config_.lookback, config_.atr_period, config_.momentum_period }) + 1;
    }

    bool BreakoutStrategy::vetoed_by_sentiment(const MarketView& view, Direction direction) const {
        if (!config_.use_sentiment || !view.sentiment) {
            return false;
        }
        const auto& s = *view.sentiment;
        if (s.Confidence < config_.sentiment_min_confidence) {
            return false;
        }
        return Dto::sign(direction) * s.Score <= -config_.sentiment_veto;
    }

    Decision BreakoutStrategy::decide_entry(const MarketView& view) {
        const auto resistance = ind::highest_high(view.bars, config_.lookback);
        const auto support = ind::lowest_low(view.bars, config_.lookback);
        const auto avg_volume = ind::average_volume(view.bars, config_.lookback);
        const auto momentum = ind::change_percent(view.bars, config_.momentum_period);
        const auto atr = ind::atr(view.bars, config_.atr_period);
        if (!resistance || !support || !avg_volume || !momentum || !atr) {
            return HoldDecision{};
        }

        const auto& bar = view.bars.back();
        const double close = bar.ClosePrice;
        const double volume_ratio = *avg_volume > 0.0 ? bar.Volume / *avg_volume : 0.0;
        if (volume_ratio < config_.min_volume_ratio) {
            return HoldDecision{};
        }

        const double upper = *resistance * (1.0 + config_.breakout_threshold_pct / 100.0);
        const double lower = *support * (1.0 - config_.breakout_threshold_pct / 100.0);

        std::optional<Direction> direction;
        double penetration_pct = 0.0;
        if (close > upper && *momentum > 0.0) {
            direction = Direction::Long;
            penetration_pct = (close - *resistance) / *resistance * 100.0;
        }
        else if (close < lower && *momentum < 0.0) {
            direction = Direction::Short;
            penetration_pct = (*support - close) / *support * 100.0;
        }
        if (!direction) {
            return HoldDecision{};
        }
        if (vetoed_by_sentiment(view, *direction)) {
            std::cout << "[BreakoutStrategy] " << view.symbol << " breakout vetoed by sentiment" << std::endl;
            return HoldDecision{};
        }

        const double stop_distance = std::max(*atr * config_.atr_stop_multiplier, close * config_.min_stop_pct / 100.0);
        const int sign = Dto::sign(*direction);

        OpenDecision open;
        open.direction = *direction;
        open.stop_loss = close - sign * stop_distance;
        open.take_profit = close + sign * stop_distance * config_.reward_risk;
        if (config_.trailing_atr_multiplier > 0.0) {
            open.trailing_distance = *atr * config_.trailing_atr_multiplier;
        }
        if (config_.size_percent > 0.0) {
            open.size_percent = config_.size_percent;
        }
        const double threshold = std::max(config_.breakout_threshold_pct, 0.1);
        const double volume_bonus = config_.min_volume_ratio > 0.0
            ? (volume_ratio - config_.min_volume_ratio) / config_.min_volume_ratio
            : volume_ratio;
        open.confidence = std::clamp(0.5 + 0.1 * penetration_pct / threshold + 0.2 * volume_bonus, 0.0, 1.0);
        open.reason = std::string(*direction == Direction::Long ? "resistance" : "support")
            + " breakout, volume x" + std::to_string(volume_ratio);
        return open;
    }

    Decision BreakoutStrategy::decide_exit(const MarketView& view, const PositionView& position) {
        const auto high = ind::highest_high(view.bars, config_.lookback);
        const auto low = ind::lowest_low(view.bars, config_.lookback);
        if (!high || !low || *low <= 0.0) {
            return HoldDecision{};
        }
        const double range_pct = (*high - *low) / *low * 100.0;
        if (range_pct < config_.consolidation_threshold_pct) {
            return CloseDecision{ "range contracted to " + std::to_string(range_pct) + "%" };
        }
        return HoldDecision{};
    }
}
