#include "MeanReversion/MeanReversionStrategy.hpp"
#include <algorithm>
#include <cmath>
#include "Indicators/Indicators.hpp"
#include "Numeric/Decimal.hpp"
#include "Options.hpp"

namespace PaperPerp::Strategy::MeanReversion {
    using Dto::Direction;
    using PaperPerp::Utils::Numeric::to_double;
    namespace ind = PaperPerp::Strategy::Indicators;

    void MeanReversionConfig::validate() const {
        require(rsi_period >= 2, "rsi_period", "must be >= 2");
        require(oversold > 0.0 && oversold < 50.0, "oversold", "must be in (0, 50)");
        require(overbought > 50.0 && overbought < 100.0, "overbought", "must be in (50, 100)");
        require(impulse_lookback >= 1, "impulse_lookback", "must be >= 1");
        require(impulse_threshold_pct > 0.0, "impulse_threshold_pct", "must be > 0");
        require(failure_pct >= 0.0, "failure_pct", "must be >= 0");
        require(atr_period >= 1, "atr_period", "must be >= 1");
        require(atr_stop_multiplier > 0.0, "atr_stop_multiplier", "must be > 0");
        require(atr_target_multiplier > 0.0, "atr_target_multiplier", "must be > 0");
        require(min_stop_pct >= 0.0 && min_stop_pct < 100.0, "min_stop_pct", "must be in [0, 100)");
        require(min_target_pct >= 0.0, "min_target_pct", "must be >= 0");
        require(target_profit > 0.0, "target_profit", "must be > 0");
        require(max_loss > 0.0, "max_loss", "must be > 0");
        require(max_hold_seconds > 0.0, "max_hold_seconds", "must be > 0");
        require(size_percent >= 0.0 && size_percent <= 100.0, "size_percent", "must be in [0, 100]");
        require(cooldown_seconds >= 0.0, "cooldown_seconds", "must be >= 0");
    }

    MeanReversionConfig MeanReversionConfig::from_ptree(const boost::property_tree::ptree& options) {
        return from_ptree(options, MeanReversionConfig{});
    }

    MeanReversionConfig MeanReversionConfig::from_ptree(const boost::property_tree::ptree& options, const MeanReversionConfig& defaults) {
        reject_unknown_options(options, {
            "rsi_period", "oversold", "overbought", "impulse_lookback", "impulse_threshold_pct",
            "failure_pct", "atr_period", "atr_stop_multiplier", "atr_target_multiplier", "min_stop_pct",
            "min_target_pct", "target_profit", "max_loss", "max_hold_seconds", "size_percent" }, "mean_reversion");

        MeanReversionConfig cfg = defaults;
        cfg.rsi_period = read_option(options, "rsi_period", cfg.rsi_period);
        cfg.oversold = read_option(options, "oversold", cfg.oversold);
        cfg.overbought = read_option(options, "overbought", cfg.overbought);
        cfg.impulse_lookback = read_option(options, "impulse_lookback", cfg.impulse_lookback);
        cfg.impulse_threshold_pct = read_option(options, "impulse_threshold_pct", cfg.impulse_threshold_pct);
        cfg.failure_pct = read_option(options, "failure_pct", cfg.failure_pct);
        cfg.atr_period = read_option(options, "atr_period", cfg.atr_period);
        cfg.atr_stop_multiplier = read_option(options, "atr_stop_multiplier", cfg.atr_stop_multiplier);
        cfg.atr_target_multiplier = read_option(options, "atr_target_multiplier", cfg.atr_target_multiplier);
        cfg.min_stop_pct = read_option(options, "min_stop_pct", cfg.min_stop_pct);
        cfg.min_target_pct = read_option(options, "min_target_pct", cfg.min_target_pct);
        cfg.target_profit = read_option(options, "target_profit", cfg.target_profit);
        cfg.max_loss = read_option(options, "max_loss", cfg.max_loss);
        cfg.max_hold_seconds = read_option(options, "max_hold_seconds", cfg.max_hold_seconds);
        cfg.size_percent = read_option(options, "size_percent", cfg.size_percent);
        cfg.cooldown_seconds = read_option(options, "cooldown_seconds", cfg.cooldown_seconds);
        cfg.validate();
        return cfg;
    }

    MeanReversionStrategy::MeanReversionStrategy(MeanReversionConfig config)
        : StrategyBase("mean_reversion", config.cooldown_seconds), config_(std::move(config))
    {
        config_.validate();
    }

    void MeanReversionStrategy::configure(const boost::property_tree::ptree& options) {
        config_ = MeanReversionConfig::from_ptree(options, config_);
        set_cooldown_seconds(config_.cooldown_seconds);
    }

    std::size_t MeanReversionStrategy::minimum_bars_required() const {
        // impulse is measured on the bars before the last one
        return std::max({ config_.rsi_period, config_.atr_period, config_.impulse_lookback + 1 }) + 1;
    }

    Decision MeanReversionStrategy::decide_entry(const MarketView& view) {
        const auto rsi = ind::rsi(view.bars, config_.rsi_period);
        const auto atr = ind::atr(view.bars, config_.atr_period);
        if (!rsi || !atr || view.bars.size() < config_.impulse_lookback + 2) {
            return HoldDecision{};
        }

        const auto& bars = view.bars;
        const double close = bars.back().ClosePrice;
        const double prev_close = bars[bars.size() - 2].ClosePrice;
        const double impulse_base = bars[bars.size() - 2 - config_.impulse_lookback].ClosePrice;
        if (prev_close <= 0.0 || impulse_base <= 0.0) {
            return HoldDecision{};
        }
        const double impulse_pct = (prev_close - impulse_base) / impulse_base * 100.0;
        const double last_move_pct = (close - prev_close) / prev_close * 100.0;

        std::optional<Direction> direction;
        if (*rsi >= config_.overbought && impulse_pct >= config_.impulse_threshold_pct
            && last_move_pct <= -config_.failure_pct) {
            direction = Direction::Short;
        }
        else if (*rsi <= config_.oversold && impulse_pct <= -config_.impulse_threshold_pct
            && last_move_pct >= config_.failure_pct) {
            direction = Direction::Long;
        }
        if (!direction) {
            return HoldDecision{};
        }

        const int sign = Dto::sign(*direction);
        const double stop_distance = std::max(*atr * config_.atr_stop_multiplier, close * config_.min_stop_pct / 100.0);
        const double target_distance = std::max(*atr * config_.atr_target_multiplier, close * config_.min_target_pct / 100.0);

        OpenDecision open;
        open.direction = *direction;
        open.stop_loss = close - sign * stop_distance;
        open.take_profit = close + sign * target_distance;
        if (config_.size_percent > 0.0) {
            open.size_percent = config_.size_percent;
        }
        const double extremity = std::abs(*rsi - 50.0) / 50.0;
        const double strength = std::abs(impulse_pct) / config_.impulse_threshold_pct;
        open.confidence = std::clamp(0.4 + 0.3 * extremity + 0.1 * strength, 0.0, 1.0);
        open.reason = "failed " + std::string(impulse_pct > 0 ? "up" : "down") + " impulse "
            + std::to_string(impulse_pct) + "% with RSI " + std::to_string(*rsi);
        return open;
    }

    Decision MeanReversionStrategy::decide_exit(const MarketView& view, const PositionView& position) {
        const double price = view.last_close();
        const double pnl = (price - to_double(position.entry_price)) * to_double(position.size)
            * Dto::sign(position.direction);

        if (pnl >= config_.target_profit) {
            return CloseDecision{ "target profit " + std::to_string(pnl) };
        }
        if (pnl <= -config_.max_loss) {
            return CloseDecision{ "max loss " + std::to_string(pnl) };
        }
        const double held_seconds = static_cast<double>(view.now - position.opened_at) / 1000.0;
        if (held_seconds >= config_.max_hold_seconds) {
            return CloseDecision{ "max hold time reached" };
        }
        return HoldDecision{};
    }
}
