#include "Analytics/Statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace PaperPerp::Infra::Analytics {
    using PaperPerp::Utils::Numeric::to_double;

    double profit_factor(const std::vector<Dto::Trade>& trades) {
        Decimal wins = 0;
        Decimal losses = 0;
        for (const auto& t : trades) {
            if (t.net_pnl > 0) wins += t.net_pnl;
            else if (t.net_pnl < 0) losses -= t.net_pnl;
        }
        if (losses == 0) {
            return wins > 0 ? std::numeric_limits<double>::infinity() : 0.0;
        }
        return to_double(wins / losses);
    }

    double win_rate(const std::vector<Dto::Trade>& trades) {
        if (trades.empty()) return 0.0;
        auto wins = std::count_if(trades.begin(), trades.end(), [](const Dto::Trade& t) { return t.net_pnl > 0; });
        return static_cast<double>(wins) * 100.0 / static_cast<double>(trades.size());
    }

    std::vector<Decimal> equity_curve(const std::vector<Dto::Trade>& trades, const Decimal& starting_equity) {
        std::vector<Decimal> curve;
        curve.reserve(trades.size() + 1);
        Decimal equity = starting_equity;
        curve.push_back(equity);
        for (const auto& t : trades) {
            equity += t.net_pnl;
            curve.push_back(equity);
        }
        return curve;
    }

    double max_drawdown_percent(const std::vector<Decimal>& curve) {
        if (curve.empty()) return 0.0;
        Decimal peak = curve.front();
        double worst = 0.0;
        for (const auto& equity : curve) {
            if (equity > peak) peak = equity;
            if (peak <= 0) continue;
            double dd = to_double((peak - equity) / peak * 100);
            worst = std::max(worst, dd);
        }
        return worst;
    }

    // Per-trade returns annualised with sqrt(252), 0 when undefined
    double sharpe_ratio(const std::vector<Decimal>& curve) {
        if (curve.size() < 3) return 0.0;
        std::vector<double> returns;
        for (std::size_t i = 1; i < curve.size(); ++i) {
            if (curve[i - 1] == 0) continue;
            returns.push_back(to_double((curve[i] - curve[i - 1]) / curve[i - 1]));
        }
        if (returns.size() < 2) return 0.0;

        double mean = 0.0;
        for (double r : returns) mean += r;
        mean /= static_cast<double>(returns.size());
        double variance = 0.0;
        for (double r : returns) variance += (r - mean) * (r - mean);
        variance /= static_cast<double>(returns.size());
        double stddev = std::sqrt(variance);
        if (stddev <= 0.0) return 0.0;
        return mean / stddev * std::sqrt(252.0);
    }

    TradeStatistics compute_statistics(const std::vector<Dto::Trade>& trades, const Decimal& starting_equity) {
        TradeStatistics stats;
        stats.starting_equity = starting_equity;
        stats.total_trades = static_cast<int>(trades.size());

        int streak_wins = 0;
        int streak_losses = 0;
        double duration_sum = 0.0;
        for (const auto& t : trades) {
            stats.total_net_pnl += t.net_pnl;
            stats.total_fees += t.total_fees();
            duration_sum += static_cast<double>(t.duration_ms()) / 1000.0;

            if (t.net_pnl > 0) {
                ++stats.winning_trades;
                stats.gross_profit += t.net_pnl;
                ++streak_wins;
                streak_losses = 0;
            }
            else {
                ++stats.losing_trades;
                stats.gross_loss += t.net_pnl;
                ++streak_losses;
                streak_wins = 0;
            }
            stats.max_consecutive_wins = std::max(stats.max_consecutive_wins, streak_wins);
            stats.max_consecutive_losses = std::max(stats.max_consecutive_losses, streak_losses);
        }

        if (!trades.empty()) {
            auto by_pnl = [](const Dto::Trade& a, const Dto::Trade& b) { return a.net_pnl < b.net_pnl; };
            auto [lo, hi] = std::minmax_element(trades.begin(), trades.end(), by_pnl);
            stats.largest_win = std::max(Decimal(0), hi->net_pnl);
            stats.largest_loss = std::min(Decimal(0), lo->net_pnl);
            stats.average_duration_seconds = duration_sum / static_cast<double>(trades.size());
        }
        if (stats.winning_trades > 0) stats.average_win = stats.gross_profit / stats.winning_trades;
        if (stats.losing_trades > 0) stats.average_loss = stats.gross_loss / stats.losing_trades;

        stats.win_rate = win_rate(trades);
        stats.profit_factor = profit_factor(trades);
        stats.final_equity = starting_equity + stats.total_net_pnl;
        if (starting_equity > 0) {
            stats.total_return = to_double(stats.total_net_pnl / starting_equity * 100);
        }
        stats.equity_curve = equity_curve(trades, starting_equity);
        stats.max_drawdown = max_drawdown_percent(stats.equity_curve);
        stats.sharpe_ratio = sharpe_ratio(stats.equity_curve);
        return stats;
    }
}
