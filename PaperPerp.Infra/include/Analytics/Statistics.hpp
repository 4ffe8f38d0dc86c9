#pragma once

#include <vector>
#include "Dto/Trade.hpp"

namespace PaperPerp::Infra::Analytics {
    using PaperPerp::Utils::Numeric::Decimal;

    struct TradeStatistics {
        int     total_trades = 0;
        int     winning_trades = 0;         // net_pnl > 0
        int     losing_trades = 0;          // net_pnl <= 0
        double  win_rate = 0.0;             // percent
        Decimal starting_equity;
        Decimal final_equity;
        Decimal total_net_pnl;
        double  total_return = 0.0;         // percent of starting equity
        Decimal gross_profit;               // sum of positive net_pnl
        Decimal gross_loss;                 // sum of negative net_pnl (<= 0)
        double  profit_factor = 0.0;        // +inf with wins and no losses
        Decimal average_win;
        Decimal average_loss;
        Decimal largest_win;
        Decimal largest_loss;
        Decimal total_fees;
        double  max_drawdown = 0.0;         // percent, from the equity curve
        double  sharpe_ratio = 0.0;
        int     max_consecutive_wins = 0;
        int     max_consecutive_losses = 0;
        double  average_duration_seconds = 0.0;
        std::vector<Decimal> equity_curve;  // starting equity, then after each trade
    };

    // All of these depend on the trade list (and the starting equity) only.
    double profit_factor(const std::vector<Dto::Trade>& trades);
    double win_rate(const std::vector<Dto::Trade>& trades);
    std::vector<Decimal> equity_curve(const std::vector<Dto::Trade>& trades, const Decimal& starting_equity);
    double max_drawdown_percent(const std::vector<Decimal>& curve);
    double sharpe_ratio(const std::vector<Decimal>& curve);

    TradeStatistics compute_statistics(const std::vector<Dto::Trade>& trades, const Decimal& starting_equity);
}
