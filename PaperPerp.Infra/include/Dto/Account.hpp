#pragma once

#include <string>
#include "Numeric/Decimal.hpp"

namespace PaperPerp::Dto {
    using PaperPerp::Utils::Numeric::Decimal;

    struct Account {
        std::string name;
        Decimal     starting_equity;
        Decimal     balance;            // free cash, open margin and entry fees already taken out
        double      default_leverage = 1.0;
        Decimal     maker_fee_rate;
        Decimal     taker_fee_rate;
        Decimal     realized_pnl;       // sum of gross PnL of closed trades
        Decimal     total_fees;         // entry + exit fees of closed trades
        int         total_trades = 0;
        int         winning_trades = 0;
        int         losing_trades = 0;
        Decimal     peak_equity;        // high-water mark of realized equity
        Decimal     max_drawdown_pct;
        long long   created_at = 0;
        long long   updated_at = 0;
    };
}
