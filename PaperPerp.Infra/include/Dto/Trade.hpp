#pragma once

#include <string>
#include "Dto/Types.hpp"
#include "Numeric/Decimal.hpp"

namespace PaperPerp::Dto {
    using PaperPerp::Utils::Numeric::Decimal;

    // One closed round trip. Never modified after the close that created it.
    struct Trade {
        long long   id = 0;
        long long   position_id = 0;
        std::string account;
        std::string symbol;
        std::string strategy;
        Direction   direction = Direction::Long;
        Decimal     size;
        double      leverage = 1.0;
        Decimal     entry_price;
        Decimal     exit_price;
        long long   entry_time = 0;
        long long   exit_time = 0;
        Decimal     gross_pnl;
        Decimal     entry_fee;
        Decimal     exit_fee;
        Decimal     net_pnl;            // gross - entry_fee - exit_fee
        Decimal     pnl_percent;        // net over margin, in percent
        CloseReason reason = CloseReason::Strategy;

        Decimal total_fees() const { return entry_fee + exit_fee; }
        long long duration_ms() const { return exit_time - entry_time; }
    };
}
