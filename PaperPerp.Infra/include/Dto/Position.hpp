#pragma once

#include <optional>
#include <string>
#include "Dto/Types.hpp"
#include "Numeric/Decimal.hpp"

namespace PaperPerp::Dto {
    using PaperPerp::Utils::Numeric::Decimal;

    struct Position {
        long long       id = 0;
        std::string     account;
        std::string     symbol;
        Direction       direction = Direction::Long;
        Decimal         size;               // base units
        Decimal         entry_price;        // fill price after slippage
        double          leverage = 1.0;
        Decimal         margin;             // entry notional / leverage
        Decimal         entry_fee;
        std::optional<Decimal> stop_loss;
        std::optional<Decimal> take_profit;
        std::optional<Decimal> trailing_distance;   // absolute price distance
        bool            trailing_active = false;    // stop_loss has been moved by the trail
        long long       opened_at = 0;
        std::string     strategy;
        PositionStatus  status = PositionStatus::Open;
        Decimal         unrealized_pnl;     // display cache, refreshed on mark
        Decimal         mark_price;

        Decimal notional() const { return size * entry_price; }
    };
}
