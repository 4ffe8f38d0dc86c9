#pragma once

#include <string>
#include "Dto/Types.hpp"
#include "Numeric/Decimal.hpp"

namespace PaperPerp::Dto {
    using PaperPerp::Utils::Numeric::Decimal;

    // Paper orders fill (or get rejected) synchronously; the record keeps the
    // reference price next to the fill so the slippage step can be audited.
    struct Order {
        long long   id = 0;
        std::string account;
        std::string symbol;
        Direction   direction = Direction::Long;   // side of the position the order acts on
        OrderType   type = OrderType::MarketOpen;
        Decimal     requested_price;
        Decimal     fill_price;
        Decimal     size;
        Decimal     slippage;           // |fill - requested|
        Decimal     fee;
        OrderStatus status = OrderStatus::Filled;
        long long   position_id = 0;    // 0 when rejected before a position existed
        long long   timestamp = 0;
        std::string reason;
    };
}
