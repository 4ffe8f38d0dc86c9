#pragma once

#include <string>

namespace PaperPerp::Dto {
    enum class Direction {
        Long,
        Short
    };

    // +1 for long, -1 for short
    inline int sign(Direction direction) {
        return direction == Direction::Long ? 1 : -1;
    }

    enum class PositionStatus {
        Open,
        Closed
    };

    enum class OrderType {
        MarketOpen,
        MarketClose,
        StopLoss,
        TakeProfit,
        TrailingStop,
        EndOfData
    };

    enum class OrderStatus {
        Filled,
        Rejected
    };

    enum class CloseReason {
        StopLoss,
        TakeProfit,
        TrailingStop,
        Strategy,
        Manual,
        EndOfData
    };

    std::string to_string(Direction direction);
    std::string to_string(PositionStatus status);
    std::string to_string(OrderType type);
    std::string to_string(OrderStatus status);
    std::string to_string(CloseReason reason);

    // Inverse of to_string; throws std::invalid_argument on unknown text
    Direction parse_direction(const std::string& text);
    PositionStatus parse_position_status(const std::string& text);
    OrderType parse_order_type(const std::string& text);
    OrderStatus parse_order_status(const std::string& text);
    CloseReason parse_close_reason(const std::string& text);

    // Order type used to fill a close for the given reason
    OrderType order_type_for(CloseReason reason);
}
