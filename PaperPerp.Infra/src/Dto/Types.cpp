#include "Dto/Types.hpp"
#include <stdexcept>

namespace PaperPerp::Dto {
    std::string to_string(Direction direction) {
        return direction == Direction::Long ? "long" : "short";
    }

    std::string to_string(PositionStatus status) {
        return status == PositionStatus::Open ? "open" : "closed";
    }

    std::string to_string(OrderType type) {
        switch (type) {
        case OrderType::MarketOpen:   return "market_open";
        case OrderType::MarketClose:  return "market_close";
        case OrderType::StopLoss:     return "stop_loss";
        case OrderType::TakeProfit:   return "take_profit";
        case OrderType::TrailingStop: return "trailing_stop";
        case OrderType::EndOfData:    return "end_of_data";
        }
        return "unknown";
    }

    std::string to_string(OrderStatus status) {
        return status == OrderStatus::Filled ? "filled" : "rejected";
    }

    std::string to_string(CloseReason reason) {
        switch (reason) {
        case CloseReason::StopLoss:     return "stop_loss";
        case CloseReason::TakeProfit:   return "take_profit";
        case CloseReason::TrailingStop: return "trailing_stop";
        case CloseReason::Strategy:     return "strategy";
        case CloseReason::Manual:       return "manual";
        case CloseReason::EndOfData:    return "end_of_data";
        }
        return "unknown";
    }

    Direction parse_direction(const std::string& text) {
        if (text == "long") return Direction::Long;
        if (text == "short") return Direction::Short;
        throw std::invalid_argument("Unknown direction: " + text);
    }

    PositionStatus parse_position_status(const std::string& text) {
        if (text == "open") return PositionStatus::Open;
        if (text == "closed") return PositionStatus::Closed;
        throw std::invalid_argument("Unknown position status: " + text);
    }

    OrderType parse_order_type(const std::string& text) {
        for (auto type : { OrderType::MarketOpen, OrderType::MarketClose, OrderType::StopLoss,
                           OrderType::TakeProfit, OrderType::TrailingStop, OrderType::EndOfData }) {
            if (to_string(type) == text) return type;
        }
        throw std::invalid_argument("Unknown order type: " + text);
    }

    OrderStatus parse_order_status(const std::string& text) {
        if (text == "filled") return OrderStatus::Filled;
        if (text == "rejected") return OrderStatus::Rejected;
        throw std::invalid_argument("Unknown order status: " + text);
    }

    CloseReason parse_close_reason(const std::string& text) {
        for (auto reason : { CloseReason::StopLoss, CloseReason::TakeProfit, CloseReason::TrailingStop,
                             CloseReason::Strategy, CloseReason::Manual, CloseReason::EndOfData }) {
            if (to_string(reason) == text) return reason;
        }
        throw std::invalid_argument("Unknown close reason: " + text);
    }

    OrderType order_type_for(CloseReason reason) {
        switch (reason) {
        case CloseReason::StopLoss:     return OrderType::StopLoss;
        case CloseReason::TakeProfit:   return OrderType::TakeProfit;
        case CloseReason::TrailingStop: return OrderType::TrailingStop;
        case CloseReason::EndOfData:    return OrderType::EndOfData;
        default:                        return OrderType::MarketClose;
        }
    }
}
