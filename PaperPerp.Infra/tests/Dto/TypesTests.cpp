#include <gtest/gtest.h>
#include <stdexcept>
#include "Dto/Types.hpp"

using namespace PaperPerp::Dto;

TEST(TypesTest, CloseReasonNames) {
    EXPECT_EQ(to_string(CloseReason::EndOfData), "end_of_data");
    EXPECT_EQ(parse_close_reason("take_profit"), CloseReason::TakeProfit);
    EXPECT_THROW(parse_close_reason("liquidation"), std::invalid_argument);
}

TEST(TypesTest, OrderTypeForReason) {
    EXPECT_EQ(order_type_for(CloseReason::StopLoss), OrderType::StopLoss);
    EXPECT_EQ(order_type_for(CloseReason::Strategy), OrderType::MarketClose);
    EXPECT_EQ(order_type_for(CloseReason::EndOfData), OrderType::EndOfData);
    EXPECT_EQ(parse_order_type(to_string(OrderType::TrailingStop)), OrderType::TrailingStop);
}

TEST(TypesTest, DirectionSign) {
    EXPECT_EQ(sign(Direction::Long), 1);
    EXPECT_EQ(sign(Direction::Short), -1);
    EXPECT_EQ(parse_direction("short"), Direction::Short);
}
