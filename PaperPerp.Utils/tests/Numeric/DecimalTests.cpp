#include <gtest/gtest.h>
#include <stdexcept>
#include "Numeric/Decimal.hpp"

using namespace PaperPerp::Utils::Numeric;

TEST(DecimalTest, NoBinaryDrift) {
    Decimal sum = 0;
    for (int i = 0; i < 1000; ++i) {
        sum += Decimal("0.1");
    }
    EXPECT_EQ(sum, Decimal("100"));
}

TEST(DecimalTest, FromDoubleUsesShortestText) {
    EXPECT_EQ(from_double(0.1), Decimal("0.1"));
    EXPECT_EQ(from_double(104.0), Decimal("104"));
    EXPECT_THROW(from_double(std::numeric_limits<double>::infinity()), std::invalid_argument);
}

TEST(DecimalTest, FromStringRejectsGarbage) {
    EXPECT_EQ(from_string("12.5"), Decimal("12.5"));
    EXPECT_THROW(from_string("abc"), std::invalid_argument);
}

TEST(DecimalTest, RoundToTick) {
    EXPECT_EQ(round_to_tick(Decimal("103.896"), Decimal("0.01")), Decimal("103.9"));
    EXPECT_EQ(round_to_tick(Decimal("100.1"), Decimal("0.01")), Decimal("100.1"));
    EXPECT_EQ(round_to_tick(Decimal("12.345"), Decimal("0.5")), Decimal("12.5"));
    // Non-positive tick is a no-op
    EXPECT_EQ(round_to_tick(Decimal("1.234"), Decimal("0")), Decimal("1.234"));
}

TEST(DecimalTest, FloorToStep) {
    EXPECT_EQ(floor_to_step(Decimal("19.98001998"), Decimal("0.001")), Decimal("19.98"));
    EXPECT_EQ(floor_to_step(Decimal("-2.75"), Decimal("0.5")), Decimal("-2.5"));
}

TEST(DecimalTest, ToStringTrimsZeros) {
    EXPECT_EQ(to_string(Decimal("73.9600")), "73.96");
    EXPECT_EQ(to_string(Decimal("10000")), "10000");
    EXPECT_EQ(to_string(Decimal("0.000000001"), 8), "0");
}
