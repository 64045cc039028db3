#include <gtest/gtest.h>
#include "common/decimal.hpp"
#include <limits>
#include <stdexcept>

using namespace fifo;

TEST(DecimalTest, ParsesAndPrintsCanonicalForm) {
    EXPECT_EQ(Decimal::parse("12.5").to_string(), "12.5");
    EXPECT_EQ(Decimal::parse("12.50000000").to_string(), "12.5");
    EXPECT_EQ(Decimal::parse("0").to_string(), "0");
    EXPECT_EQ(Decimal::parse("-0.00000001").to_string(), "-0.00000001");
    EXPECT_EQ(Decimal::parse("+3").to_string(), "3");
    EXPECT_EQ(Decimal::parse(".5").to_string(), "0.5");
    EXPECT_EQ(Decimal::parse("100.").to_string(), "100");
}

TEST(DecimalTest, RawUnitsAreOneHundredMillionth) {
    EXPECT_EQ(Decimal::parse("1").raw(), Decimal::SCALE);
    EXPECT_EQ(Decimal::parse("0.00000001").raw(), 1);
    EXPECT_EQ(Decimal::from_int(-7).raw(), -7 * Decimal::SCALE);
}

TEST(DecimalTest, RejectsMalformedInput) {
    EXPECT_THROW(Decimal::parse(""), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("-"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("1e5"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("abc"), std::invalid_argument);
}

TEST(DecimalTest, RejectsPrecisionBeyondEightDigits) {
    EXPECT_THROW(Decimal::parse("0.000000001"), std::invalid_argument);
    // Trailing zeros past the 8th digit carry no precision
    EXPECT_EQ(Decimal::parse("0.1000000000").to_string(), "0.1");
}

TEST(DecimalTest, AdditionIsExact) {
    Decimal sum;
    for (int i = 0; i < 10; ++i) {
        sum += Decimal::parse("0.1");
    }
    EXPECT_EQ(sum, Decimal::from_int(1));
    EXPECT_EQ((Decimal::parse("5") - Decimal::parse("7.25")).to_string(), "-2.25");
}

TEST(DecimalTest, MultiplicationRoundsHalfToEven) {
    // 0.00000005 * 0.5 = 0.000000025 -> 0.00000002 (even)
    EXPECT_EQ((Decimal::parse("0.00000005") * Decimal::parse("0.5")).to_string(), "0.00000002");
    // 0.00000007 * 0.5 = 0.000000035 -> 0.00000004 (even)
    EXPECT_EQ((Decimal::parse("0.00000007") * Decimal::parse("0.5")).to_string(), "0.00000004");
    // Negative values round symmetrically
    EXPECT_EQ((Decimal::parse("-0.00000005") * Decimal::parse("0.5")).to_string(), "-0.00000002");
    EXPECT_EQ((Decimal::parse("120") * Decimal::parse("12")).to_string(), "1440");
}

TEST(DecimalTest, MulDivUsesWideIntermediate) {
    // 1 * 1 / 3 rounded at the 8th digit
    EXPECT_EQ(Decimal::mul_div(Decimal::from_int(1), Decimal::from_int(1),
                               Decimal::from_int(3)).to_string(), "0.33333333");
    // Large operands that would overflow 64 bits when multiplied directly
    Decimal big = Decimal::parse("90000000000");
    EXPECT_EQ(Decimal::mul_div(big, big, big), big);
    // Pro-rata fee share: 1.5 fee * 2 / 12
    EXPECT_EQ(Decimal::mul_div(Decimal::parse("1.5"), Decimal::from_int(2),
                               Decimal::from_int(12)).to_string(), "0.25");
}

TEST(DecimalTest, DivisionByZeroThrows) {
    EXPECT_THROW(Decimal::mul_div(Decimal::from_int(1), Decimal::from_int(1), Decimal()),
                 std::domain_error);
}

TEST(DecimalTest, OverflowThrows) {
    Decimal max = Decimal::from_raw(std::numeric_limits<int64_t>::max());
    EXPECT_THROW(max + Decimal::from_raw(1), std::overflow_error);
    EXPECT_THROW(Decimal::parse("999999999999999"), std::overflow_error);
}

TEST(DecimalTest, JsonAcceptsStringsAndIntegers) {
    nlohmann::json j = Decimal::parse("1.25");
    EXPECT_EQ(j.get<std::string>(), "1.25");
    EXPECT_EQ(nlohmann::json("0.5").get<Decimal>(), Decimal::parse("0.5"));
    EXPECT_EQ(nlohmann::json(3).get<Decimal>(), Decimal::from_int(3));
    EXPECT_THROW(nlohmann::json(0.5).get<Decimal>(), std::invalid_argument);
}
