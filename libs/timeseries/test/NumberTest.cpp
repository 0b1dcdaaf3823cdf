#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>
#include "TestUtils.h"
#include "../number.h"

using namespace rollsim;
using num::DefaultNumber;

TEST_CASE("toString produces the expected string representation", "[number]") {
    DefaultNumber d = createDecimal("12.345");
    REQUIRE(num::toString(d) == std::string("12.3450000"));
}

TEST_CASE("roundHalfUp rounds halves towards positive infinity", "[number]") {
    REQUIRE(num::roundHalfUp(createDecimal("1049.5")) == createDecimal("1050"));
    REQUIRE(num::roundHalfUp(createDecimal("1049.4999")) == createDecimal("1049"));
    REQUIRE(num::roundHalfUp(createDecimal("-2.5")) == createDecimal("-2"));
    REQUIRE(num::roundHalfUp(createDecimal("-2.51")) == createDecimal("-3"));
    REQUIRE(num::roundHalfUp(2.5) == Approx(3.0));
}

TEST_CASE("fromInteger is exact", "[number]") {
    REQUIRE(num::fromInteger<DecimalType>(0) == DecimalConstants<DecimalType>::DecimalZero);
    REQUIRE(num::fromInteger<DecimalType>(128) == createDecimal("128"));
}

TEST_CASE("power and max", "[number]") {
    REQUIRE(num::to_double(num::power(createDecimal("4.0"), 0.5)) == Approx(2.0));
    REQUIRE(num::to_double(num::power(createDecimal("1.21"), 0.5)) == Approx(1.1));
    REQUIRE(num::power(2.0, 3.0) == Approx(8.0));
    REQUIRE(num::max(createDecimal("1.5"), createDecimal("2.5")) == createDecimal("2.5"));
}

TEST_CASE("DecimalConstants hold the MCX GOLD defaults", "[DecimalConstants]") {
    typedef DecimalConstants<DecimalType> DC;
    REQUIRE(DC::McxGoldBigPointValue == createDecimal("100"));
    REQUIRE(DC::DefaultInitialMarginPercent == createDecimal("12"));
    REQUIRE(DC::DefaultTransactionCost == createDecimal("1800"));
    REQUIRE(DC::DefaultCompoundingFactor == createDecimal("200"));
    REQUIRE(DC::DaysPerYear == createDecimal("365.25"));
    REQUIRE(DecimalConstants<double>::DaysPerYear == Approx(365.25));
}

TEST_CASE("isDecimalString accepts plain decimals only", "[number]") {
    REQUIRE(num::isDecimalString("63120"));
    REQUIRE(num::isDecimalString("-12.5"));
    REQUIRE(num::isDecimalString("+0.25"));
    REQUIRE(num::isDecimalString(".5"));
    REQUIRE_FALSE(num::isDecimalString(""));
    REQUIRE_FALSE(num::isDecimalString("-"));
    REQUIRE_FALSE(num::isDecimalString("1e3"));
    REQUIRE_FALSE(num::isDecimalString("12.5.1"));
    REQUIRE_FALSE(num::isDecimalString(" 12"));
}
