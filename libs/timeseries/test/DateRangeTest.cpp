#define CATCH_CONFIG_MAIN

#include <catch2/catch.hpp>
#include "TestUtils.h"
#include "../DateRange.h"
#include "../BoostDateHelper.h"

using namespace rollsim;
using boost::gregorian::date;

TEST_CASE("DateRange: valid construction and getters", "[DateRange]") {
    date d1(2020, 1, 1);
    date d2(2020, 12, 31);
    DateRange range(d1, d2);
    REQUIRE(range.getFirstDate() == d1);
    REQUIRE(range.getLastDate() == d2);
    REQUIRE(range.getLengthInDays() == 365);
}

TEST_CASE("DateRange: invalid construction throws", "[DateRange]") {
    date d1(2020, 12, 31);
    date d2(2020, 1, 1);
    REQUIRE_THROWS_AS(DateRange(d1, d2), DateRangeException);
    REQUIRE_THROWS_AS(DateRange(date(boost::gregorian::not_a_date_time), d2), DateRangeException);
}

TEST_CASE("DateRange: single day window", "[DateRange]") {
    date d1(2024, 2, 5);
    DateRange range(d1, d1);
    REQUIRE(range.getLengthInDays() == 0);
    REQUIRE(range.getFirstDate() == range.getLastDate());
}

TEST_CASE("DateRange: equality and inequality", "[DateRange]") {
    date d1(2021, 7, 1);
    date d2(2021, 7, 31);
    DateRange a(d1, d2);
    DateRange b(d1, d2);
    DateRange c(d1, date(2021, 8, 1));
    REQUIRE(a == b);
    REQUIRE(!(a != b));
    REQUIRE(a != c);
}

TEST_CASE("BoostDateHelper: iso conversions and day arithmetic", "[BoostDateHelper]") {
    date d = parseIsoDate("2024-02-29");
    REQUIRE(d == date(2024, 2, 29));
    REQUIRE(toIsoString(d) == "2024-02-29");
    REQUIRE(calendarYear(d) == 2024);
    REQUIRE(daysBetween(date(2024, 1, 1), date(2025, 1, 1)) == 366);
    REQUIRE(daysBetween(date(2025, 1, 1), date(2024, 1, 1)) == -366);
    REQUIRE(isWeekend(date(2024, 3, 2)));
    REQUIRE_FALSE(isWeekend(date(2024, 3, 4)));
}
