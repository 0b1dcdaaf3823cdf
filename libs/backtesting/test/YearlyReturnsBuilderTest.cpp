#define CATCH_CONFIG_MAIN

#include <vector>
#include <catch2/catch.hpp>
#include "YearlyReturnsBuilder.h"
#include "TestUtils.h"

using namespace rollsim;

typedef EquityPoint<DecimalType> PointType;

static PointType createPoint (const std::string& dateString, const std::string& equity)
{
  return PointType (createDate (dateString), createDecimal (equity), 1,
		    DecimalConstants<DecimalType>::DecimalZero, std::nullopt);
}

TEST_CASE ("buildYearlyReturns chains years", "[YearlyReturnsBuilder]")
{
  std::vector<PointType> curve {
    createPoint ("20221230", "1000"),
    createPoint ("20230102", "1200"),
    createPoint ("20231229", "1100"),
    createPoint ("20240102", "1320"),
    createPoint ("20241231", "1650") };

  auto yearly = buildYearlyReturns (curve);

  REQUIRE (yearly.size() == 3);
  REQUIRE (yearly[0].year == 2022);
  REQUIRE (yearly[0].returnPercent == createDecimal ("0"));
  REQUIRE (yearly[1].year == 2023);
  REQUIRE (yearly[1].returnPercent == createDecimal ("10"));
  REQUIRE (yearly[2].year == 2024);
  REQUIRE (yearly[2].returnPercent == createDecimal ("50"));
}

TEST_CASE ("buildYearlyReturns guards non-positive start", "[YearlyReturnsBuilder]")
{
  std::vector<PointType> curve {
    createPoint ("20230102", "1000"),
    createPoint ("20231229", "-200"),
    createPoint ("20240102", "100"),
    createPoint ("20241231", "300") };

  auto yearly = buildYearlyReturns (curve);

  REQUIRE (yearly.size() == 2);
  REQUIRE (yearly[0].returnPercent == createDecimal ("-120"));
  REQUIRE (yearly[1].returnPercent == createDecimal ("0"));
}

TEST_CASE ("buildYearlyReturns of an empty curve is empty", "[YearlyReturnsBuilder]")
{
  std::vector<PointType> curve;
  REQUIRE (buildYearlyReturns (curve).empty());
}
