#pragma once
#include <vector>
#include <map>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BacktestResults.h"
#include "BoostDateHelper.h"
#include "DecimalConstants.h"

namespace rollsim
{
  // Build calendar year returns from a daily equity curve.
  // Notes:
  // - Years are chained: a year starts from the last equity of the previous
  //   year, so compounding the yearly returns reproduces the final equity.
  // - The first year starts from its own first equity point.
  // - A year whose starting equity is zero or negative reports 0%.
  template <class Decimal>
  std::vector<YearlyReturn<Decimal>>
  buildYearlyReturns(const std::vector<EquityPoint<Decimal>>& equityCurve)
  {
    const Decimal zero(DecimalConstants<Decimal>::DecimalZero);
    const Decimal hundred(DecimalConstants<Decimal>::DecimalOneHundred);

    // year -> (first equity, last equity), points arrive in date order
    std::map<int, std::pair<Decimal, Decimal>> yearBounds;

    for (const auto& point : equityCurve)
      {
	int year = calendarYear(point.getDate());
	auto it = yearBounds.find(year);
	if (it == yearBounds.end())
	  yearBounds.emplace(year, std::make_pair(point.getEquity(), point.getEquity()));
	else
	  it->second.second = point.getEquity();
      }

    std::vector<YearlyReturn<Decimal>> yearly;
    yearly.reserve(yearBounds.size());

    bool firstYear = true;
    Decimal previousClose(zero);

    for (const auto& kv : yearBounds)
      {
	Decimal start = firstYear ? kv.second.first : previousClose;
	Decimal end = kv.second.second;

	Decimal ret = (start > zero) ? ((end - start) / start) * hundred : zero;
	yearly.push_back(YearlyReturn<Decimal>{ kv.first, ret });

	previousClose = end;
	firstYear = false;
      }

    return yearly;
  }
} // namespace rollsim
