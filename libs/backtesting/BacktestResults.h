// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_BACKTEST_RESULTS_H
#define __ROLLSIM_BACKTEST_RESULTS_H 1

#include <optional>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DateRange.h"
#include "RollTrade.h"

namespace rollsim
{
  //
  // class EquityPoint
  //
  // Marked-to-market account value at the close of one trading day. Equity is
  // rounded to a whole currency unit; drawdown is computed before rounding.
  //

  template <class Decimal>
  class EquityPoint
  {
  public:
    EquityPoint (const boost::gregorian::date& pointDate,
		 const Decimal& equity,
		 unsigned int lots,
		 const Decimal& drawdownPercent,
		 const std::optional<Decimal>& premium)
      : mDate(pointDate),
	mEquity(equity),
	mLots(lots),
	mDrawdownPercent(drawdownPercent),
	mPremium(premium)
    {}

    const boost::gregorian::date& getDate() const
    {
      return mDate;
    }

    const Decimal& getEquity() const
    {
      return mEquity;
    }

    unsigned int getLots() const
    {
      return mLots;
    }

    const Decimal& getDrawdownPercent() const
    {
      return mDrawdownPercent;
    }

    const std::optional<Decimal>& getPremium() const
    {
      return mPremium;
    }

  private:
    boost::gregorian::date mDate;
    Decimal mEquity;
    unsigned int mLots;
    Decimal mDrawdownPercent;
    std::optional<Decimal> mPremium;
  };

  template <class Decimal>
  struct DrawdownPoint
  {
    boost::gregorian::date date;
    Decimal drawdownPercent;
  };

  template <class Decimal>
  struct YearlyReturn
  {
    int year;
    Decimal returnPercent;
  };

  template <class Decimal>
  class SummaryStats
  {
  public:
    SummaryStats (const Decimal& initialCapital,
		  const Decimal& finalCapital,
		  const Decimal& totalReturnPercent,
		  const Decimal& cagrPercent,
		  const Decimal& averageAnnualReturnPercent,
		  const Decimal& maxDrawdownPercent,
		  unsigned int maxLots,
		  unsigned long numRollovers,
		  unsigned long numCompoundings,
		  unsigned long numBlockedRollovers,
		  const Decimal& totalTransactionCosts)
      : mInitialCapital(initialCapital),
	mFinalCapital(finalCapital),
	mTotalReturnPercent(totalReturnPercent),
	mCagrPercent(cagrPercent),
	mAverageAnnualReturnPercent(averageAnnualReturnPercent),
	mMaxDrawdownPercent(maxDrawdownPercent),
	mMaxLots(maxLots),
	mNumRollovers(numRollovers),
	mNumCompoundings(numCompoundings),
	mNumBlockedRollovers(numBlockedRollovers),
	mTotalTransactionCosts(totalTransactionCosts)
    {}

    const Decimal& getInitialCapital() const
    {
      return mInitialCapital;
    }

    const Decimal& getFinalCapital() const
    {
      return mFinalCapital;
    }

    const Decimal& getTotalReturnPercent() const
    {
      return mTotalReturnPercent;
    }

    const Decimal& getCagrPercent() const
    {
      return mCagrPercent;
    }

    const Decimal& getAverageAnnualReturnPercent() const
    {
      return mAverageAnnualReturnPercent;
    }

    const Decimal& getMaxDrawdownPercent() const
    {
      return mMaxDrawdownPercent;
    }

    unsigned int getMaxLots() const
    {
      return mMaxLots;
    }

    unsigned long getNumRollovers() const
    {
      return mNumRollovers;
    }

    unsigned long getNumCompoundings() const
    {
      return mNumCompoundings;
    }

    // Counted whether the stale rollovers were flagged in the ledger or suppressed
    unsigned long getNumBlockedRollovers() const
    {
      return mNumBlockedRollovers;
    }

    const Decimal& getTotalTransactionCosts() const
    {
      return mTotalTransactionCosts;
    }

  private:
    Decimal mInitialCapital;
    Decimal mFinalCapital;
    Decimal mTotalReturnPercent;
    Decimal mCagrPercent;
    Decimal mAverageAnnualReturnPercent;
    Decimal mMaxDrawdownPercent;
    unsigned int mMaxLots;
    unsigned long mNumRollovers;
    unsigned long mNumCompoundings;
    unsigned long mNumBlockedRollovers;
    Decimal mTotalTransactionCosts;
  };

  //
  // class BacktestResults
  //
  // Everything one run produces. The trade ledger is kept most recent first.
  //

  template <class Decimal>
  class BacktestResults
  {
  public:
    BacktestResults (const DateRange& simulationWindow,
		     std::vector<EquityPoint<Decimal>> equityCurve,
		     std::vector<DrawdownPoint<Decimal>> drawdownCurve,
		     std::vector<RollTrade<Decimal>> tradesMostRecentFirst,
		     std::vector<YearlyReturn<Decimal>> yearlyReturns,
		     const SummaryStats<Decimal>& stats)
      : mSimulationWindow(simulationWindow),
	mEquityCurve(std::move(equityCurve)),
	mDrawdownCurve(std::move(drawdownCurve)),
	mTrades(std::move(tradesMostRecentFirst)),
	mYearlyReturns(std::move(yearlyReturns)),
	mStats(stats)
    {}

    const DateRange& getSimulationWindow() const
    {
      return mSimulationWindow;
    }

    const std::vector<EquityPoint<Decimal>>& getEquityCurve() const
    {
      return mEquityCurve;
    }

    const std::vector<DrawdownPoint<Decimal>>& getDrawdownCurve() const
    {
      return mDrawdownCurve;
    }

    const std::vector<RollTrade<Decimal>>& getTrades() const
    {
      return mTrades;
    }

    const std::vector<YearlyReturn<Decimal>>& getYearlyReturns() const
    {
      return mYearlyReturns;
    }

    const SummaryStats<Decimal>& getSummaryStats() const
    {
      return mStats;
    }

  private:
    DateRange mSimulationWindow;
    std::vector<EquityPoint<Decimal>> mEquityCurve;
    std::vector<DrawdownPoint<Decimal>> mDrawdownCurve;
    std::vector<RollTrade<Decimal>> mTrades;
    std::vector<YearlyReturn<Decimal>> mYearlyReturns;
    SummaryStats<Decimal> mStats;
  };
}

#endif
