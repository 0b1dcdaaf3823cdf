// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_PERPETUAL_ROLL_BACKTESTER_H
#define __ROLLSIM_PERPETUAL_ROLL_BACKTESTER_H 1

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "number.h"
#include "BoostDateHelper.h"
#include "DecimalConstants.h"
#include "RollTimeSeries.h"
#include "RollSeriesFilter.h"
#include "BacktestConfiguration.h"
#include "BacktestResults.h"
#include "RolloverPolicy.h"
#include "YearlyReturnsBuilder.h"

namespace rollsim
{
  /**
   * @class PerpetualRollBacktester
   * @brief Simulates a continuously held long futures position that is rolled
   *        from the near to the far contract whenever the near contract changes.
   *
   * Each trading day, in this order:
   * - Rollover: on a change of near contract the old position is sold at the
   *   previous day's near price and the new one bought at the previous day's
   *   far price. Realized P&L less transaction cost goes to cash.
   * - Mark to market: equity = cash + open P&L at today's near price.
   * - Compounding: once equity has grown by compoundingFactor percent over the
   *   baseline the lot count doubles and the baseline resets to equity.
   * - Drawdown from the running equity peak.
   *
   * The position is never liquidated at the end of the window.
   *
   * Thread Safety:
   * - run() keeps all simulation state on its own stack; concurrent calls on
   *   one instance are safe.
   */
  template <class Decimal>
  class PerpetualRollBacktester
  {
  public:
    PerpetualRollBacktester()
    {}

    ~PerpetualRollBacktester()
    {}

    /**
     * @brief Observations inside the configured window, with the reason when
     *        there are too few or too many to simulate.
     */
    RollSeriesFilterResult<Decimal> selectObservations (const RollTimeSeries<Decimal>& series,
							const BacktestConfiguration<Decimal>& config) const
    {
      std::optional<DateRange> window = resolveWindow (series, config);
      if (!window)
	return RollSeriesFilterResult<Decimal> (SeriesFilterStatus::InsufficientData, std::nullopt, 0);

      RollSeriesFilter<Decimal> filter (config.getMaxSimulationDays());
      return filter.filter (series, *window);
    }

    /**
     * @brief Run one simulation.
     * @return Empty when the window holds fewer than two observations or more
     *         than the configured maximum.
     */
    std::optional<BacktestResults<Decimal>> run (const RollTimeSeries<Decimal>& series,
						 const BacktestConfiguration<Decimal>& config) const
    {
      RollSeriesFilterResult<Decimal> selection = selectObservations (series, config);
      if (!selection.isOk())
	return std::nullopt;

      return simulate (*selection.getSeries(), config, *resolveWindow (series, config));
    }

  private:
    // Unset dates span the data; a window that ends before it starts is empty
    static std::optional<DateRange> resolveWindow (const RollTimeSeries<Decimal>& series,
						   const BacktestConfiguration<Decimal>& config)
    {
      if (series.isEmpty() && !(config.getStartDate() && config.getEndDate()))
	return std::nullopt;

      boost::gregorian::date first = config.getStartDate() ? *config.getStartDate() : series.getFirstDate();
      boost::gregorian::date last = config.getEndDate() ? *config.getEndDate() : series.getLastDate();

      if (last < first)
	return std::nullopt;

      return DateRange (first, last);
    }

    static std::string rolloverDescription (const RollObservation<Decimal>& previous,
					    const RollObservation<Decimal>& current)
    {
      return previous.getNearContract() + " -> " + current.getNearContract();
    }

    static std::string staleRolloverNote (const RollObservation<Decimal>& previous,
					  const RollObservation<Decimal>& current)
    {
      const boost::gregorian::date& expiry = *previous.getNearExpiryDate();

      return "Stale rollover not executed: " + current.getNearContract() + " first quoted "
	+ std::to_string (daysBetween (expiry, current.getDate())) + " days after "
	+ previous.getNearContract() + " expired on " + toIsoString (expiry)
	+ "; position still marked from its " + previous.getNearContract()
	+ " entry price, later P&L includes the spread to " + current.getNearContract();
    }

    BacktestResults<Decimal> simulate (const RollTimeSeries<Decimal>& observations,
				       const BacktestConfiguration<Decimal>& config,
				       const DateRange& window) const
    {
      const Decimal zero (DecimalConstants<Decimal>::DecimalZero);
      const Decimal hundred (DecimalConstants<Decimal>::DecimalOneHundred);
      const Decimal& multiplier = config.getContractMultiplier();
      const Decimal compoundingThreshold = config.getCompoundingFactor() / hundred;

      std::unique_ptr<RolloverPolicy<Decimal>> rolloverPolicy = createRolloverPolicy (config);

      const RollObservation<Decimal>& firstDay = *observations.beginSortedAccess();

      unsigned int currentLots = config.getInitialLots();
      Decimal contractValue = firstDay.getNearPrice() * multiplier * num::fromInteger<Decimal> (currentLots);
      Decimal initialCapital = contractValue * config.getInitialMarginPercent() / hundred;

      Decimal cash (initialCapital);
      Decimal baselineCapital (initialCapital);
      Decimal peakEquity (initialCapital);
      Decimal entryPrice (firstDay.getNearPrice());

      std::vector<EquityPoint<Decimal>> equityCurve;
      std::vector<DrawdownPoint<Decimal>> drawdownCurve;
      std::vector<RollTrade<Decimal>> trades;
      equityCurve.reserve (observations.getNumEntries());
      drawdownCurve.reserve (observations.getNumEntries());

      unsigned long numRollovers = 0;
      unsigned long numCompoundings = 0;
      unsigned long numBlockedRollovers = 0;
      Decimal totalTransactionCosts (zero);
      Decimal maxDrawdown (zero);
      unsigned int maxLots = currentLots;

      const RollObservation<Decimal> *previous = nullptr;

      for (auto it = observations.beginSortedAccess(); it != observations.endSortedAccess(); it++)
	{
	  const RollObservation<Decimal>& today = *it;

	  if (previous != nullptr)
	    {
	      RolloverDecision decision = rolloverPolicy->decide (*previous, today);
	      Decimal lots = num::fromInteger<Decimal> (currentLots);

	      if (decision == RolloverDecision::Execute)
		{
		  Decimal grossPnL = (previous->getNearPrice() - entryPrice) * multiplier * lots;
		  Decimal cost = config.getTransactionCost() * lots;
		  Decimal netPnL = grossPnL - cost;

		  cash += netPnL;
		  entryPrice = previous->getFarPrice();

		  trades.push_back (RollTrade<Decimal>::createRollover (today.getDate(),
									rolloverDescription (*previous, today),
									previous->getNearPrice(),
									previous->getFarPrice(),
									currentLots,
									grossPnL, cost, netPnL,
									cash));
		  numRollovers++;
		  totalTransactionCosts += cost;
		}
	      else if (decision == RolloverDecision::Stale)
		{
		  numBlockedRollovers++;

		  if (config.getStaleRolloverHandling() == StaleRolloverHandling::Flag)
		    trades.push_back (RollTrade<Decimal>::createBlockedRollover (today.getDate(),
										 rolloverDescription (*previous, today),
										 previous->getNearPrice(),
										 previous->getFarPrice(),
										 currentLots,
										 cash,
										 staleRolloverNote (*previous, today)));
		}
	    }

	  Decimal unrealized = (today.getNearPrice() - entryPrice) * multiplier
	    * num::fromInteger<Decimal> (currentLots);
	  Decimal currentEquity = cash + unrealized;

	  if (config.isCompounding() && (baselineCapital > zero) &&
	      ((currentEquity - baselineCapital) >= (compoundingThreshold * baselineCapital)))
	    {
	      currentLots *= 2;
	      baselineCapital = currentEquity;
	      trades.push_back (RollTrade<Decimal>::createCompounding (today.getDate(), currentLots,
								       currentEquity));
	      numCompoundings++;
	    }

	  peakEquity = num::max (peakEquity, currentEquity);

	  Decimal drawdown (zero);
	  if (peakEquity > zero)
	    {
	      drawdown = (peakEquity - currentEquity) / peakEquity * hundred;

	      // Equity below zero means the margin is gone: a total loss
	      if (drawdown > hundred)
		drawdown = hundred;
	    }

	  equityCurve.emplace_back (today.getDate(), num::roundHalfUp (currentEquity), currentLots,
				    drawdown, today.getPremium());
	  drawdownCurve.push_back (DrawdownPoint<Decimal>{ today.getDate(), drawdown });

	  maxDrawdown = num::max (maxDrawdown, drawdown);
	  maxLots = std::max (maxLots, currentLots);
	  previous = &today;
	}

      std::vector<YearlyReturn<Decimal>> yearlyReturns = buildYearlyReturns (equityCurve);

      const Decimal& finalCapital = equityCurve.back().getEquity();

      SummaryStats<Decimal> stats (initialCapital,
				   finalCapital,
				   totalReturnPercent (initialCapital, finalCapital),
				   cagrPercent (initialCapital, finalCapital, window),
				   averageReturn (yearlyReturns),
				   maxDrawdown,
				   maxLots,
				   numRollovers,
				   numCompoundings,
				   numBlockedRollovers,
				   totalTransactionCosts);

      std::reverse (trades.begin(), trades.end());

      return BacktestResults<Decimal> (window,
				       std::move (equityCurve),
				       std::move (drawdownCurve),
				       std::move (trades),
				       std::move (yearlyReturns),
				       stats);
    }

    static Decimal totalReturnPercent (const Decimal& initialCapital, const Decimal& finalCapital)
    {
      const Decimal zero (DecimalConstants<Decimal>::DecimalZero);

      if (initialCapital <= zero)
	return zero;

      return (finalCapital - initialCapital) / initialCapital * DecimalConstants<Decimal>::DecimalOneHundred;
    }

    // Annualized over the configured window, never less than one year
    static Decimal cagrPercent (const Decimal& initialCapital, const Decimal& finalCapital,
				const DateRange& window)
    {
      const Decimal zero (DecimalConstants<Decimal>::DecimalZero);

      if (initialCapital <= zero)
	return zero;

      Decimal ratio = finalCapital / initialCapital;
      if (ratio <= zero)
	return DecimalConstants<Decimal>::DecimalMinusOneHundred;

      double years = std::max (1.0, static_cast<double>(window.getLengthInDays())
			       / num::to_double (DecimalConstants<Decimal>::DaysPerYear));

      Decimal growth = num::power (ratio, 1.0 / years);
      return (growth - DecimalConstants<Decimal>::DecimalOne) * DecimalConstants<Decimal>::DecimalOneHundred;
    }

    static Decimal averageReturn (const std::vector<YearlyReturn<Decimal>>& yearlyReturns)
    {
      Decimal sum (DecimalConstants<Decimal>::DecimalZero);
      if (yearlyReturns.empty())
	return sum;

      for (const auto& yr : yearlyReturns)
	sum += yr.returnPercent;

      return sum / num::fromInteger<Decimal> (yearlyReturns.size());
    }
  };
}

#endif
