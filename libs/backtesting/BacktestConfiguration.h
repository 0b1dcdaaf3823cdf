// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_BACKTEST_CONFIGURATION_H
#define __ROLLSIM_BACKTEST_CONFIGURATION_H 1

#include <optional>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DecimalConstants.h"
#include "FuturesContractAttributes.h"

namespace rollsim
{
  class BacktestConfigurationException : public std::runtime_error
  {
  public:
    BacktestConfigurationException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~BacktestConfigurationException()
    {}
  };

  // What to do with a label change reported after the old contract expired
  enum class StaleRolloverHandling
    {
      Flag,	// record a BlockedRollover trade
      Suppress	// record nothing, only count it
    };

  //
  // class BacktestConfiguration
  //
  // Parameters of one simulation run. Immutable once built; a different
  // setting means a new configuration and a new run.
  //

  template <class Decimal>
  class BacktestConfiguration
  {
  public:
    static constexpr unsigned int kDefaultInitialLots = 1;
    static constexpr unsigned long kDefaultMaxSimulationDays = 200000;

    BacktestConfiguration()
      : BacktestConfiguration (std::nullopt,
			       std::nullopt,
			       kDefaultInitialLots,
			       DecimalConstants<Decimal>::DefaultInitialMarginPercent,
			       DecimalConstants<Decimal>::DefaultTransactionCost,
			       DecimalConstants<Decimal>::DefaultCompoundingFactor,
			       true,
			       false,
			       createMcxGoldAttributes<Decimal>(),
			       true,
			       StaleRolloverHandling::Flag,
			       kDefaultMaxSimulationDays)
    {}

    BacktestConfiguration (const std::optional<boost::gregorian::date>& startDate,
			   const std::optional<boost::gregorian::date>& endDate,
			   unsigned int initialLots,
			   const Decimal& initialMarginPercent,
			   const Decimal& transactionCost,
			   const Decimal& compoundingFactor,
			   bool compounding,
			   bool neverCompound,
			   const FuturesContractAttributes<Decimal>& contractAttributes,
			   bool enforceExpiryGuard,
			   StaleRolloverHandling staleRolloverHandling,
			   unsigned long maxSimulationDays)
      : mStartDate(startDate),
	mEndDate(endDate),
	mInitialLots(initialLots),
	mInitialMarginPercent(initialMarginPercent),
	mTransactionCost(transactionCost),
	mCompoundingFactor(compoundingFactor),
	mCompounding(compounding),
	mNeverCompound(neverCompound),
	mContractAttributes(contractAttributes),
	mEnforceExpiryGuard(enforceExpiryGuard),
	mStaleRolloverHandling(staleRolloverHandling),
	mMaxSimulationDays(maxSimulationDays)
    {
      const Decimal zero(DecimalConstants<Decimal>::DecimalZero);

      if (initialLots == 0)
	throw BacktestConfigurationException ("BacktestConfiguration - initial lots must be positive");

      if (initialMarginPercent < zero)
	throw BacktestConfigurationException ("BacktestConfiguration - initial margin percent cannot be negative");

      if (transactionCost < zero)
	throw BacktestConfigurationException ("BacktestConfiguration - transaction cost cannot be negative");

      if (compoundingFactor < zero)
	throw BacktestConfigurationException ("BacktestConfiguration - compounding factor cannot be negative");

      if (maxSimulationDays < 2)
	throw BacktestConfigurationException ("BacktestConfiguration - max simulation days must be at least 2");

      if (startDate && startDate->is_special())
	throw BacktestConfigurationException ("BacktestConfiguration - start date is not a calendar date");

      if (endDate && endDate->is_special())
	throw BacktestConfigurationException ("BacktestConfiguration - end date is not a calendar date");

      if (startDate && endDate && (*endDate < *startDate))
	throw BacktestConfigurationException ("BacktestConfiguration - end date "
					      + boost::gregorian::to_iso_extended_string (*endDate)
					      + " is before start date "
					      + boost::gregorian::to_iso_extended_string (*startDate));
    }

    BacktestConfiguration (const BacktestConfiguration<Decimal>& rhs) = default;
    BacktestConfiguration<Decimal>& operator=(const BacktestConfiguration<Decimal>& rhs) = default;
    ~BacktestConfiguration() = default;

    const std::optional<boost::gregorian::date>& getStartDate() const
    {
      return mStartDate;
    }

    const std::optional<boost::gregorian::date>& getEndDate() const
    {
      return mEndDate;
    }

    unsigned int getInitialLots() const
    {
      return mInitialLots;
    }

    const Decimal& getInitialMarginPercent() const
    {
      return mInitialMarginPercent;
    }

    const Decimal& getTransactionCost() const
    {
      return mTransactionCost;
    }

    const Decimal& getCompoundingFactor() const
    {
      return mCompoundingFactor;
    }

    // neverCompound wins over the compounding switch
    bool isCompounding() const
    {
      return mCompounding && !mNeverCompound;
    }

    bool isNeverCompound() const
    {
      return mNeverCompound;
    }

    const FuturesContractAttributes<Decimal>& getContractAttributes() const
    {
      return mContractAttributes;
    }

    const Decimal& getContractMultiplier() const
    {
      return mContractAttributes.getBigPointValue();
    }

    bool isExpiryGuardEnforced() const
    {
      return mEnforceExpiryGuard;
    }

    StaleRolloverHandling getStaleRolloverHandling() const
    {
      return mStaleRolloverHandling;
    }

    unsigned long getMaxSimulationDays() const
    {
      return mMaxSimulationDays;
    }

  private:
    std::optional<boost::gregorian::date> mStartDate;
    std::optional<boost::gregorian::date> mEndDate;
    unsigned int mInitialLots;
    Decimal mInitialMarginPercent;
    Decimal mTransactionCost;
    Decimal mCompoundingFactor;
    bool mCompounding;
    bool mNeverCompound;
    FuturesContractAttributes<Decimal> mContractAttributes;
    bool mEnforceExpiryGuard;
    StaleRolloverHandling mStaleRolloverHandling;
    unsigned long mMaxSimulationDays;
  };
}

#endif
