// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_ROLL_SERIES_FILTER_H
#define __ROLLSIM_ROLL_SERIES_FILTER_H 1

#include <optional>
#include <string>
#include "RollTimeSeries.h"
#include "DateRange.h"

namespace rollsim
{
  enum class SeriesFilterStatus
    {
      Ok,
      InsufficientData,
      TooManyObservations
    };

  template <class Decimal>
  class RollSeriesFilterResult
  {
  public:
    RollSeriesFilterResult (SeriesFilterStatus status,
			    std::optional<RollTimeSeries<Decimal>> series,
			    unsigned long numObservations)
      : mStatus(status),
	mSeries(std::move(series)),
	mNumObservations(numObservations)
    {}

    SeriesFilterStatus getStatus() const
    {
      return mStatus;
    }

    bool isOk() const
    {
      return mStatus == SeriesFilterStatus::Ok;
    }

    // Present only when the status is Ok
    const std::optional<RollTimeSeries<Decimal>>& getSeries() const
    {
      return mSeries;
    }

    // Number of observations that fell inside the window, whatever the status
    unsigned long getNumObservations() const
    {
      return mNumObservations;
    }

  private:
    SeriesFilterStatus mStatus;
    std::optional<RollTimeSeries<Decimal>> mSeries;
    unsigned long mNumObservations;
  };

  //
  // class RollSeriesFilter
  //
  // Restricts a series to the simulation window. A simulation needs at least a
  // previous and a current day, so fewer than two observations is reported
  // as InsufficientData rather than treated as an error.
  //

  template <class Decimal>
  class RollSeriesFilter
  {
  public:
    static constexpr unsigned long kMinimumObservations = 2;

    explicit RollSeriesFilter (unsigned long maxObservations)
      : mMaxObservations(maxObservations)
    {}

    RollSeriesFilterResult<Decimal> filter (const RollTimeSeries<Decimal>& series,
					    const DateRange& window) const
    {
      RollTimeSeries<Decimal> subset = FilterRollTimeSeries (series, window);
      unsigned long count = subset.getNumEntries();

      if (count < kMinimumObservations)
	return RollSeriesFilterResult<Decimal> (SeriesFilterStatus::InsufficientData,
						std::nullopt, count);

      if (count > mMaxObservations)
	return RollSeriesFilterResult<Decimal> (SeriesFilterStatus::TooManyObservations,
						std::nullopt, count);

      return RollSeriesFilterResult<Decimal> (SeriesFilterStatus::Ok,
					      std::move(subset), count);
    }

  private:
    unsigned long mMaxObservations;
  };
}

#endif
