// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_ROLL_TIMESERIES_H
#define __ROLLSIM_ROLL_TIMESERIES_H 1

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "RollObservation.h"
#include "DateRange.h"
#include "TimeSeriesException.h"

namespace rollsim
{
  /**
   * @class RollTimeSeries
   * @brief Daily near/far observations kept in strictly ascending date order.
   *
   * Entries live in a sorted std::vector and are inserted at the position found
   * with std::lower_bound. A second observation
   * for a date that is already present is rejected, so the simulator can rely
   * on dates strictly increasing from one entry to the next.
   *
   * @tparam Decimal numeric type of prices (e.g. num::DefaultNumber).
   */
  template <class Decimal>
  class RollTimeSeries
  {
  public:
    using Entry = RollObservation<Decimal>;
    using ConstSortedIterator = typename std::vector<Entry>::const_iterator;

    RollTimeSeries()
      : mData()
    {}

    /**
     * @brief Construct from an arbitrary (possibly unsorted) range of observations.
     * @throws RollSeriesException if two observations share a date.
     */
    template<
    class InputIt,
    class = typename std::enable_if<
      std::is_convertible<
	typename std::iterator_traits<InputIt>::value_type,
	Entry>::value>::type>
    RollTimeSeries(InputIt first, InputIt last)
      : mData(first, last)
    {
      std::stable_sort(mData.begin(), mData.end(),
		       [](const Entry& a, const Entry& b)
		       {
			 return a.getDate() < b.getDate();
		       });

      auto dup = std::adjacent_find(mData.begin(), mData.end(),
				    [](const Entry& a, const Entry& b)
				    {
				      return a.getDate() == b.getDate();
				    });

      if (dup != mData.end())
	throw RollSeriesException("RollTimeSeries: duplicate observation date " +
				  toIsoString (dup->getDate()));
    }

    RollTimeSeries(const RollTimeSeries<Decimal>& rhs) = default;
    RollTimeSeries<Decimal>& operator=(const RollTimeSeries<Decimal>& rhs) = default;
    RollTimeSeries(RollTimeSeries<Decimal>&& rhs) noexcept = default;
    RollTimeSeries<Decimal>& operator=(RollTimeSeries<Decimal>&& rhs) noexcept = default;
    ~RollTimeSeries() = default;

    /**
     * @brief Insert an observation at its chronological position.
     * @throws RollSeriesException if an observation for the same date exists.
     */
    void addEntry (Entry entry)
    {
      auto it = std::lower_bound(mData.begin(), mData.end(), entry.getDate(),
				 [](const Entry& e, const TimeSeriesDate& d)
				 {
				   return e.getDate() < d;
				 });

      if (it != mData.end() && it->getDate() == entry.getDate())
	throw RollSeriesException("RollTimeSeries::addEntry: duplicate observation date " +
				  toIsoString (entry.getDate()));

      mData.insert(it, std::move(entry));
    }

    unsigned long getNumEntries() const
    {
      return mData.size();
    }

    bool isEmpty() const
    {
      return mData.empty();
    }

    ConstSortedIterator beginSortedAccess() const
    {
      return mData.begin();
    }

    ConstSortedIterator endSortedAccess() const
    {
      return mData.end();
    }

    const TimeSeriesDate& getFirstDate() const
    {
      if (mData.empty())
	throw RollSeriesDataAccessException("RollTimeSeries::getFirstDate: series is empty");
      return mData.front().getDate();
    }

    const TimeSeriesDate& getLastDate() const
    {
      if (mData.empty())
	throw RollSeriesDataAccessException("RollTimeSeries::getLastDate: series is empty");
      return mData.back().getDate();
    }

    const std::vector<Entry>& getEntries() const
    {
      return mData;
    }

  private:
    std::vector<Entry> mData;
  };

  template <class Decimal>
  bool operator==(const RollTimeSeries<Decimal>& lhs, const RollTimeSeries<Decimal>& rhs)
  {
    return lhs.getEntries() == rhs.getEntries();
  }

  template <class Decimal>
  bool operator!=(const RollTimeSeries<Decimal>& lhs, const RollTimeSeries<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @brief Contiguous sub-series with firstDate <= date <= lastDate, order preserved.
   *
   * Unlike a window check, the range may start before or end after the data;
   * only the overlapping observations are copied.
   */
  template <class Decimal>
  RollTimeSeries<Decimal> FilterRollTimeSeries(const RollTimeSeries<Decimal>& series,
					       const DateRange& dates)
  {
    using Entry = RollObservation<Decimal>;
    const auto& data = series.getEntries();

    auto first = std::lower_bound(data.begin(), data.end(), dates.getFirstDate(),
				  [](const Entry& e, const TimeSeriesDate& d)
				  {
				    return e.getDate() < d;
				  });

    auto last = std::upper_bound(first, data.end(), dates.getLastDate(),
				 [](const TimeSeriesDate& d, const Entry& e)
				 {
				   return d < e.getDate();
				 });

    return RollTimeSeries<Decimal>(first, last);
  }
}

#endif // __ROLLSIM_ROLL_TIMESERIES_H
