// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_DATE_RANGE_H
#define __ROLLSIM_DATE_RANGE_H 1

#include <exception>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <stdexcept>
#include <string>

namespace rollsim
{
  class DateRangeException : public std::runtime_error
  {
  public:
  DateRangeException(const std::string& msg)
    : std::runtime_error(msg)
      {}

    ~DateRangeException()
      {}
  };

  // Inclusive calendar window [firstDate, lastDate]
  class DateRange
  {
  public:
    DateRange(const boost::gregorian::date& firstDate, const boost::gregorian::date& lastDate)
      : mFirstDate(firstDate),
	mLastDate(lastDate)
    {
      if (firstDate.is_special() || lastDate.is_special())
	throw DateRangeException ("DateRange::DateRange - dates must be valid calendar dates");

      if (lastDate < firstDate)
	throw DateRangeException ("DateRange::DateRange - Second date cannot occur before first date");
    }

    DateRange(const DateRange&) = default;
    DateRange& operator=(const DateRange&) = default;
    ~DateRange() noexcept = default;

    const boost::gregorian::date& getFirstDate() const
    {
      return mFirstDate;
    }

    const boost::gregorian::date& getLastDate() const
    {
      return mLastDate;
    }

    // Number of calendar days from first to last date (0 for a single day window)
    long getLengthInDays() const
    {
      return (mLastDate - mFirstDate).days();
    }

  private:
    boost::gregorian::date mFirstDate;
    boost::gregorian::date mLastDate;
  };

  inline bool operator==(const DateRange& lhs, const DateRange& rhs)
    {
      return ((lhs.getFirstDate() == rhs.getFirstDate()) &&
	      (lhs.getLastDate() == rhs.getLastDate()));
    }

  inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
    {
      return !(lhs == rhs);
    }
}

#endif

