// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//
#ifndef __ROLLSIM_BOOST_DATE_HELPER_H
#define __ROLLSIM_BOOST_DATE_HELPER_H 1

#include <string>
#include <stdexcept>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace rollsim
{
  typedef boost::gregorian::date TimeSeriesDate;
  using boost::gregorian::date_duration;

  /**
   * @brief Parse an ISO 8601 calendar date ("YYYY-MM-DD").
   * @throws std::out_of_range or boost::bad_lexical_cast derived exceptions
   *         from boost::gregorian when the string is not a valid date.
   */
  inline TimeSeriesDate parseIsoDate (const std::string& isoDate)
  {
    return boost::gregorian::from_simple_string (isoDate);
  }

  inline std::string toIsoString (const TimeSeriesDate& aDate)
  {
    return boost::gregorian::to_iso_extended_string (aDate);
  }

  inline int calendarYear (const TimeSeriesDate& aDate)
  {
    return static_cast<int>(aDate.year());
  }

  // Signed number of calendar days from first to second
  inline long daysBetween (const TimeSeriesDate& first, const TimeSeriesDate& second)
  {
    return (second - first).days();
  }

  inline bool isWeekend (const boost::gregorian::date& aDate)
  {
    return (aDate.day_of_week() == boost::date_time::Saturday ||
	    aDate.day_of_week() == boost::date_time::Sunday);
  }
}

#endif
