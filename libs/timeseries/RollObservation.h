// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_ROLL_OBSERVATION_H
#define __ROLLSIM_ROLL_OBSERVATION_H 1

#include <optional>
#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BoostDateHelper.h"
#include "number.h"

namespace rollsim
{
  //
  // class RollObservationException
  //

  class RollObservationException : public std::domain_error
  {
  public:
    RollObservationException(const std::string msg)
      : std::domain_error(msg)
    {}

    ~RollObservationException()
    {}
  };

  //
  // class RollObservation
  //
  // One trading day of the synthetic perpetual: the closing prices of the
  // near and far contracts selected for that day, their labels and (when the
  // feed provides them) their expiry dates. The annualized premium is carried
  // through for charting only.
  //

  template <class Decimal> class RollObservation
  {
  public:
    RollObservation (const TimeSeriesDate& observationDate,
		     const Decimal& nearPrice,
		     const Decimal& farPrice,
		     const std::string& nearContract,
		     const std::string& farContract,
		     const std::optional<TimeSeriesDate>& nearExpiryDate = std::nullopt,
		     const std::optional<TimeSeriesDate>& farExpiryDate = std::nullopt,
		     const std::optional<Decimal>& premium = std::nullopt)
      : mDate(observationDate),
	mNearPrice(nearPrice),
	mFarPrice(farPrice),
	mNearContract(nearContract),
	mFarContract(farContract),
	mNearExpiryDate(nearExpiryDate),
	mFarExpiryDate(farExpiryDate),
	mPremium(premium)
    {
      if (observationDate.is_special())
	throw RollObservationException ("RollObservation - observation date is not a calendar date");

      if (nearContract.empty())
	throw RollObservationException ("RollObservation - empty near contract label on "
					+ toIsoString (observationDate));

      if (farContract.empty())
	throw RollObservationException ("RollObservation - empty far contract label on "
					+ toIsoString (observationDate));

      if (nearExpiryDate && nearExpiryDate->is_special())
	throw RollObservationException ("RollObservation - near expiry date is not a calendar date on "
					+ toIsoString (observationDate));

      if (farExpiryDate && farExpiryDate->is_special())
	throw RollObservationException ("RollObservation - far expiry date is not a calendar date on "
					+ toIsoString (observationDate));
    }

    RollObservation (const RollObservation<Decimal>& rhs) = default;
    RollObservation<Decimal>& operator=(const RollObservation<Decimal>& rhs) = default;
    ~RollObservation() = default;

    const TimeSeriesDate& getDate() const
    {
      return mDate;
    }

    const Decimal& getNearPrice() const
    {
      return mNearPrice;
    }

    const Decimal& getFarPrice() const
    {
      return mFarPrice;
    }

    const std::string& getNearContract() const
    {
      return mNearContract;
    }

    const std::string& getFarContract() const
    {
      return mFarContract;
    }

    const std::optional<TimeSeriesDate>& getNearExpiryDate() const
    {
      return mNearExpiryDate;
    }

    const std::optional<TimeSeriesDate>& getFarExpiryDate() const
    {
      return mFarExpiryDate;
    }

    const std::optional<Decimal>& getPremium() const
    {
      return mPremium;
    }

  private:
    TimeSeriesDate mDate;
    Decimal mNearPrice;
    Decimal mFarPrice;
    std::string mNearContract;
    std::string mFarContract;
    std::optional<TimeSeriesDate> mNearExpiryDate;
    std::optional<TimeSeriesDate> mFarExpiryDate;
    std::optional<Decimal> mPremium;
  };

  template <class Decimal>
  inline bool operator==(const RollObservation<Decimal>& lhs, const RollObservation<Decimal>& rhs)
  {
    return (lhs.getDate() == rhs.getDate()) &&
      (lhs.getNearPrice() == rhs.getNearPrice()) &&
      (lhs.getFarPrice() == rhs.getFarPrice()) &&
      (lhs.getNearContract() == rhs.getNearContract()) &&
      (lhs.getFarContract() == rhs.getFarContract()) &&
      (lhs.getNearExpiryDate() == rhs.getNearExpiryDate()) &&
      (lhs.getFarExpiryDate() == rhs.getFarExpiryDate()) &&
      (lhs.getPremium() == rhs.getPremium());
  }

  template <class Decimal>
  inline bool operator!=(const RollObservation<Decimal>& lhs, const RollObservation<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
