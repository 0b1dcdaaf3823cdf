// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_FUTURES_CONTRACT_ATTRIBUTES_H
#define __ROLLSIM_FUTURES_CONTRACT_ATTRIBUTES_H 1

#include <stdexcept>
#include <string>
#include "number.h"
#include "DecimalConstants.h"

namespace rollsim
{
  class FuturesContractAttributesException : public std::domain_error
  {
  public:
    FuturesContractAttributesException(const std::string msg)
      : std::domain_error(msg)
    {}

    ~FuturesContractAttributesException()
    {}
  };

  /**
   * @brief Static attributes of the futures market being rolled.
   * @tparam Decimal The numeric type used for calculations.
   *
   * The big point value is the contract multiplier: the money value of a one
   * point move in the quoted price for one lot. For MCX GOLD the price is
   * quoted per 10 grams and a lot is one kilogram, so the multiplier is 100.
   */
  template <class Decimal>
  class FuturesContractAttributes
  {
  public:
    /**
     * @brief Constructs a FuturesContractAttributes object.
     * @param symbol The exchange symbol (e.g. "GOLD").
     * @param name Descriptive name.
     * @param exchange Exchange the contracts trade on.
     * @param bigPointValue Value of a one point move for one lot, must be positive.
     * @param tick The minimum price fluctuation, must be positive.
     * @throws FuturesContractAttributesException on a non-positive multiplier or tick.
     */
    FuturesContractAttributes (const std::string& symbol,
			       const std::string& name,
			       const std::string& exchange,
			       const Decimal& bigPointValue,
			       const Decimal& tick)
      : mSymbol(symbol),
	mName(name),
	mExchange(exchange),
	mBigPointValue(bigPointValue),
	mTick(tick)
    {
      if (bigPointValue <= DecimalConstants<Decimal>::DecimalZero)
	throw FuturesContractAttributesException ("FuturesContractAttributes - big point value for "
						  + symbol + " must be positive");

      if (tick <= DecimalConstants<Decimal>::DecimalZero)
	throw FuturesContractAttributesException ("FuturesContractAttributes - tick for "
						  + symbol + " must be positive");
    }

    FuturesContractAttributes (const FuturesContractAttributes<Decimal>& rhs) = default;
    FuturesContractAttributes<Decimal>& operator=(const FuturesContractAttributes<Decimal>& rhs) = default;
    ~FuturesContractAttributes() = default;

    /**
     * @brief Gets the exchange symbol.
     */
    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    const std::string& getName() const
    {
      return mName;
    }

    const std::string& getExchange() const
    {
      return mExchange;
    }

    /**
     * @brief Gets the contract multiplier.
     * @return Money value of a one point price move for one lot.
     */
    const Decimal& getBigPointValue() const
    {
      return mBigPointValue;
    }

    const Decimal& getTick() const
    {
      return mTick;
    }

  private:
    std::string mSymbol;
    std::string mName;
    std::string mExchange;
    Decimal mBigPointValue;
    Decimal mTick;
  };

  template <class Decimal>
  inline bool operator==(const FuturesContractAttributes<Decimal>& lhs,
			 const FuturesContractAttributes<Decimal>& rhs)
  {
    return (lhs.getSymbol() == rhs.getSymbol()) &&
      (lhs.getExchange() == rhs.getExchange()) &&
      (lhs.getBigPointValue() == rhs.getBigPointValue()) &&
      (lhs.getTick() == rhs.getTick());
  }

  template <class Decimal>
  inline bool operator!=(const FuturesContractAttributes<Decimal>& lhs,
			 const FuturesContractAttributes<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }

  /**
   * @brief MCX GOLD, the market the perpetual roll was designed for.
   */
  template <class Decimal>
  FuturesContractAttributes<Decimal> createMcxGoldAttributes()
  {
    return FuturesContractAttributes<Decimal> ("GOLD", "MCX Gold 1 Kg", "MCX",
					       DecimalConstants<Decimal>::McxGoldBigPointValue,
					       DecimalConstants<Decimal>::McxGoldTick);
  }

  /**
   * @brief MCX GOLD with a caller supplied contract multiplier.
   */
  template <class Decimal>
  FuturesContractAttributes<Decimal> createMcxGoldAttributes (const Decimal& bigPointValue)
  {
    return FuturesContractAttributes<Decimal> ("GOLD", "MCX Gold", "MCX",
					       bigPointValue,
					       DecimalConstants<Decimal>::McxGoldTick);
  }
}

#endif
