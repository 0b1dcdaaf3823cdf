// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ROLLSIM_DECIMAL_CONSTANT_H
#define __ROLLSIM_DECIMAL_CONSTANT_H 1

#include <string>
#include <type_traits>
#include "decimal.h"

namespace rollsim
{
  template <class Decimal>
  class DecimalConstants
    {
    public:
      static Decimal DecimalZero;
      static Decimal DecimalOne;
      static Decimal DecimalOneHundred;
      static Decimal DecimalMinusOneHundred;
      static Decimal DaysPerYear;

      // MCX GOLD: prices are quoted per 10 grams, one lot is 1 kg
      static Decimal McxGoldBigPointValue;
      static Decimal McxGoldTick;

      static Decimal DefaultInitialMarginPercent;
      static Decimal DefaultTransactionCost;
      static Decimal DefaultCompoundingFactor;

      static Decimal createDecimal (const std::string& valueString)
      {
        if constexpr (std::is_floating_point_v<Decimal>) {
          return static_cast<Decimal>(std::stod(valueString));
        } else {
          return dec::fromString<Decimal>(valueString);
        }
      }
    };

  // ---------------------------------------------------------------------------
  // Static member definitions
  //
  // All values are initialised via createDecimal(string) so the full precision
  // of the underlying Decimal type is used.
  // ---------------------------------------------------------------------------

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalZero(
      DecimalConstants<Decimal>::createDecimal("0.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOne(
      DecimalConstants<Decimal>::createDecimal("1.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOneHundred(
      DecimalConstants<Decimal>::createDecimal("100.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalMinusOneHundred(
      DecimalConstants<Decimal>::createDecimal("-100.0"));

  // Average calendar year length used to annualize a date window
  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DaysPerYear(
      DecimalConstants<Decimal>::createDecimal("365.25"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::McxGoldBigPointValue(
      DecimalConstants<Decimal>::createDecimal("100.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::McxGoldTick(
      DecimalConstants<Decimal>::createDecimal("1.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultInitialMarginPercent(
      DecimalConstants<Decimal>::createDecimal("12.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultTransactionCost(
      DecimalConstants<Decimal>::createDecimal("1800.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultCompoundingFactor(
      DecimalConstants<Decimal>::createDecimal("200.0"));

  // ---------------------------------------------------------------------------
  // Free helper
  // ---------------------------------------------------------------------------
  template <class Decimal>
  Decimal
  createADecimal(const std::string& numString)
  {
    return DecimalConstants<Decimal>::createDecimal(numString);
  }
}

#endif
