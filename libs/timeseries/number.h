#ifndef NUMBER_H
#define NUMBER_H

#include <cctype>
#include <cmath>
#include <string>
#include <type_traits>
#include "decimal.h"
#include "DecimalConstants.h"

/**
 * @file number.h
 * @brief Utility functions for the decimal type used for prices and money.
 *
 * The namespace `num` offers the default decimal type of the simulator plus
 * conversions (string, double, integer), rounding and a power function. Every
 * helper also accepts a floating point type so the engine templates can be
 * instantiated with `double`.
 */
namespace num
{
  /**
   * @brief Default decimal type with 7 decimal places using the default rounding policy.
   * @see dec::decimal
   */
  using DefaultNumber  = dec::decimal<7>;

  /**
   * @brief Converts a DefaultNumber to its string representation.
   * @see dec::toString()
   */
  inline std::string toString(const DefaultNumber& d) {
    return dec::toString(d);
  }

  /**
   * @brief Converts a decimal (or floating point) value to a double.
   * Note: This conversion may result in a loss of precision.
   */
  template<class Decimal>
  inline double to_double(const Decimal& d) {
    if constexpr (std::is_floating_point_v<Decimal>)
      return static_cast<double>(d);
    else
      return d.getAsDouble();
  }

  /**
   * @brief Converts a string representation to a decimal type.
   * @tparam N The target decimal type (e.g., DefaultNumber, dec::decimal<P, RP>).
   */
  template<class N>
  inline N fromString(const std::string& s) {
    return rollsim::DecimalConstants<N>::createDecimal(s);
  }

  /**
   * @brief True for an optional sign, digits and an optional fraction ("-12", "63120.50", ".5").
   * Exponent notation and surrounding blanks are rejected.
   */
  inline bool isDecimalString(const std::string& s) {
    std::size_t pos = 0;
    if (pos < s.size() && (s[pos] == '-' || s[pos] == '+'))
      pos++;

    std::size_t digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      pos++;
      digits++;
    }

    if (pos < s.size() && s[pos] == '.') {
      pos++;
      while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        pos++;
        digits++;
      }
    }

    return (pos == s.size()) && (digits > 0);
  }

  template<class Decimal>
  inline Decimal fromDouble(double value) {
    return Decimal(value);
  }

  /**
   * @brief Exact conversion of a lot count or day count to the decimal type.
   */
  template<class Decimal>
  inline Decimal fromInteger(unsigned long value) {
    return rollsim::DecimalConstants<Decimal>::createDecimal(std::to_string(value));
  }

  /**
   * @brief Rounds to the nearest integer, halves rounding towards positive infinity.
   *
   * -2.5 rounds to -2 and 2.5 rounds to 3, so a negative and a positive
   * equity of the same magnitude are treated consistently with a chart that
   * plots the rounded value.
   */
  template<class Decimal>
  inline Decimal roundHalfUp(const Decimal& value) {
    const double rounded = std::floor(to_double(value) + 0.5);

    if constexpr (std::is_floating_point_v<Decimal>)
      return static_cast<Decimal>(rounded);
    else
      return fromString<Decimal>(std::to_string(static_cast<long long>(rounded)));
  }

  /**
   * @brief base ^ exponent computed in double precision and converted back.
   */
  template<class Decimal>
  inline Decimal power(const Decimal& base, double exponent) {
    return fromDouble<Decimal>(std::pow(to_double(base), exponent));
  }

  template<typename Decimal>
  inline Decimal max(const Decimal& a, const Decimal& b) {
    return (a < b) ? b : a;
  }
} // namespace num

#endif // NUMBER_H
