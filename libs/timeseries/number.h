#ifndef __REBALANCER_NUMBER_H
#define __REBALANCER_NUMBER_H 1

#include <sstream>
#include <stdexcept>
#include <string>
#include <iomanip>
#include <cmath>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "decimal.h"

/**
 * @file number.h
 * @brief Numeric type used throughout the simulator and small conversion helpers.
 *
 * Prices, share amounts, cash and indicator values are all carried in a
 * single `Decimal` template parameter. Applications and tests instantiate
 * the templates with `num::DefaultNumber`, a fixed point decimal so that
 * cash bookkeeping does not accumulate binary rounding error.
 */
namespace num
{
  /**
   * @brief Default numeric type for prices, cash and indicator values.
   */
  using DefaultNumber = dec::decimal<7>;

  inline double to_double(const DefaultNumber& d)
  {
    return d.getAsDouble();
  }

  /**
   * @brief Converts a number to a string with fixed precision.
   * @param d The number to convert.
   * @param precision Digits after the decimal point.
   */
  inline std::string toString(const DefaultNumber& d, int precision = 4)
  {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << d.getAsDouble();
    return os.str();
  }

  /**
   * @brief Parses a number from its string representation.
   * @tparam N The target decimal type.
   * @throws std::domain_error if the string is not a number.
   */
  template<class N>
  inline N fromString(const std::string& s)
  {
    const std::string trimmed = boost::algorithm::trim_copy(s);
    try
      {
	boost::lexical_cast<double>(trimmed);
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw std::domain_error("num::fromString - cannot convert '" + s + "' to a number");
      }

    return ::dec::fromString<N>(trimmed);
  }

  template <int Prec, class RoundPolicy>
  inline dec::decimal<Prec, RoundPolicy> abs(const dec::decimal<Prec, RoundPolicy>& d)
  {
    return d.abs();
  }

  /**
   * @brief True when the magnitude of d is below the given tolerance.
   */
  template<typename Decimal>
  inline bool isNearlyZero(const Decimal& d, double tolerance = 1e-12)
  {
    return std::fabs(to_double(d)) < tolerance;
  }

} // namespace num

#endif // __REBALANCER_NUMBER_H
