// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_DECIMAL_CONSTANTS_H
#define __REBALANCER_DECIMAL_CONSTANTS_H 1

#include <string>
#include "number.h"

namespace rebalancer
{
  /**
   * @brief Shared numeric constants for price, cash and indicator arithmetic.
   *
   * DecimalOneHundred converts fractions to the 0-100 scale used by RSI, ROC
   * and strategy scores.
   */
  template <class Decimal>
  struct DecimalConstants
  {
    static const Decimal DecimalZero;
    static const Decimal DecimalOne;
    static const Decimal DecimalMinusOne;
    static const Decimal DecimalOneHundred;

    // Values built from strings keep every digit of the fixed point type.
    static Decimal createDecimal (const std::string& valueString)
    {
      return num::fromString<Decimal>(valueString);
    }
  };

  template <class Decimal>
  const Decimal DecimalConstants<Decimal>::DecimalZero(num::fromString<Decimal>("0.0"));

  template <class Decimal>
  const Decimal DecimalConstants<Decimal>::DecimalOne(num::fromString<Decimal>("1.0"));

  template <class Decimal>
  const Decimal DecimalConstants<Decimal>::DecimalMinusOne(num::fromString<Decimal>("-1.0"));

  template <class Decimal>
  const Decimal DecimalConstants<Decimal>::DecimalOneHundred(num::fromString<Decimal>("100.0"));
}

#endif
