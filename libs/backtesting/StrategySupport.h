// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_STRATEGY_SUPPORT_H
#define __REBALANCER_STRATEGY_SUPPORT_H 1

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>
#include "IndicatorSnapshot.h"
#include "number.h"

namespace rebalancer
{
  class StrategyException : public std::domain_error
  {
  public:
    StrategyException(const std::string msg)
      : std::domain_error(msg)
    {}

    ~StrategyException()
    {}
  };

  // True when every named indicator is present in the snapshot.
  template <class Decimal>
  bool hasAllIndicators (const IndicatorSnapshot<Decimal>& snapshot,
			 const std::vector<std::string>& names)
  {
    return std::all_of (names.begin(), names.end(),
			[&snapshot](const std::string& name)
			{
			  return snapshot.hasValue (name);
			});
  }

  /**
   * @brief Value of an indicator a strategy has already checked for.
   * @throws StrategyException when the indicator is absent.
   */
  template <class Decimal>
  Decimal indicatorValue (const IndicatorSnapshot<Decimal>& snapshot,
			  const std::string& name)
  {
    auto value = snapshot.getValue (name);
    if (!value)
      throw StrategyException ("indicator " + name + " is not available as of " +
			       boost::gregorian::to_iso_extended_string (snapshot.getAsOfDate()));

    return *value;
  }

  template <class Decimal>
  bool inClosedRange (const Decimal& value, const Decimal& low, const Decimal& high)
  {
    return (low <= value) && (value <= high);
  }

  template <class Decimal>
  std::string formatPercent (const Decimal& fraction)
  {
    return num::toString (fraction * Decimal(100), 1) + "%";
  }
}

#endif
