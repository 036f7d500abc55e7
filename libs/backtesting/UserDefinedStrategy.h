// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_USER_DEFINED_STRATEGY_H
#define __REBALANCER_USER_DEFINED_STRATEGY_H 1

#include <functional>
#include <string>
#include <vector>
#include "StrategySupport.h"
#include "IndicatorSnapshot.h"

namespace rebalancer
{
  /**
   * @brief Strategy assembled from caller supplied callables.
   *
   * The callables only see snapshots that carry every indicator listed in
   * required.
   */
  template <class Decimal>
  struct UserDefinedStrategy
  {
    typedef std::function<bool (const IndicatorSnapshot<Decimal>&)> QualifyFunction;
    typedef std::function<Decimal (const IndicatorSnapshot<Decimal>&)> ScoreFunction;

    UserDefinedStrategy (const std::string& strategyName,
			 const std::vector<std::string>& requiredNames,
			 QualifyFunction qualifyFunction,
			 ScoreFunction scoreFunction,
			 const std::string& strategyDescription = "")
      : name(strategyName),
	required(requiredNames),
	qualify(std::move(qualifyFunction)),
	scoreOf(std::move(scoreFunction)),
	description(strategyDescription)
    {
      if (name.empty())
	throw StrategyException ("UserDefinedStrategy: name must not be empty");

      if (!qualify || !scoreOf)
	throw StrategyException ("UserDefinedStrategy " + name + ": qualify and score functions are required");
    }

    std::string name;
    Decimal minScore = Decimal(0);
    std::vector<std::string> required;
    QualifyFunction qualify;
    ScoreFunction scoreOf;
    std::string description;
  };

  template <class Decimal>
  std::vector<std::string> requiredIndicators (const UserDefinedStrategy<Decimal>& s)
  {
    return s.required;
  }

  template <class Decimal>
  bool qualifies (const UserDefinedStrategy<Decimal>& s, const IndicatorSnapshot<Decimal>& snapshot)
  {
    if (!hasAllIndicators (snapshot, s.required))
      return false;

    return s.qualify (snapshot);
  }

  template <class Decimal>
  Decimal score (const UserDefinedStrategy<Decimal>& s, const IndicatorSnapshot<Decimal>& snapshot)
  {
    return s.scoreOf (snapshot);
  }

  template <class Decimal>
  std::string describe (const UserDefinedStrategy<Decimal>& s)
  {
    std::string text = s.name + " strategy";
    if (!s.description.empty())
      text += ": " + s.description;
    text += "\n";

    if (!s.required.empty())
      {
	text += "Required indicators:";
	for (const auto& r : s.required)
	  text += " " + r;
	text += "\n";
      }

    return text + "Minimum score: " + num::toString (s.minScore, 2) + "\n";
  }
}

#endif
