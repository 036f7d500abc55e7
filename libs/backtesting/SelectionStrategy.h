// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_SELECTION_STRATEGY_H
#define __REBALANCER_SELECTION_STRATEGY_H 1

#include <string>
#include <variant>
#include <vector>
#include <boost/algorithm/string.hpp>
#include "MomentumStrategy.h"
#include "ValueStrategy.h"
#include "GrowthStrategy.h"
#include "MultiFactorStrategy.h"
#include "UserDefinedStrategy.h"

namespace rebalancer
{
  /**
   * @class SelectionStrategy
   * @brief Closed set of instrument selection strategies.
   *
   * Each alternative is a configuration record with free qualifies, score,
   * describe and requiredIndicators overloads. SelectionStrategy forwards to
   * the alternative it holds.
   */
  template <class Decimal>
  class SelectionStrategy
  {
  public:
    typedef std::variant<MomentumStrategy<Decimal>,
			 ValueStrategy<Decimal>,
			 GrowthStrategy<Decimal>,
			 MultiFactorStrategy<Decimal>,
			 UserDefinedStrategy<Decimal>> StrategyVariant;

    SelectionStrategy (const MomentumStrategy<Decimal>& s) : mStrategy(s) {}
    SelectionStrategy (const ValueStrategy<Decimal>& s) : mStrategy(s) {}
    SelectionStrategy (const GrowthStrategy<Decimal>& s) : mStrategy(s) {}
    SelectionStrategy (const MultiFactorStrategy<Decimal>& s) : mStrategy(s) {}
    SelectionStrategy (const UserDefinedStrategy<Decimal>& s) : mStrategy(s) {}

    bool qualify (const IndicatorSnapshot<Decimal>& snapshot) const
    {
      return std::visit ([&snapshot](const auto& s) { return qualifies (s, snapshot); },
			 mStrategy);
    }

    Decimal score (const IndicatorSnapshot<Decimal>& snapshot) const
    {
      return std::visit ([&snapshot](const auto& s) { return rebalancer::score (s, snapshot); },
			 mStrategy);
    }

    std::string describe() const
    {
      return std::visit ([](const auto& s) { return rebalancer::describe (s); }, mStrategy);
    }

    std::vector<std::string> getRequiredIndicators() const
    {
      return std::visit ([](const auto& s) { return requiredIndicators (s); }, mStrategy);
    }

    const std::string& getName() const
    {
      return std::visit ([](const auto& s) -> const std::string& { return s.name; }, mStrategy);
    }

    Decimal getMinScore() const
    {
      return std::visit ([](const auto& s) { return s.minScore; }, mStrategy);
    }

    const StrategyVariant& getStrategy() const
    {
      return mStrategy;
    }

  private:
    StrategyVariant mStrategy;
  };

  /**
   * @brief Builds one of the named built-in strategies with default settings.
   * @param name momentum, value or growth (case insensitive)
   * @throws StrategyException for any other name.
   */
  template <class Decimal>
  SelectionStrategy<Decimal> createBuiltInStrategy (const std::string& name)
  {
    std::string key = boost::algorithm::to_lower_copy (boost::algorithm::trim_copy (name));

    if (key == "momentum")
      return SelectionStrategy<Decimal> (MomentumStrategy<Decimal>());
    else if (key == "value")
      return SelectionStrategy<Decimal> (ValueStrategy<Decimal>());
    else if (key == "growth")
      return SelectionStrategy<Decimal> (GrowthStrategy<Decimal>());

    throw StrategyException ("createBuiltInStrategy: unknown strategy " + name);
  }
}

#endif
