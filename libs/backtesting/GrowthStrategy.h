// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_GROWTH_STRATEGY_H
#define __REBALANCER_GROWTH_STRATEGY_H 1

#include <sstream>
#include <string>
#include <vector>
#include "MultiFactorStrategy.h"

namespace rebalancer
{
  template <class Decimal>
  std::vector<Factor<Decimal>> defaultGrowthFactors()
  {
    typedef FactorTransform<Decimal> T;

    return {
      { "momentum_20d", T::linearClamp (Decimal(200)), Decimal(0.30) },
      { "momentum_60d", T::linearClamp (Decimal(100)), Decimal(0.25) },
      { IndicatorNames::Rsi, T::ramp (Decimal(50), Decimal(80), Decimal(5)), Decimal(0.20) },
      { IndicatorNames::VolumeRatio, T::linearClamp (Decimal(50), Decimal(1)), Decimal(0.15) },
      { IndicatorNames::PricePosition, T::linearClamp (Decimal(100)), Decimal(0.10) }
    };
  }

  /**
   * @brief Multi-factor selection favouring accelerating, well supported
   *        uptrends.
   */
  template <class Decimal>
  struct GrowthStrategy
  {
    std::string name = "Growth";
    Decimal minScore = Decimal(0);

    Decimal minMomentum20d = Decimal(0.05);
    Decimal minMomentum60d = Decimal(0.10);
    Decimal minRsi = Decimal(45);
    Decimal maxRsi = Decimal(80);
    Decimal minVolumeRatio = Decimal(1.2);
    Decimal minPricePosition = Decimal(0.4);
    Decimal maxVolatility = Decimal(0.6);

    std::vector<Factor<Decimal>> factors = defaultGrowthFactors<Decimal>();
  };

  template <class Decimal>
  std::vector<std::string> requiredIndicators (const GrowthStrategy<Decimal>& s)
  {
    std::vector<std::string> names = { IndicatorNames::Price, "ma20", "ma60",
				       "momentum_20d", "momentum_60d",
				       IndicatorNames::Rsi, IndicatorNames::VolumeRatio,
				       IndicatorNames::PricePosition,
				       IndicatorNames::MacdHistogram,
				       IndicatorNames::Volatility };
    for (const auto& f : s.factors)
      if (std::find (names.begin(), names.end(), f.indicator) == names.end())
	names.push_back (f.indicator);

    return names;
  }

  template <class Decimal>
  bool qualifies (const GrowthStrategy<Decimal>& s, const IndicatorSnapshot<Decimal>& snapshot)
  {
    if (!hasAllIndicators (snapshot, requiredIndicators (s)))
      return false;

    auto v = [&snapshot](const std::string& name) { return indicatorValue (snapshot, name); };

    return
      v("momentum_20d") >= s.minMomentum20d &&
      v("momentum_60d") >= s.minMomentum60d &&
      inClosedRange (v(IndicatorNames::Rsi), s.minRsi, s.maxRsi) &&
      v(IndicatorNames::VolumeRatio) >= s.minVolumeRatio &&
      v(IndicatorNames::PricePosition) >= s.minPricePosition &&
      v(IndicatorNames::Price) > v("ma20") &&
      v("ma20") > v("ma60") &&
      v(IndicatorNames::MacdHistogram) > Decimal(0) &&
      v(IndicatorNames::Volatility) <= s.maxVolatility;
  }

  template <class Decimal>
  Decimal score (const GrowthStrategy<Decimal>& s, const IndicatorSnapshot<Decimal>& snapshot)
  {
    return compositeScore (s.factors, snapshot);
  }

  template <class Decimal>
  std::string describe (const GrowthStrategy<Decimal>& s)
  {
    std::ostringstream os;
    os << s.name << " strategy: buy instruments with accelerating, volume backed trends" << std::endl
       << "Qualification:" << std::endl
       << "  1. 20 day momentum >= " << formatPercent (s.minMomentum20d)
       << ", 60 day momentum >= " << formatPercent (s.minMomentum60d) << std::endl
       << "  2. RSI between " << num::toString (s.minRsi, 0) << " and " << num::toString (s.maxRsi, 0) << std::endl
       << "  3. volume ratio >= " << num::toString (s.minVolumeRatio, 2) << std::endl
       << "  4. price position >= " << num::toString (s.minPricePosition, 2) << std::endl
       << "  5. price > ma20 > ma60 with a positive MACD histogram" << std::endl
       << "  6. volatility <= " << formatPercent (s.maxVolatility) << std::endl;
    describeFactors (os, s.factors);
    os << "Minimum score: " << num::toString (s.minScore, 2) << std::endl;
    return os.str();
  }
}

#endif
