// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_VALUE_STRATEGY_H
#define __REBALANCER_VALUE_STRATEGY_H 1

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>
#include "StrategySupport.h"
#include "IndicatorSnapshot.h"

namespace rebalancer
{
  /**
   * @brief Buys instruments trading low in their recent range while the long
   *        term trend is intact.
   */
  template <class Decimal>
  struct ValueStrategy
  {
    std::string name = "Value";
    Decimal minScore = Decimal(0);

    Decimal minPricePosition = Decimal(0.1);
    Decimal maxPricePosition = Decimal(0.6);
    Decimal maxRsi = Decimal(70);
    Decimal minBollingerPosition = Decimal(0.1);
    Decimal maxBollingerPosition = Decimal(0.5);
    Decimal maxVolatility = Decimal(0.4);
    Decimal minVolumeRatio = Decimal(0.3);

    Decimal pricePositionWeight = Decimal(30);
    Decimal bollingerPositionWeight = Decimal(20);
    Decimal rsiCap = Decimal(70);
    Decimal rsiWeight = Decimal(0.5);
    Decimal volatilityWeight = Decimal(10);
    Decimal longTrendWeight = Decimal(15);
    Decimal volumeRatioWeight = Decimal(10);
  };

  template <class Decimal>
  std::vector<std::string> requiredIndicators (const ValueStrategy<Decimal>&)
  {
    return { IndicatorNames::Price, "ma60", IndicatorNames::PricePosition,
	     IndicatorNames::Rsi, IndicatorNames::BollingerPosition,
	     IndicatorNames::Volatility, IndicatorNames::VolumeRatio };
  }

  template <class Decimal>
  bool qualifies (const ValueStrategy<Decimal>& s, const IndicatorSnapshot<Decimal>& snapshot)
  {
    if (!hasAllIndicators (snapshot, requiredIndicators (s)))
      return false;

    auto v = [&snapshot](const std::string& name) { return indicatorValue (snapshot, name); };

    return
      inClosedRange (v(IndicatorNames::PricePosition), s.minPricePosition, s.maxPricePosition) &&
      v(IndicatorNames::Rsi) <= s.maxRsi &&
      inClosedRange (v(IndicatorNames::BollingerPosition), s.minBollingerPosition, s.maxBollingerPosition) &&
      v(IndicatorNames::Price) > v("ma60") &&
      v(IndicatorNames::Volatility) <= s.maxVolatility &&
      v(IndicatorNames::VolumeRatio) > s.minVolumeRatio;
  }

  template <class Decimal>
  Decimal score (const ValueStrategy<Decimal>& s, const IndicatorSnapshot<Decimal>& snapshot)
  {
    auto v = [&snapshot](const std::string& name) { return indicatorValue (snapshot, name); };
    const Decimal one(1);

    return
      (one - v(IndicatorNames::PricePosition)) * s.pricePositionWeight +
      (one - v(IndicatorNames::BollingerPosition)) * s.bollingerPositionWeight +
      std::max (Decimal(0), Decimal(s.rsiCap - v(IndicatorNames::Rsi))) * s.rsiWeight +
      (one - v(IndicatorNames::Volatility)) * s.volatilityWeight +
      (v(IndicatorNames::Price) / v("ma60") - one) * s.longTrendWeight +
      v(IndicatorNames::VolumeRatio) * s.volumeRatioWeight;
  }

  template <class Decimal>
  std::string describe (const ValueStrategy<Decimal>& s)
  {
    std::ostringstream os;
    os << s.name << " strategy: buy instruments that are cheap within their recent range" << std::endl
       << "Qualification:" << std::endl
       << "  1. price position between " << num::toString (s.minPricePosition, 2)
       << " and " << num::toString (s.maxPricePosition, 2) << std::endl
       << "  2. RSI <= " << num::toString (s.maxRsi, 0) << std::endl
       << "  3. Bollinger position between " << num::toString (s.minBollingerPosition, 2)
       << " and " << num::toString (s.maxBollingerPosition, 2) << std::endl
       << "  4. price > ma60" << std::endl
       << "  5. volatility <= " << formatPercent (s.maxVolatility) << std::endl
       << "  6. volume ratio > " << num::toString (s.minVolumeRatio, 2) << std::endl
       << "Score weights:" << std::endl
       << "  low price position: " << num::toString (s.pricePositionWeight, 1) << std::endl
       << "  low Bollinger position: " << num::toString (s.bollingerPositionWeight, 1) << std::endl
       << "  RSI below " << num::toString (s.rsiCap, 0) << ": " << num::toString (s.rsiWeight, 2) << std::endl
       << "  low volatility: " << num::toString (s.volatilityWeight, 1) << std::endl
       << "  strength vs ma60: " << num::toString (s.longTrendWeight, 1) << std::endl
       << "  volume ratio: " << num::toString (s.volumeRatioWeight, 1) << std::endl
       << "Minimum score: " << num::toString (s.minScore, 2) << std::endl;
    return os.str();
  }
}

#endif
