// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __REBALANCER_MOMENTUM_STRATEGY_H
#define __REBALANCER_MOMENTUM_STRATEGY_H 1

#include <cmath>
#include <sstream>
#include <string>
#include <vector>
#include "StrategySupport.h"
#include "IndicatorSnapshot.h"

namespace rebalancer
{
  /**
   * @brief Trend following selection.
   *
   * Qualifies instruments trading above stacked moving averages with a
   * confirming MACD, a moderate RSI and reasonable volatility and volume.
   * The score rewards recent momentum, strength relative to ma20, an RSI
   * near 50, a positive MACD histogram and a high price position.
   */
  template <class Decimal>
  struct MomentumStrategy
  {
    std::string name = "Momentum";
    Decimal minScore = Decimal(0);

    // Qualification thresholds
    Decimal minRsi = Decimal(20);
    Decimal maxRsi = Decimal(75);
    Decimal minMomentum5d = Decimal(-0.05);
    Decimal minMomentum20d = Decimal(-0.15);
    Decimal maxVolatility = Decimal(0.5);
    Decimal minVolumeRatio = Decimal(0.5);
    Decimal minPricePosition = Decimal(0.3);
    Decimal minBollingerPosition = Decimal(0.2);
    Decimal maxBollingerPosition = Decimal(0.8);

    // Score weights
    Decimal momentum5dWeight = Decimal(20);
    Decimal momentum10dWeight = Decimal(15);
    Decimal momentum20dWeight = Decimal(5);
    Decimal relativeStrengthWeight = Decimal(25);
    Decimal rsiWeight = Decimal(0.3);
    Decimal rsiBase = Decimal(80);
    Decimal rsiCenter = Decimal(50);
    Decimal macdHistogramWeight = Decimal(100);
    Decimal pricePositionWeight = Decimal(10);
  };

  template <class Decimal>
  std::vector<std::string> requiredIndicators (const MomentumStrategy<Decimal>&)
  {
    return { IndicatorNames::Price, "ma5", "ma10", "ma20", "ma60",
	     IndicatorNames::Rsi, "momentum_5d", "momentum_10d", "momentum_20d",
	     IndicatorNames::Macd, IndicatorNames::MacdSignal, IndicatorNames::MacdHistogram,
	     IndicatorNames::BollingerPosition, IndicatorNames::Volatility,
	     IndicatorNames::VolumeRatio, IndicatorNames::PricePosition };
  }

  template <class Decimal>
  bool qualifies (const MomentumStrategy<Decimal>& s, const IndicatorSnapshot<Decimal>& snapshot)
  {
    if (!hasAllIndicators (snapshot, requiredIndicators (s)))
      return false;

    auto v = [&snapshot](const std::string& name) { return indicatorValue (snapshot, name); };

    return
      // Trend
      v(IndicatorNames::Price) > v("ma20") &&
      v("ma5") > v("ma10") &&
      v("ma10") > v("ma20") &&
      v("ma20") > v("ma60") &&
      // RSI
      inClosedRange (v(IndicatorNames::Rsi), s.minRsi, s.maxRsi) &&
      // Momentum
      v("momentum_5d") > s.minMomentum5d &&
      v("momentum_20d") > s.minMomentum20d &&
      // MACD
      v(IndicatorNames::Macd) > v(IndicatorNames::MacdSignal) &&
      v(IndicatorNames::MacdHistogram) > Decimal(0) &&
      // Bollinger position
      inClosedRange (v(IndicatorNames::BollingerPosition), s.minBollingerPosition, s.maxBollingerPosition) &&
      // Volatility and volume
      v(IndicatorNames::Volatility) < s.maxVolatility &&
      v(IndicatorNames::VolumeRatio) > s.minVolumeRatio &&
      v(IndicatorNames::PricePosition) > s.minPricePosition;
  }

  template <class Decimal>
  Decimal score (const MomentumStrategy<Decimal>& s, const IndicatorSnapshot<Decimal>& snapshot)
  {
    auto v = [&snapshot](const std::string& name) { return indicatorValue (snapshot, name); };

    return
      v("momentum_5d") * s.momentum5dWeight +
      v("momentum_10d") * s.momentum10dWeight +
      v("momentum_20d") * s.momentum20dWeight +
      (v(IndicatorNames::Price) / v("ma20") - Decimal(1)) * s.relativeStrengthWeight +
      (s.rsiBase - num::abs (v(IndicatorNames::Rsi) - s.rsiCenter)) * s.rsiWeight +
      v(IndicatorNames::MacdHistogram) * s.macdHistogramWeight +
      v(IndicatorNames::PricePosition) * s.pricePositionWeight;
  }

  template <class Decimal>
  std::string describe (const MomentumStrategy<Decimal>& s)
  {
    std::ostringstream os;
    os << s.name << " strategy: follow instruments with strong upward momentum" << std::endl
       << "Qualification:" << std::endl
       << "  1. price > ma20, ma5 > ma10 > ma20 > ma60" << std::endl
       << "  2. RSI between " << num::toString (s.minRsi, 0) << " and " << num::toString (s.maxRsi, 0) << std::endl
       << "  3. 5 day momentum > " << formatPercent (s.minMomentum5d)
       << ", 20 day momentum > " << formatPercent (s.minMomentum20d) << std::endl
       << "  4. MACD above signal with a positive histogram" << std::endl
       << "  5. Bollinger position between " << num::toString (s.minBollingerPosition, 2)
       << " and " << num::toString (s.maxBollingerPosition, 2) << std::endl
       << "  6. volatility < " << formatPercent (s.maxVolatility) << std::endl
       << "  7. volume ratio > " << num::toString (s.minVolumeRatio, 2) << std::endl
       << "  8. price position > " << num::toString (s.minPricePosition, 2) << std::endl
       << "Score weights:" << std::endl
       << "  momentum 5d/10d/20d: " << num::toString (s.momentum5dWeight, 1) << "/"
       << num::toString (s.momentum10dWeight, 1) << "/" << num::toString (s.momentum20dWeight, 1) << std::endl
       << "  strength vs ma20: " << num::toString (s.relativeStrengthWeight, 1) << std::endl
       << "  RSI closeness to " << num::toString (s.rsiCenter, 0) << ": " << num::toString (s.rsiWeight, 2) << std::endl
       << "  MACD histogram: " << num::toString (s.macdHistogramWeight, 1) << std::endl
       << "  price position: " << num::toString (s.pricePositionWeight, 1) << std::endl
       << "Minimum score: " << num::toString (s.minScore, 2) << std::endl;
    return os.str();
  }
}

#endif
